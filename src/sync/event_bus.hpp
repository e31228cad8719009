#pragma once

#include "common/model.hpp"

#include <QtCore/QObject>
#include <QtCore/QString>

namespace vms::sync {

// Event surface of the sync layer. Emitted from host worker threads; subscribers on other
// threads receive queued, in per-host production order.
class EventBus : public QObject {
    Q_OBJECT

public:
    explicit EventBus(QObject *parent = nullptr);

    void publishStatus(const model::Connection &connection);
    void publishInputs(const QString &host, const model::InputList &inputs);
    void publishVideoLists(const QString &host, const model::VideoLists &videoLists);
    void publishRemoved(const QString &host);

signals:
    void statusUpdated(vms::model::Connection connection);
    void inputsUpdated(QString host, vms::model::InputList inputs);
    void videoListsUpdated(QString host, vms::model::VideoLists videoLists);
    void connectionRemoved(QString host);
};

}  // namespace vms::sync
