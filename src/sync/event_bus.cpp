#include "event_bus.hpp"

#include "common/logger.hpp"

namespace vms::sync {

namespace {

const QString kCategory = QStringLiteral("events");

}  // namespace

EventBus::EventBus(QObject *parent) : QObject(parent) {
    model::register_metatypes();
}

void EventBus::publishStatus(const model::Connection &connection) {
    common::log_debug(kCategory, QStringLiteral("status-updated %1 (%2)")
                                     .arg(connection.host, model::to_string(connection.status)));
    emit statusUpdated(connection);
}

void EventBus::publishInputs(const QString &host, const model::InputList &inputs) {
    common::log_debug(kCategory, QStringLiteral("inputs-updated %1 (%2 inputs)").arg(host).arg(inputs.size()));
    emit inputsUpdated(host, inputs);
}

void EventBus::publishVideoLists(const QString &host, const model::VideoLists &videoLists) {
    common::log_debug(kCategory, QStringLiteral("videolists-updated %1 (%2 lists)").arg(host).arg(videoLists.size()));
    emit videoListsUpdated(host, videoLists);
}

void EventBus::publishRemoved(const QString &host) {
    common::log_debug(kCategory, QStringLiteral("connection-removed %1").arg(host));
    emit connectionRemoved(host);
}

}  // namespace vms::sync
