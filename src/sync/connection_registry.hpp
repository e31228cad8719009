#pragma once

#include "common/model.hpp"

#include <QtCore/QMap>
#include <QtCore/QMutex>
#include <QtCore/QString>
#include <QtCore/QVector>

#include <optional>

namespace vms::sync {

// Authoritative host -> connection map plus the auto-refresh configs and labels, which
// live independently of any connection. Plain data, never performs I/O.
class ConnectionRegistry {
public:
    struct Entry {
        model::Connection connection;
        std::optional<model::Snapshot> snapshot;
        quint64 generation = 0;
    };

    bool insert(const model::Connection &connection, quint64 generation);
    // Replaces the record of an existing host; a missing host is never re-created.
    bool update(const model::Connection &connection);
    bool update(const model::Connection &connection, const model::Snapshot &snapshot);
    bool remove(const QString &host);

    std::optional<model::Connection> get(const QString &host) const;
    std::optional<Entry> entry(const QString &host) const;
    bool contains(const QString &host) const;
    QVector<model::Connection> list() const;
    int size() const;

    model::AutoRefreshConfig autoRefresh(const QString &host) const;
    bool hasAutoRefresh(const QString &host) const;
    void setAutoRefresh(const QString &host, const model::AutoRefreshConfig &config);
    QMap<QString, model::AutoRefreshConfig> autoRefreshConfigs() const;

    std::optional<QString> label(const QString &host) const;
    void setLabel(const QString &host, const QString &label);
    QMap<QString, QString> labels() const;

private:
    mutable QMutex mutex_;
    QMap<QString, Entry> entries_;
    QMap<QString, model::AutoRefreshConfig> autoRefresh_;
    QMap<QString, QString> labels_;
};

}  // namespace vms::sync
