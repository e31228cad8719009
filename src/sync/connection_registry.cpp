#include "connection_registry.hpp"

#include <QtCore/QMutexLocker>

namespace vms::sync {

bool ConnectionRegistry::insert(const model::Connection &connection, quint64 generation) {
    QMutexLocker locker(&mutex_);
    if (entries_.contains(connection.host)) {
        return false;
    }
    Entry entry;
    entry.connection = connection;
    entry.generation = generation;
    entries_.insert(connection.host, entry);
    return true;
}

bool ConnectionRegistry::update(const model::Connection &connection) {
    QMutexLocker locker(&mutex_);
    auto it = entries_.find(connection.host);
    if (it == entries_.end()) {
        return false;
    }
    it->connection = connection;
    return true;
}

bool ConnectionRegistry::update(const model::Connection &connection, const model::Snapshot &snapshot) {
    QMutexLocker locker(&mutex_);
    auto it = entries_.find(connection.host);
    if (it == entries_.end()) {
        return false;
    }
    it->connection = connection;
    it->snapshot = snapshot;
    return true;
}

bool ConnectionRegistry::remove(const QString &host) {
    QMutexLocker locker(&mutex_);
    return entries_.remove(host) > 0;
}

std::optional<model::Connection> ConnectionRegistry::get(const QString &host) const {
    QMutexLocker locker(&mutex_);
    auto it = entries_.constFind(host);
    if (it == entries_.constEnd()) {
        return std::nullopt;
    }
    return it->connection;
}

std::optional<ConnectionRegistry::Entry> ConnectionRegistry::entry(const QString &host) const {
    QMutexLocker locker(&mutex_);
    auto it = entries_.constFind(host);
    if (it == entries_.constEnd()) {
        return std::nullopt;
    }
    return *it;
}

bool ConnectionRegistry::contains(const QString &host) const {
    QMutexLocker locker(&mutex_);
    return entries_.contains(host);
}

QVector<model::Connection> ConnectionRegistry::list() const {
    QMutexLocker locker(&mutex_);
    QVector<model::Connection> result;
    result.reserve(entries_.size());
    for (const auto &entry : entries_) {
        result.push_back(entry.connection);
    }
    return result;
}

int ConnectionRegistry::size() const {
    QMutexLocker locker(&mutex_);
    return static_cast<int>(entries_.size());
}

model::AutoRefreshConfig ConnectionRegistry::autoRefresh(const QString &host) const {
    QMutexLocker locker(&mutex_);
    return autoRefresh_.value(host, model::AutoRefreshConfig{});
}

bool ConnectionRegistry::hasAutoRefresh(const QString &host) const {
    QMutexLocker locker(&mutex_);
    return autoRefresh_.contains(host);
}

void ConnectionRegistry::setAutoRefresh(const QString &host, const model::AutoRefreshConfig &config) {
    QMutexLocker locker(&mutex_);
    autoRefresh_.insert(host, config);
}

QMap<QString, model::AutoRefreshConfig> ConnectionRegistry::autoRefreshConfigs() const {
    QMutexLocker locker(&mutex_);
    return autoRefresh_;
}

std::optional<QString> ConnectionRegistry::label(const QString &host) const {
    QMutexLocker locker(&mutex_);
    auto it = labels_.constFind(host);
    if (it == labels_.constEnd()) {
        return std::nullopt;
    }
    return *it;
}

void ConnectionRegistry::setLabel(const QString &host, const QString &label) {
    QMutexLocker locker(&mutex_);
    labels_.insert(host, label);
    auto it = entries_.find(host);
    if (it != entries_.end()) {
        it->connection.label = label;
    }
}

QMap<QString, QString> ConnectionRegistry::labels() const {
    QMutexLocker locker(&mutex_);
    return labels_;
}

}  // namespace vms::sync
