#pragma once

#include "common/model.hpp"

#include <QtCore/QByteArray>
#include <QtCore/QString>
#include <QtCore/QVector>

#include <optional>

namespace vms::common {

constexpr char kConfigVersion[] = "2.2.0";

struct ConnectionConfig {
    QString host;
    quint16 port = model::kDefaultHttpPort;
    QString label;
    model::TransportKind transportKind = model::TransportKind::Http;
    model::AutoRefreshConfig autoRefresh;
};

struct LoggingConfig {
    QString level = QStringLiteral("info");
    bool saveToFile = false;
    QString filePath;
};

struct AppConfig {
    QString version = QString::fromLatin1(kConfigVersion);
    QVector<ConnectionConfig> connections;
    LoggingConfig logging;
};

// Unparseable versions count as older.
bool version_older_than(const QString &version, const QString &target);

// Parses and migrates: documents older than kConfigVersion store refresh durations in seconds.
std::optional<AppConfig> parse_config(const QByteArray &json, QString *error = nullptr);
QByteArray serialize_config(const AppConfig &config);

std::optional<AppConfig> load_config(const QString &path, QString *error = nullptr);
bool save_config(const QString &path, const AppConfig &config, QString *error = nullptr);

}  // namespace vms::common
