#include "app_config.hpp"

#include "common/logger.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>
#include <QtCore/QSaveFile>
#include <QtCore/QVersionNumber>

namespace vms::common {

namespace {

const QString kCategory = QStringLiteral("config");

quint32 milliseconds_to_interval(qint64 milliseconds) {
    if (milliseconds <= 1000) {
        return 1;
    }
    return static_cast<quint32>((milliseconds + 999) / 1000);
}

ConnectionConfig read_connection(const QJsonObject &object, bool legacy) {
    ConnectionConfig connection;
    connection.host = object.value(QStringLiteral("host")).toString().trimmed();
    connection.transportKind = model::parse_transport_kind(object.value(QStringLiteral("connectionType")).toString())
                                   .value_or(model::TransportKind::Http);
    const int port = object.value(QStringLiteral("port")).toInt(0);
    connection.port = port > 0 && port <= 65535 ? static_cast<quint16>(port) : model::default_port(connection.transportKind);
    connection.label = object.value(QStringLiteral("label")).toString();
    if (connection.label.isEmpty()) {
        connection.label = model::default_label(connection.host, connection.transportKind);
    }

    const QJsonObject refresh = object.value(QStringLiteral("autoRefresh")).toObject();
    connection.autoRefresh.enabled = refresh.value(QStringLiteral("enabled")).toBool(true);
    const qint64 duration = refresh.value(QStringLiteral("duration")).toVariant().toLongLong();
    const QString unit = refresh.value(QStringLiteral("durationUnit")).toString();
    const bool inSeconds = unit == QLatin1String("seconds") || (unit.isEmpty() && legacy);
    if (duration <= 0) {
        connection.autoRefresh.intervalSeconds = model::kDefaultRefreshSeconds;
    } else if (inSeconds) {
        connection.autoRefresh.intervalSeconds = static_cast<quint32>(duration);
        if (legacy) {
            log_info(kCategory, QStringLiteral("Migrated %1 auto-refresh from %2s to %3ms")
                                    .arg(connection.host)
                                    .arg(duration)
                                    .arg(duration * 1000));
        }
    } else {
        connection.autoRefresh.intervalSeconds = milliseconds_to_interval(duration);
    }
    return connection;
}

}  // namespace

bool version_older_than(const QString &version, const QString &target) {
    qsizetype suffix = 0;
    const QVersionNumber current = QVersionNumber::fromString(version, &suffix);
    if (current.isNull() || suffix != version.size()) {
        log_warn(kCategory, QStringLiteral("Could not parse config version '%1', assuming it is older").arg(version));
        return true;
    }
    return current < QVersionNumber::fromString(target);
}

std::optional<AppConfig> parse_config(const QByteArray &json, QString *error) {
    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (error) {
            *error = parseError.errorString();
        }
        return std::nullopt;
    }
    if (!document.isObject()) {
        if (error) {
            *error = QStringLiteral("Config root must be an object");
        }
        return std::nullopt;
    }

    const QJsonObject root = document.object();
    const QString storedVersion = root.value(QStringLiteral("version")).toString();
    const QString current = QString::fromLatin1(kConfigVersion);
    bool legacy = false;
    if (storedVersion.isEmpty()) {
        log_info(kCategory, QStringLiteral("No version field found, treating config as legacy"));
        legacy = true;
    } else if (storedVersion != current) {
        if (version_older_than(storedVersion, current)) {
            log_info(kCategory, QStringLiteral("Migrating configuration from %1 to %2").arg(storedVersion, current));
            legacy = true;
        } else {
            log_warn(kCategory, QStringLiteral("Configuration version %1 is newer than %2, keeping as is").arg(storedVersion, current));
        }
    }

    AppConfig config;
    config.version = legacy ? current : storedVersion;
    for (const auto &value : root.value(QStringLiteral("connections")).toArray()) {
        ConnectionConfig connection = read_connection(value.toObject(), legacy);
        if (connection.host.isEmpty()) {
            log_warn(kCategory, QStringLiteral("Skipping connection entry without host"));
            continue;
        }
        config.connections.append(connection);
    }

    const QJsonObject logging = root.value(QStringLiteral("logging")).toObject();
    config.logging.level = logging.value(QStringLiteral("level")).toString(QStringLiteral("info"));
    config.logging.saveToFile = logging.value(QStringLiteral("saveToFile")).toBool(false);
    config.logging.filePath = logging.value(QStringLiteral("filePath")).toString();
    return config;
}

QByteArray serialize_config(const AppConfig &config) {
    QJsonArray connections;
    for (const auto &connection : config.connections) {
        QJsonObject refresh;
        refresh.insert(QStringLiteral("enabled"), connection.autoRefresh.enabled);
        refresh.insert(QStringLiteral("duration"), static_cast<qint64>(connection.autoRefresh.intervalSeconds) * 1000);
        refresh.insert(QStringLiteral("durationUnit"), QStringLiteral("milliseconds"));

        QJsonObject object;
        object.insert(QStringLiteral("host"), connection.host);
        object.insert(QStringLiteral("port"), connection.port);
        object.insert(QStringLiteral("label"), connection.label);
        object.insert(QStringLiteral("connectionType"), model::to_string(connection.transportKind));
        object.insert(QStringLiteral("autoRefresh"), refresh);
        connections.append(object);
    }

    QJsonObject logging;
    logging.insert(QStringLiteral("level"), config.logging.level);
    logging.insert(QStringLiteral("saveToFile"), config.logging.saveToFile);
    if (!config.logging.filePath.isEmpty()) {
        logging.insert(QStringLiteral("filePath"), config.logging.filePath);
    }

    QJsonObject root;
    root.insert(QStringLiteral("version"), config.version);
    root.insert(QStringLiteral("connections"), connections);
    root.insert(QStringLiteral("logging"), logging);
    return QJsonDocument(root).toJson(QJsonDocument::Indented);
}

std::optional<AppConfig> load_config(const QString &path, QString *error) {
    QFile file(path);
    if (!file.exists()) {
        if (error) {
            *error = QStringLiteral("Config file %1 does not exist").arg(path);
        }
        return std::nullopt;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        if (error) {
            *error = file.errorString();
        }
        return std::nullopt;
    }
    QString parseError;
    auto config = parse_config(file.readAll(), &parseError);
    if (!config) {
        if (error) {
            *error = QStringLiteral("%1: %2").arg(path, parseError);
        }
        return std::nullopt;
    }
    log_info(kCategory, QStringLiteral("Loaded %1 connection(s) from %2").arg(config->connections.size()).arg(path));
    return config;
}

bool save_config(const QString &path, const AppConfig &config, QString *error) {
    const QFileInfo info(path);
    if (!QDir().mkpath(info.absolutePath())) {
        if (error) {
            *error = QStringLiteral("Cannot create directory %1").arg(info.absolutePath());
        }
        return false;
    }
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        if (error) {
            *error = file.errorString();
        }
        return false;
    }
    file.write(serialize_config(config));
    if (!file.commit()) {
        if (error) {
            *error = file.errorString();
        }
        return false;
    }
    log_debug(kCategory, QStringLiteral("Saved %1 connection(s) to %2").arg(config.connections.size()).arg(path));
    return true;
}

}  // namespace vms::common
