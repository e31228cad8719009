#include "console_controller.hpp"

#include "common/logger.hpp"

#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QMutexLocker>
#include <QtCore/QThreadPool>

#include <cstdio>

using vms::model::Connection;
using vms::sync::SyncError;

namespace {

const QString kCategory = QStringLiteral("daemon");
constexpr int kDrainTimeoutMs = 15000;

QJsonValue optional_text(const std::optional<QString> &value) {
    return value ? QJsonValue(*value) : QJsonValue(QJsonValue::Null);
}

QJsonObject to_json(const Connection &connection) {
    QJsonObject object;
    object.insert(QStringLiteral("host"), connection.host);
    object.insert(QStringLiteral("port"), connection.port);
    object.insert(QStringLiteral("label"), connection.label);
    object.insert(QStringLiteral("transportKind"), vms::model::to_string(connection.transportKind));
    object.insert(QStringLiteral("status"), vms::model::to_string(connection.status));
    object.insert(QStringLiteral("activeInput"), connection.activeInput);
    object.insert(QStringLiteral("previewInput"), connection.previewInput);
    object.insert(QStringLiteral("version"), connection.version);
    object.insert(QStringLiteral("edition"), connection.edition);
    object.insert(QStringLiteral("preset"), optional_text(connection.preset));
    object.insert(QStringLiteral("lastError"), optional_text(connection.lastError));
    return object;
}

QJsonArray to_json(const vms::model::InputList &inputs) {
    QJsonArray array;
    for (const auto &input : inputs) {
        QJsonObject object;
        object.insert(QStringLiteral("key"), input.key);
        object.insert(QStringLiteral("number"), input.number);
        object.insert(QStringLiteral("title"), input.title);
        object.insert(QStringLiteral("type"), input.type);
        object.insert(QStringLiteral("state"), input.state);
        array.append(object);
    }
    return array;
}

QJsonArray to_json(const vms::model::VideoLists &lists) {
    QJsonArray array;
    for (const auto &list : lists) {
        QJsonArray items;
        for (const auto &item : list.items) {
            QJsonObject object;
            object.insert(QStringLiteral("key"), item.key);
            object.insert(QStringLiteral("number"), item.number);
            object.insert(QStringLiteral("title"), item.title);
            object.insert(QStringLiteral("selected"), item.selected);
            object.insert(QStringLiteral("enabled"), item.enabled);
            items.append(object);
        }
        QJsonObject object;
        object.insert(QStringLiteral("key"), list.key);
        object.insert(QStringLiteral("number"), list.number);
        object.insert(QStringLiteral("title"), list.title);
        object.insert(QStringLiteral("state"), list.state);
        object.insert(QStringLiteral("items"), items);
        object.insert(QStringLiteral("selectedIndex"),
                      list.selectedIndex ? QJsonValue(*list.selectedIndex) : QJsonValue(QJsonValue::Null));
        array.append(object);
    }
    return array;
}

QJsonObject event(const QString &name) {
    QJsonObject object;
    object.insert(QStringLiteral("type"), QStringLiteral("event"));
    object.insert(QStringLiteral("event"), name);
    return object;
}

QJsonObject success(const QJsonValue &result = QJsonValue(QJsonValue::Undefined)) {
    QJsonObject object;
    object.insert(QStringLiteral("ok"), true);
    if (!result.isUndefined()) {
        object.insert(QStringLiteral("result"), result);
    }
    return object;
}

QJsonObject failure(const QString &code, const QString &message) {
    QJsonObject error;
    error.insert(QStringLiteral("code"), code);
    error.insert(QStringLiteral("message"), message);
    QJsonObject object;
    object.insert(QStringLiteral("ok"), false);
    object.insert(QStringLiteral("error"), error);
    return object;
}

QJsonObject failure(const SyncError &error) {
    return failure(vms::sync::to_string(error.code), error.message);
}

QJsonObject usage(const QString &text) {
    return failure(QStringLiteral("usage"), text);
}

}  // namespace

ConsoleController::ConsoleController(vms::sync::Supervisor *supervisor, QString configPath,
                                     vms::common::AppConfig config, QObject *parent)
    : QObject(parent), supervisor_(supervisor), configPath_(std::move(configPath)), config_(std::move(config)) {
    auto *events = supervisor_->events();
    connect(events, &vms::sync::EventBus::statusUpdated, this, &ConsoleController::onStatusUpdated);
    connect(events, &vms::sync::EventBus::inputsUpdated, this, &ConsoleController::onInputsUpdated);
    connect(events, &vms::sync::EventBus::videoListsUpdated, this, &ConsoleController::onVideoListsUpdated);
    connect(events, &vms::sync::EventBus::connectionRemoved, this, &ConsoleController::onConnectionRemoved);
}

void ConsoleController::restoreConnections() {
    const vms::common::AppConfig saved = currentConfig();
    QThreadPool::globalInstance()->start([this, saved]() {
        supervisor_->restore(saved);
        QJsonArray statuses;
        for (const auto &connection : supervisor_->statuses()) {
            statuses.append(to_json(connection));
        }
        QJsonObject result = success(statuses);
        result.insert(QStringLiteral("type"), QStringLiteral("result"));
        result.insert(QStringLiteral("command"), QStringLiteral("restore"));
        print(result);
    });
}

bool ConsoleController::saveConfig(QString *error) {
    const auto config = currentConfig();
    if (!vms::common::save_config(configPath_, config, error)) {
        return false;
    }
    vms::common::log_info(kCategory, QStringLiteral("Saved %1 connection(s) to %2")
                                         .arg(config.connections.size())
                                         .arg(configPath_));
    return true;
}

void ConsoleController::shutdown() {
    if (!QThreadPool::globalInstance()->waitForDone(kDrainTimeoutMs)) {
        vms::common::log_warn(kCategory, QStringLiteral("Commands still running at shutdown"));
    }
    QString error;
    if (!saveConfig(&error)) {
        vms::common::log_error(kCategory, QStringLiteral("Could not save %1: %2").arg(configPath_, error));
    }
}

void ConsoleController::handleLine(const QString &line) {
    QStringList tokens = line.split(QLatin1Char(' '), Qt::SkipEmptyParts);
    if (tokens.isEmpty()) {
        return;
    }
    const QString command = tokens.takeFirst().toLower();
    if (command == QLatin1String("quit")) {
        emit quitRequested();
        return;
    }
    QThreadPool::globalInstance()->start([this, command, tokens]() {
        QJsonObject result = execute(command, tokens);
        result.insert(QStringLiteral("type"), QStringLiteral("result"));
        result.insert(QStringLiteral("command"), command);
        print(result);
    });
}

QJsonObject ConsoleController::execute(const QString &command, const QStringList &args) {
    SyncError error;
    if (command == QLatin1String("connect")) {
        return runConnect(args);
    }
    if (command == QLatin1String("disconnect")) {
        if (args.size() != 1) {
            return usage(QStringLiteral("disconnect <host>"));
        }
        if (!supervisor_->disconnectHost(args.at(0), &error)) {
            return failure(error);
        }
        forgetConnection(args.at(0));
        return success();
    }
    if (command == QLatin1String("list")) {
        QJsonArray statuses;
        for (const auto &connection : supervisor_->statuses()) {
            statuses.append(to_json(connection));
        }
        return success(statuses);
    }
    if (command == QLatin1String("inputs")) {
        if (args.size() != 1) {
            return usage(QStringLiteral("inputs <host>"));
        }
        const auto inputs = supervisor_->inputs(args.at(0), &error);
        return inputs ? success(to_json(*inputs)) : failure(error);
    }
    if (command == QLatin1String("lists")) {
        if (args.size() != 1) {
            return usage(QStringLiteral("lists <host>"));
        }
        const auto lists = supervisor_->videoLists(args.at(0), &error);
        return lists ? success(to_json(*lists)) : failure(error);
    }
    if (command == QLatin1String("send")) {
        return runSend(args);
    }
    if (command == QLatin1String("select")) {
        return runSelect(args);
    }
    if (command == QLatin1String("refresh")) {
        if (args.size() != 1) {
            return usage(QStringLiteral("refresh <host>"));
        }
        return supervisor_->refresh(args.at(0), &error) ? success() : failure(error);
    }
    if (command == QLatin1String("auto")) {
        return runAuto(args);
    }
    if (command == QLatin1String("label")) {
        if (args.size() < 2) {
            return usage(QStringLiteral("label <host> <text>"));
        }
        supervisor_->setConnectionLabel(args.at(0), args.mid(1).join(QLatin1Char(' ')));
        return success();
    }
    if (command == QLatin1String("save")) {
        QString reason;
        if (!saveConfig(&reason)) {
            return failure(QStringLiteral("io"), reason);
        }
        return success(configPath_);
    }
    return failure(QStringLiteral("unknown-command"), QStringLiteral("Unknown command '%1'").arg(command));
}

QJsonObject ConsoleController::runConnect(const QStringList &args) {
    if (args.isEmpty() || args.size() > 3) {
        return usage(QStringLiteral("connect <host> [port] [http|tcp]"));
    }
    std::optional<quint16> port;
    auto kind = vms::model::TransportKind::Http;
    for (const QString &arg : args.mid(1)) {
        bool ok = false;
        const uint value = arg.toUInt(&ok);
        if (ok && value > 0 && value <= 65535) {
            port = static_cast<quint16>(value);
        } else if (const auto parsed = vms::model::parse_transport_kind(arg)) {
            kind = *parsed;
        } else {
            return usage(QStringLiteral("connect <host> [port] [http|tcp]"));
        }
    }
    SyncError error;
    const auto connection = supervisor_->connectHost(args.at(0), port, kind, &error);
    if (!connection) {
        return failure(error);
    }
    rememberConnection(*connection);
    return success(to_json(*connection));
}

QJsonObject ConsoleController::runSend(const QStringList &args) {
    if (args.size() < 2) {
        return usage(QStringLiteral("send <host> <function> [key=value ...]"));
    }
    vms::protocol::FunctionParams params;
    for (const QString &pair : args.mid(2)) {
        const int split = pair.indexOf(QLatin1Char('='));
        if (split <= 0) {
            return usage(QStringLiteral("parameters are key=value"));
        }
        params.insert(pair.left(split), pair.mid(split + 1));
    }
    SyncError error;
    if (!supervisor_->sendFunction(args.at(0), args.at(1), params, &error)) {
        return failure(error);
    }
    return success();
}

QJsonObject ConsoleController::runSelect(const QStringList &args) {
    bool inputOk = false;
    bool indexOk = false;
    const int input = args.size() == 3 ? args.at(1).toInt(&inputOk) : 0;
    const int index = args.size() == 3 ? args.at(2).toInt(&indexOk) : 0;
    if (!inputOk || !indexOk) {
        return usage(QStringLiteral("select <host> <input> <index>"));
    }
    SyncError error;
    if (!supervisor_->selectVideoListItem(args.at(0), input, index, &error)) {
        return failure(error);
    }
    return success();
}

QJsonObject ConsoleController::runAuto(const QStringList &args) {
    if (args.size() < 2 || args.size() > 3) {
        return usage(QStringLiteral("auto <host> <on|off> [seconds]"));
    }
    vms::model::AutoRefreshConfig config = supervisor_->autoRefreshConfig(args.at(0));
    const QString toggle = args.at(1).toLower();
    if (toggle == QLatin1String("on")) {
        config.enabled = true;
    } else if (toggle == QLatin1String("off")) {
        config.enabled = false;
    } else {
        return usage(QStringLiteral("auto <host> <on|off> [seconds]"));
    }
    if (args.size() == 3) {
        bool ok = false;
        const uint seconds = args.at(2).toUInt(&ok);
        if (!ok) {
            return usage(QStringLiteral("auto <host> <on|off> [seconds]"));
        }
        config.intervalSeconds = seconds;
    }
    supervisor_->setAutoRefreshConfig(args.at(0), config);
    const auto applied = supervisor_->autoRefreshConfig(args.at(0));
    QJsonObject result;
    result.insert(QStringLiteral("enabled"), applied.enabled);
    result.insert(QStringLiteral("duration"), static_cast<qint64>(applied.intervalSeconds));
    return success(result);
}

vms::common::AppConfig ConsoleController::currentConfig() const {
    vms::common::AppConfig config;
    {
        QMutexLocker locker(&configMutex_);
        config = config_;
    }
    const auto labels = supervisor_->connectionLabels();
    const auto refresh = supervisor_->autoRefreshConfigs();
    const auto live = supervisor_->statuses();
    for (auto &entry : config.connections) {
        for (const auto &connection : live) {
            if (connection.host == entry.host) {
                entry.port = connection.port;
                entry.transportKind = connection.transportKind;
            }
        }
        entry.label = labels.value(entry.host, entry.label);
        entry.autoRefresh = refresh.value(entry.host, entry.autoRefresh);
    }
    return config;
}

void ConsoleController::rememberConnection(const Connection &connection) {
    QMutexLocker locker(&configMutex_);
    for (auto &entry : config_.connections) {
        if (entry.host == connection.host) {
            entry.port = connection.port;
            entry.transportKind = connection.transportKind;
            entry.label = connection.label;
            return;
        }
    }
    vms::common::ConnectionConfig entry;
    entry.host = connection.host;
    entry.port = connection.port;
    entry.label = connection.label;
    entry.transportKind = connection.transportKind;
    config_.connections.push_back(entry);
}

void ConsoleController::forgetConnection(const QString &host) {
    QMutexLocker locker(&configMutex_);
    const QString trimmed = host.trimmed();
    for (int i = 0; i < config_.connections.size(); ++i) {
        if (config_.connections.at(i).host == trimmed) {
            config_.connections.removeAt(i);
            return;
        }
    }
}

void ConsoleController::onStatusUpdated(const Connection &connection) {
    QJsonObject object = event(QStringLiteral("status-updated"));
    object.insert(QStringLiteral("connection"), to_json(connection));
    print(object);
}

void ConsoleController::onInputsUpdated(const QString &host, const vms::model::InputList &inputs) {
    QJsonObject object = event(QStringLiteral("inputs-updated"));
    object.insert(QStringLiteral("host"), host);
    object.insert(QStringLiteral("inputs"), to_json(inputs));
    print(object);
}

void ConsoleController::onVideoListsUpdated(const QString &host, const vms::model::VideoLists &videoLists) {
    QJsonObject object = event(QStringLiteral("videolists-updated"));
    object.insert(QStringLiteral("host"), host);
    object.insert(QStringLiteral("videoLists"), to_json(videoLists));
    print(object);
}

void ConsoleController::onConnectionRemoved(const QString &host) {
    QJsonObject object = event(QStringLiteral("connection-removed"));
    object.insert(QStringLiteral("host"), host);
    print(object);
}

void ConsoleController::print(const QJsonObject &object) {
    const QByteArray line = QJsonDocument(object).toJson(QJsonDocument::Compact);
    QMutexLocker locker(&outputMutex_);
    std::fprintf(stdout, "%s\n", line.constData());
    std::fflush(stdout);
}
