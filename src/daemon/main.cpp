#include "common/app_config.hpp"
#include "common/logger.hpp"
#include "console_controller.hpp"
#include "stdin_reader.hpp"
#include "sync/supervisor.hpp"

#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <QtCore/QStandardPaths>
#include <QtCore/QThread>

namespace {

const QString kCategory = QStringLiteral("daemon");

QString default_config_path() {
    return QDir(QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation))
        .filePath(QStringLiteral("config.json"));
}

QString default_log_path() {
    return QDir(QStandardPaths::writableLocation(QStandardPaths::AppDataLocation))
        .filePath(QStringLiteral("vmixsync.log"));
}

}  // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("vmixsyncd"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(vms::common::kConfigVersion));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Keeps vMix instances in sync and reports their state as JSON lines."));
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOption({QStringLiteral("c"), QStringLiteral("config")},
                                    QStringLiteral("Configuration file."), QStringLiteral("file"),
                                    default_config_path());
    QCommandLineOption levelOption({QStringLiteral("l"), QStringLiteral("log-level")},
                                   QStringLiteral("Minimum log level (debug, info, warn, error)."),
                                   QStringLiteral("level"));
    QCommandLineOption logFileOption(QStringLiteral("log-file"), QStringLiteral("Append log lines to this file."),
                                     QStringLiteral("file"));
    parser.addOption(configOption);
    parser.addOption(levelOption);
    parser.addOption(logFileOption);
    parser.process(app);

    vms::model::register_metatypes();
    vms::common::LogConsoleSink consoleSink;

    const QString configPath = parser.value(configOption);
    vms::common::AppConfig config;
    if (QFileInfo::exists(configPath)) {
        QString error;
        if (auto loaded = vms::common::load_config(configPath, &error)) {
            config = *loaded;
        } else {
            vms::common::log_warn(kCategory, QStringLiteral("Ignoring %1: %2").arg(configPath, error));
        }
    }

    const QString levelText = parser.isSet(levelOption) ? parser.value(levelOption) : config.logging.level;
    if (const auto level = vms::common::parse_level(levelText)) {
        vms::common::Logger::instance().setMinimumLevel(*level);
    } else {
        vms::common::log_warn(kCategory, QStringLiteral("Unknown log level '%1', using info").arg(levelText));
    }

    vms::common::LogFileSink fileSink;
    QString logPath;
    if (parser.isSet(logFileOption)) {
        logPath = parser.value(logFileOption);
    } else if (config.logging.saveToFile) {
        logPath = config.logging.filePath.isEmpty() ? default_log_path() : config.logging.filePath;
    }
    if (!logPath.isEmpty()) {
        QDir().mkpath(QFileInfo(logPath).absolutePath());
        QString error;
        if (!fileSink.open(logPath, &error)) {
            vms::common::log_warn(kCategory, QStringLiteral("Cannot write log file %1: %2").arg(logPath, error));
        }
    }

    vms::sync::Supervisor supervisor;
    ConsoleController controller(&supervisor, configPath, config);

    auto *readerThread = new QThread();
    readerThread->setObjectName(QStringLiteral("stdin"));
    auto *reader = new StdinReader();
    reader->moveToThread(readerThread);
    QObject::connect(readerThread, &QThread::started, reader, &StdinReader::start);
    QObject::connect(reader, &StdinReader::lineRead, &controller, &ConsoleController::handleLine);
    QObject::connect(reader, &StdinReader::finished, &app, &QCoreApplication::quit);
    QObject::connect(reader, &StdinReader::finished, readerThread, &QThread::quit);
    QObject::connect(readerThread, &QThread::finished, reader, &QObject::deleteLater);
    QObject::connect(&controller, &ConsoleController::quitRequested, &app, &QCoreApplication::quit);

    vms::common::log_info(kCategory, QStringLiteral("vmixsyncd %1 using %2")
                                         .arg(QCoreApplication::applicationVersion(), configPath));
    controller.restoreConnections();
    readerThread->start();

    const int code = app.exec();

    controller.shutdown();
    supervisor.shutdown();

    readerThread->requestInterruption();
    readerThread->quit();
    // A reader still blocked on stdin is left to process exit.
    if (readerThread->wait(1000)) {
        delete readerThread;
    }
    vms::common::log_info(kCategory, QStringLiteral("Stopped"));
    return code;
}
