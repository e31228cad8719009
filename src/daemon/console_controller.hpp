#pragma once

#include "common/app_config.hpp"
#include "sync/supervisor.hpp"

#include <QtCore/QJsonObject>
#include <QtCore/QMutex>
#include <QtCore/QObject>
#include <QtCore/QStringList>

// Line-oriented front end: runs commands against the supervisor on the global thread pool
// and prints results and events as JSON lines on stdout.
class ConsoleController : public QObject {
    Q_OBJECT

public:
    ConsoleController(vms::sync::Supervisor *supervisor, QString configPath, vms::common::AppConfig config,
                      QObject *parent = nullptr);

    void restoreConnections();
    bool saveConfig(QString *error = nullptr);
    // Waits for running commands, then writes the configuration.
    void shutdown();

    // Runs one command on the calling thread and returns its result object.
    QJsonObject execute(const QString &command, const QStringList &args);

public slots:
    void handleLine(const QString &line);

signals:
    void quitRequested();

private slots:
    void onStatusUpdated(const vms::model::Connection &connection);
    void onInputsUpdated(const QString &host, const vms::model::InputList &inputs);
    void onVideoListsUpdated(const QString &host, const vms::model::VideoLists &videoLists);
    void onConnectionRemoved(const QString &host);

private:
    QJsonObject runConnect(const QStringList &args);
    QJsonObject runSend(const QStringList &args);
    QJsonObject runSelect(const QStringList &args);
    QJsonObject runAuto(const QStringList &args);
    vms::common::AppConfig currentConfig() const;
    void rememberConnection(const vms::model::Connection &connection);
    void forgetConnection(const QString &host);
    void print(const QJsonObject &object);

    vms::sync::Supervisor *supervisor_ = nullptr;
    QString configPath_;
    mutable QMutex configMutex_;
    vms::common::AppConfig config_;
    QMutex outputMutex_;
};
