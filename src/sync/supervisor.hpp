#pragma once

#include "common/app_config.hpp"
#include "connection_registry.hpp"
#include "event_bus.hpp"
#include "host_task.hpp"
#include "polling_scheduler.hpp"
#include "state_reconciler.hpp"
#include "transport/transport_client.hpp"

#include <QtCore/QHash>
#include <QtCore/QList>
#include <QtCore/QMap>
#include <QtCore/QMutex>
#include <QtCore/QObject>
#include <QtCore/QPointer>
#include <QtCore/QSet>
#include <QtCore/QThread>

#include <atomic>
#include <memory>
#include <optional>

namespace vms::sync {

struct SyncError {
    enum class Code {
        None,
        ConnectFailed,
        InvalidAddress,
        NotConnected,
        CommandFailed,
        Timeout,
    };

    Code code = Code::None;
    QString message;
};

QString to_string(SyncError::Code code);

// Owns every host connection: transports, workers, polling and reconciliation. Command
// methods block and may be called from any thread except a host worker's own.
class Supervisor : public QObject, public FetchSink {
    Q_OBJECT

public:
    explicit Supervisor(std::shared_ptr<transport::TransportFactory> factory = nullptr,
                        std::shared_ptr<Clock> clock = nullptr, QObject *parent = nullptr);
    ~Supervisor() override;

    EventBus *events() const { return events_; }
    PollingScheduler *scheduler() const { return scheduler_; }
    const ConnectionRegistry &registry() const { return registry_; }

    std::optional<model::Connection> connectHost(const QString &host, std::optional<quint16> port,
                                                 model::TransportKind kind, SyncError *error = nullptr);
    bool disconnectHost(const QString &host, SyncError *error = nullptr);
    void shutdown();

    QVector<model::Connection> statuses() const;
    std::optional<model::Connection> status(const QString &host) const;

    std::optional<model::InputList> inputs(const QString &host, SyncError *error = nullptr);
    std::optional<model::VideoLists> videoLists(const QString &host, SyncError *error = nullptr);
    bool refresh(const QString &host, SyncError *error = nullptr);

    bool sendFunction(const QString &host, const QString &function, const protocol::FunctionParams &params,
                      SyncError *error = nullptr);
    bool selectVideoListItem(const QString &host, int inputNumber, int itemIndex, SyncError *error = nullptr);

    model::AutoRefreshConfig autoRefreshConfig(const QString &host) const;
    void setAutoRefreshConfig(const QString &host, const model::AutoRefreshConfig &config);
    QMap<QString, model::AutoRefreshConfig> autoRefreshConfigs() const;

    void setConnectionLabel(const QString &host, const QString &label);
    QMap<QString, QString> connectionLabels() const;

    common::AppConfig exportConfig() const;
    void restore(const common::AppConfig &config);

    bool isPendingRemoval(const QString &host) const;
    // Hosts with a live command gate: connected hosts plus commands under way.
    int commandGateCount() const;

    quint64 beginFetch(const QString &host, quint64 generation) override;
    void fetchSucceeded(const QString &host, quint64 generation, quint64 sequence, const protocol::VmixState &state,
                        bool forced, bool scheduled) override;
    void fetchFailed(const QString &host, quint64 generation, const transport::TransportError &error,
                     bool scheduled) override;

private slots:
    void dispatchScheduled(const QString &host);

private:
    struct HostRuntime {
        QString host;
        quint16 port = 0;
        model::TransportKind kind = model::TransportKind::Http;
        quint64 generation = 0;
        std::shared_ptr<transport::TransportClient> transport;
        QThread *thread = nullptr;
        HostTask *task = nullptr;
        std::atomic<quint64> sequence{0};
        std::atomic<bool> forceNext{false};
        // Serialises reconcile + emit for the host; never held across I/O.
        QMutex ingestMutex;
        // Guarded by ingestMutex. Pushes before the first snapshot is cached are only noted.
        bool live = false;
        bool pushedWhileConnecting = false;
    };
    using RuntimePtr = std::shared_ptr<HostRuntime>;

    RuntimePtr runtime(const QString &host) const;
    std::optional<model::Connection> connectLocked(const QString &host, quint16 port, model::TransportKind kind,
                                                   SyncError *error);
    std::shared_ptr<QMutex> commandGate(const QString &host);
    void releaseGate(const QString &host, const std::shared_ptr<QMutex> &gate);
    transport::PushHandlers pushHandlersFor(const RuntimePtr &runtime);
    void startTask(const RuntimePtr &runtime);
    bool stopTask(const RuntimePtr &runtime);
    void teardown(const RuntimePtr &runtime);
    std::optional<HostTask::Outcome> fetchThroughTask(const QString &host, SyncError *error);
    void ingest(const RuntimePtr &runtime, quint64 sequence, const protocol::VmixState &state, bool forced);
    void markLinkState(const RuntimePtr &runtime, model::ConnectionStatus status, const QString &reason);

    std::shared_ptr<transport::TransportFactory> factory_;
    EventBus *events_ = nullptr;
    PollingScheduler *scheduler_ = nullptr;
    StateReconciler reconciler_;
    ConnectionRegistry registry_;

    mutable QMutex mutex_;
    QHash<QString, RuntimePtr> runtimes_;
    QSet<QString> pendingRemoval_;
    QHash<QString, std::shared_ptr<QMutex>> gates_;
    QList<QPointer<QThread>> abandoned_;
    std::atomic<quint64> generations_{0};
};

}  // namespace vms::sync
