#include "supervisor.hpp"

#include "common/logger.hpp"

#include <QtCore/QCoreApplication>
#include <QtCore/QMetaObject>
#include <QtCore/QMutexLocker>
#include <QtCore/QRegularExpression>

#include <chrono>

namespace vms::sync {

using model::ConnectionStatus;
using transport::TransportError;

namespace {

const QString kCategory = QStringLiteral("supervisor");

// A manual fetch may queue behind one that is already running.
constexpr int kFetchWaitMs = 2 * transport::kRequestTimeoutMs + 1000;

void set_error(SyncError *error, SyncError::Code code, const QString &message) {
    if (error) {
        error->code = code;
        error->message = message;
    }
}

SyncError::Code command_code(const TransportError &error) {
    switch (error.kind) {
        case TransportError::Kind::Timeout:
            return SyncError::Code::Timeout;
        case TransportError::Kind::Cancelled:
            return SyncError::Code::NotConnected;
        default:
            return SyncError::Code::CommandFailed;
    }
}

bool valid_host(const QString &host) {
    static const QRegularExpression pattern(QStringLiteral("^[A-Za-z0-9._:\\-\\[\\]]+$"));
    return !host.isEmpty() && pattern.match(host).hasMatch();
}

}  // namespace

QString to_string(SyncError::Code code) {
    switch (code) {
        case SyncError::Code::None:
            return QStringLiteral("none");
        case SyncError::Code::ConnectFailed:
            return QStringLiteral("connect-failed");
        case SyncError::Code::InvalidAddress:
            return QStringLiteral("invalid-address");
        case SyncError::Code::NotConnected:
            return QStringLiteral("not-connected");
        case SyncError::Code::CommandFailed:
            return QStringLiteral("command-failed");
        case SyncError::Code::Timeout:
            return QStringLiteral("timeout");
    }
    return QStringLiteral("none");
}

Supervisor::Supervisor(std::shared_ptr<transport::TransportFactory> factory, std::shared_ptr<Clock> clock,
                       QObject *parent)
    : QObject(parent),
      factory_(factory ? std::move(factory) : std::make_shared<transport::DefaultTransportFactory>()),
      events_(new EventBus(this)),
      scheduler_(new PollingScheduler(std::move(clock), this)) {
    model::register_metatypes();
    connect(scheduler_, &PollingScheduler::refreshDue, this, &Supervisor::dispatchScheduled);
    scheduler_->start();
}

Supervisor::~Supervisor() {
    shutdown();
}

std::optional<model::Connection> Supervisor::connectHost(const QString &rawHost, std::optional<quint16> port,
                                                         model::TransportKind kind, SyncError *error) {
    const QString host = rawHost.trimmed();
    if (!valid_host(host) || (port && *port == 0)) {
        set_error(error, SyncError::Code::InvalidAddress, QStringLiteral("Invalid address '%1'").arg(rawHost));
        return std::nullopt;
    }
    const quint16 effectivePort = port.value_or(model::default_port(kind));

    auto gate = commandGate(host);
    QMutexLocker gateLocker(gate.get());
    auto connection = connectLocked(host, effectivePort, kind, error);
    gateLocker.unlock();
    releaseGate(host, gate);
    return connection;
}

std::optional<model::Connection> Supervisor::connectLocked(const QString &host, quint16 effectivePort,
                                                           model::TransportKind kind, SyncError *error) {
    if (auto existing = runtime(host)) {
        const auto record = registry_.get(host);
        if (record && existing->port == effectivePort && existing->kind == kind &&
            record->status == ConnectionStatus::Connected) {
            common::log_debug(kCategory, QStringLiteral("%1 already connected").arg(host));
            return record;
        }
        common::log_info(kCategory, QStringLiteral("Reconnecting %1 with new parameters").arg(host));
        teardown(existing);
    }

    auto runtime = std::make_shared<HostRuntime>();
    runtime->host = host;
    runtime->port = effectivePort;
    runtime->kind = kind;
    runtime->generation = ++generations_;

    std::shared_ptr<transport::TransportClient> transport = factory_->create(kind, host, effectivePort);
    if (!transport) {
        set_error(error, SyncError::Code::ConnectFailed, QStringLiteral("No transport for %1").arg(model::to_string(kind)));
        return std::nullopt;
    }
    if (transport->pushes()) {
        transport->setPushHandlers(pushHandlersFor(runtime));
    }
    runtime->transport = transport;

    common::log_info(kCategory, QStringLiteral("Connecting to %1:%2 over %3")
                                    .arg(host)
                                    .arg(effectivePort)
                                    .arg(model::to_string(kind)));
    TransportError transportError;
    if (!transport->open(&transportError)) {
        common::log_warn(kCategory, QStringLiteral("Connect to %1 failed: %2").arg(host, transportError.message));
        set_error(error, SyncError::Code::ConnectFailed, transportError.message);
        return std::nullopt;
    }
    // Taken before the request so any push that lands during the handshake sorts after it.
    const quint64 handshakeSequence = runtime->sequence.fetch_add(1) + 1;
    auto state = transport->fetchState(&transportError);
    if (!state || state->status.version.trimmed().isEmpty()) {
        const QString reason = state ? QStringLiteral("Unsupported protocol version") : transportError.message;
        if (!transport->close()) {
            common::log_warn(kCategory, QStringLiteral("Transport for %1 did not close cleanly").arg(host));
        }
        common::log_warn(kCategory, QStringLiteral("Handshake with %1 failed: %2").arg(host, reason));
        set_error(error, SyncError::Code::ConnectFailed, reason);
        return std::nullopt;
    }

    model::Connection connection;
    connection.host = host;
    connection.port = effectivePort;
    connection.label = registry_.label(host).value_or(model::default_label(host, kind));
    connection.transportKind = kind;
    connection.status = ConnectionStatus::Connected;
    connection.activeInput = state->status.activeInput;
    connection.previewInput = state->status.previewInput;
    connection.version = state->status.version;
    connection.edition = state->status.edition;
    connection.preset = state->status.preset;

    {
        QMutexLocker locker(&mutex_);
        runtimes_.insert(host, runtime);
    }
    registry_.insert(connection, runtime->generation);
    startTask(runtime);
    if (kind == model::TransportKind::Http) {
        scheduler_->attach(host, registry_.autoRefresh(host));
    }
    ingest(runtime, handshakeSequence, *state, true);

    bool missedPush = false;
    {
        QMutexLocker ingestLocker(&runtime->ingestMutex);
        runtime->live = true;
        missedPush = runtime->pushedWhileConnecting;
        runtime->pushedWhileConnecting = false;
    }
    if (missedPush) {
        common::log_debug(kCategory, QStringLiteral("%1 changed during the handshake, fetching again").arg(host));
        QMutexLocker locker(&mutex_);
        if (runtime->task) {
            QMetaObject::invokeMethod(runtime->task, &HostTask::backgroundFetch, Qt::QueuedConnection);
        }
    }

    common::log_info(kCategory, QStringLiteral("Connected to %1 (vMix %2 %3)")
                                    .arg(host, connection.version, connection.edition));
    return registry_.get(host);
}

bool Supervisor::disconnectHost(const QString &rawHost, SyncError *error) {
    const QString host = rawHost.trimmed();
    if (!runtime(host)) {
        set_error(error, SyncError::Code::NotConnected, QStringLiteral("%1 is not connected").arg(host));
        return false;
    }
    auto gate = commandGate(host);
    QMutexLocker gateLocker(gate.get());

    const RuntimePtr existing = runtime(host);
    if (existing) {
        teardown(existing);
        common::log_info(kCategory, QStringLiteral("Disconnected %1").arg(host));
    } else {
        set_error(error, SyncError::Code::NotConnected, QStringLiteral("%1 is not connected").arg(host));
    }
    gateLocker.unlock();
    releaseGate(host, gate);
    return existing != nullptr;
}

void Supervisor::shutdown() {
    scheduler_->stop();
    QList<RuntimePtr> all;
    {
        QMutexLocker locker(&mutex_);
        all = runtimes_.values();
    }
    for (const auto &entry : all) {
        auto gate = commandGate(entry->host);
        QMutexLocker gateLocker(gate.get());
        teardown(entry);
        gateLocker.unlock();
        releaseGate(entry->host, gate);
    }

    QList<QPointer<QThread>> abandoned;
    {
        QMutexLocker locker(&mutex_);
        abandoned.swap(abandoned_);
    }
    // Abandoned workers still reference this object; a pending fetch ends within its timeout.
    for (const auto &thread : abandoned) {
        if (thread && !thread->wait(transport::kRequestTimeoutMs + transport::kTeardownTimeoutMs)) {
            common::log_error(kCategory, QStringLiteral("Worker %1 still running at shutdown").arg(thread->objectName()));
        }
    }
}

QVector<model::Connection> Supervisor::statuses() const {
    return registry_.list();
}

std::optional<model::Connection> Supervisor::status(const QString &host) const {
    return registry_.get(host.trimmed());
}

std::optional<model::InputList> Supervisor::inputs(const QString &host, SyncError *error) {
    const auto outcome = fetchThroughTask(host.trimmed(), error);
    if (!outcome) {
        return std::nullopt;
    }
    return StateReconciler::rebuild(outcome->state.inputs);
}

std::optional<model::VideoLists> Supervisor::videoLists(const QString &host, SyncError *error) {
    const auto outcome = fetchThroughTask(host.trimmed(), error);
    if (!outcome) {
        return std::nullopt;
    }
    return StateReconciler::rebuild(outcome->state.videoLists);
}

bool Supervisor::refresh(const QString &host, SyncError *error) {
    return fetchThroughTask(host.trimmed(), error).has_value();
}

bool Supervisor::sendFunction(const QString &rawHost, const QString &function, const protocol::FunctionParams &params,
                              SyncError *error) {
    const QString host = rawHost.trimmed();
    const RuntimePtr target = runtime(host);
    if (!target || isPendingRemoval(host)) {
        set_error(error, SyncError::Code::NotConnected, QStringLiteral("%1 is not connected").arg(host));
        return false;
    }
    TransportError transportError;
    if (!target->transport->sendFunction(function, params, &transportError)) {
        common::log_warn(kCategory, QStringLiteral("%1 on %2 failed: %3").arg(function, host, transportError.message));
        set_error(error, command_code(transportError), transportError.message);
        return false;
    }
    return true;
}

bool Supervisor::selectVideoListItem(const QString &rawHost, int inputNumber, int itemIndex, SyncError *error) {
    const QString host = rawHost.trimmed();
    const RuntimePtr target = runtime(host);
    if (!target || isPendingRemoval(host)) {
        set_error(error, SyncError::Code::NotConnected, QStringLiteral("%1 is not connected").arg(host));
        return false;
    }
    if (inputNumber <= 0) {
        set_error(error, SyncError::Code::CommandFailed, QStringLiteral("Input number %1 out of range").arg(inputNumber));
        return false;
    }
    // The cache is left alone; the next snapshot reports whether vMix applied the selection.
    TransportError transportError;
    if (!target->transport->selectVideoListItem(inputNumber, itemIndex, &transportError)) {
        common::log_warn(kCategory, QStringLiteral("Selecting item %1 of input %2 on %3 failed: %4")
                                        .arg(itemIndex)
                                        .arg(inputNumber)
                                        .arg(host, transportError.message));
        set_error(error, command_code(transportError), transportError.message);
        return false;
    }
    return true;
}

model::AutoRefreshConfig Supervisor::autoRefreshConfig(const QString &host) const {
    return registry_.autoRefresh(host.trimmed());
}

void Supervisor::setAutoRefreshConfig(const QString &rawHost, const model::AutoRefreshConfig &config) {
    const QString host = rawHost.trimmed();
    model::AutoRefreshConfig normalized = config;
    if (normalized.intervalSeconds == 0) {
        normalized.intervalSeconds = 1;
    }
    registry_.setAutoRefresh(host, normalized);
    const RuntimePtr target = runtime(host);
    if (target && target->kind == model::TransportKind::Http) {
        scheduler_->configure(host, normalized);
    }
    common::log_info(kCategory, QStringLiteral("Auto refresh for %1: %2, every %3 s")
                                    .arg(host)
                                    .arg(normalized.enabled ? QStringLiteral("on") : QStringLiteral("off"))
                                    .arg(normalized.intervalSeconds));
}

QMap<QString, model::AutoRefreshConfig> Supervisor::autoRefreshConfigs() const {
    return registry_.autoRefreshConfigs();
}

void Supervisor::setConnectionLabel(const QString &rawHost, const QString &label) {
    const QString host = rawHost.trimmed();
    const RuntimePtr target = runtime(host);
    if (!target) {
        registry_.setLabel(host, label);
        return;
    }
    QMutexLocker ingestLocker(&target->ingestMutex);
    registry_.setLabel(host, label);
    if (isPendingRemoval(host)) {
        return;
    }
    if (const auto record = registry_.get(host)) {
        events_->publishStatus(*record);
    }
}

QMap<QString, QString> Supervisor::connectionLabels() const {
    return registry_.labels();
}

common::AppConfig Supervisor::exportConfig() const {
    common::AppConfig config;
    for (const auto &connection : registry_.list()) {
        common::ConnectionConfig entry;
        entry.host = connection.host;
        entry.port = connection.port;
        entry.label = connection.label;
        entry.transportKind = connection.transportKind;
        entry.autoRefresh = registry_.autoRefresh(connection.host);
        config.connections.push_back(entry);
    }
    return config;
}

void Supervisor::restore(const common::AppConfig &config) {
    for (const auto &entry : config.connections) {
        if (!entry.label.isEmpty()) {
            registry_.setLabel(entry.host, entry.label);
        }
        setAutoRefreshConfig(entry.host, entry.autoRefresh);
        SyncError error;
        if (!connectHost(entry.host, entry.port, entry.transportKind, &error)) {
            common::log_warn(kCategory, QStringLiteral("Could not restore %1: %2").arg(entry.host, error.message));
        }
    }
}

bool Supervisor::isPendingRemoval(const QString &host) const {
    QMutexLocker locker(&mutex_);
    return pendingRemoval_.contains(host);
}

int Supervisor::commandGateCount() const {
    QMutexLocker locker(&mutex_);
    return gates_.size();
}

quint64 Supervisor::beginFetch(const QString &host, quint64 generation) {
    const RuntimePtr target = runtime(host);
    if (!target || target->generation != generation) {
        return 0;
    }
    return target->sequence.fetch_add(1) + 1;
}

void Supervisor::fetchSucceeded(const QString &host, quint64 generation, quint64 sequence,
                                const protocol::VmixState &state, bool forced, bool scheduled) {
    const RuntimePtr target = runtime(host);
    if (!target || target->generation != generation) {
        common::log_debug(kCategory, QStringLiteral("Dropping snapshot #%1 for retired connection %2").arg(sequence).arg(host));
        return;
    }
    if (scheduled) {
        scheduler_->fetchFinished(host, true);
    }
    ingest(target, sequence, state, forced);
}

void Supervisor::fetchFailed(const QString &host, quint64 generation, const TransportError &error, bool scheduled) {
    if (error.kind == TransportError::Kind::Cancelled || !scheduled) {
        return;
    }
    const RuntimePtr target = runtime(host);
    if (!target || target->generation != generation) {
        return;
    }
    const int failures = scheduler_->fetchFinished(host, false);
    common::log_warn(kCategory, QStringLiteral("Poll of %1 failed (%2, %3 in a row): %4")
                                    .arg(host, transport::to_string(error.kind))
                                    .arg(failures)
                                    .arg(error.message));
    if (failures >= kFailureThreshold) {
        markLinkState(target, ConnectionStatus::Reconnecting, error.message);
    }
}

void Supervisor::dispatchScheduled(const QString &host) {
    QMutexLocker locker(&mutex_);
    const RuntimePtr target = runtimes_.value(host);
    if (!target || !target->task || pendingRemoval_.contains(host)) {
        return;
    }
    QMetaObject::invokeMethod(target->task, &HostTask::scheduledFetch, Qt::QueuedConnection);
}

Supervisor::RuntimePtr Supervisor::runtime(const QString &host) const {
    QMutexLocker locker(&mutex_);
    return runtimes_.value(host);
}

std::shared_ptr<QMutex> Supervisor::commandGate(const QString &host) {
    QMutexLocker locker(&mutex_);
    auto it = gates_.find(host);
    if (it == gates_.end()) {
        it = gates_.insert(host, std::make_shared<QMutex>());
    }
    return it.value();
}

void Supervisor::releaseGate(const QString &host, const std::shared_ptr<QMutex> &gate) {
    QMutexLocker locker(&mutex_);
    if (runtimes_.contains(host)) {
        return;
    }
    // Copies are only handed out under mutex_: two owners left means the table and the caller.
    const auto it = gates_.constFind(host);
    if (it != gates_.cend() && it.value() == gate && gate.use_count() == 2) {
        gates_.erase(it);
    }
}

transport::PushHandlers Supervisor::pushHandlersFor(const RuntimePtr &runtime) {
    std::weak_ptr<HostRuntime> weak = runtime;
    transport::PushHandlers handlers;
    handlers.onState = [this, weak](protocol::VmixState state) {
        auto target = weak.lock();
        if (!target) {
            return;
        }
        {
            QMutexLocker ingestLocker(&target->ingestMutex);
            if (!target->live) {
                target->pushedWhileConnecting = true;
                return;
            }
        }
        ingest(target, target->sequence.fetch_add(1) + 1, state, false);
    };
    handlers.onLink = [this, weak](ConnectionStatus status, QString reason) {
        auto target = weak.lock();
        if (!target) {
            return;
        }
        if (status == ConnectionStatus::Connected) {
            // The session requests a fresh state right away; that snapshot is emitted unconditionally.
            target->forceNext = true;
            return;
        }
        markLinkState(target, status, reason);
    };
    return handlers;
}

void Supervisor::startTask(const RuntimePtr &runtime) {
    auto *thread = new QThread();
    thread->setObjectName(QStringLiteral("vmix-host-%1").arg(runtime->host));
    auto *task = new HostTask(runtime->host, runtime->generation, runtime->transport, this);
    task->moveToThread(thread);
    connect(thread, &QThread::finished, task, &QObject::deleteLater);
    if (auto *app = QCoreApplication::instance()) {
        thread->moveToThread(app->thread());
        connect(thread, &QThread::finished, thread, &QObject::deleteLater);
    }
    {
        QMutexLocker locker(&mutex_);
        runtime->thread = thread;
        runtime->task = task;
    }
    thread->start();
}

bool Supervisor::stopTask(const RuntimePtr &runtime) {
    QThread *thread = nullptr;
    {
        QMutexLocker locker(&mutex_);
        thread = runtime->thread;
        runtime->thread = nullptr;
        runtime->task = nullptr;
    }
    if (!thread) {
        return true;
    }
    thread->requestInterruption();
    thread->quit();
    if (!thread->wait(transport::kTeardownTimeoutMs)) {
        QMutexLocker locker(&mutex_);
        abandoned_.append(QPointer<QThread>(thread));
        return false;
    }
    if (!QCoreApplication::instance()) {
        delete thread;
    }
    return true;
}

void Supervisor::teardown(const RuntimePtr &runtime) {
    const QString host = runtime->host;
    {
        QMutexLocker locker(&mutex_);
        pendingRemoval_.insert(host);
    }
    scheduler_->detach(host);

    if (!stopTask(runtime)) {
        common::log_warn(kCategory, QStringLiteral("Worker for %1 did not stop in time, abandoning it").arg(host));
    }
    if (!runtime->transport->close()) {
        common::log_warn(kCategory, QStringLiteral("Transport for %1 did not close cleanly").arg(host));
    }

    {
        // Waits for an emission already under way so removal is the host's last event.
        QMutexLocker ingestLocker(&runtime->ingestMutex);
        registry_.remove(host);
        {
            QMutexLocker locker(&mutex_);
            if (runtimes_.value(host) == runtime) {
                runtimes_.remove(host);
            }
        }
        events_->publishRemoved(host);
    }

    QMutexLocker locker(&mutex_);
    pendingRemoval_.remove(host);
}

std::optional<HostTask::Outcome> Supervisor::fetchThroughTask(const QString &host, SyncError *error) {
    auto promise = std::make_shared<std::promise<HostTask::Outcome>>();
    auto future = promise->get_future();
    {
        // Posting under the lock keeps teardown from retiring the task mid-post.
        QMutexLocker locker(&mutex_);
        const RuntimePtr target = runtimes_.value(host);
        if (!target || !target->task || pendingRemoval_.contains(host)) {
            set_error(error, SyncError::Code::NotConnected, QStringLiteral("%1 is not connected").arg(host));
            return std::nullopt;
        }
        HostTask *task = target->task;
        QMetaObject::invokeMethod(
            task, [task, promise]() { task->requestFetch(promise); }, Qt::QueuedConnection);
    }

    if (future.wait_for(std::chrono::milliseconds(kFetchWaitMs)) != std::future_status::ready) {
        set_error(error, SyncError::Code::Timeout, QStringLiteral("No state from %1 within %2 ms").arg(host).arg(kFetchWaitMs));
        return std::nullopt;
    }
    HostTask::Outcome outcome = future.get();
    if (!outcome.ok) {
        set_error(error, command_code(outcome.error), outcome.error.message);
        return std::nullopt;
    }
    return outcome;
}

void Supervisor::ingest(const RuntimePtr &runtime, quint64 sequence, const protocol::VmixState &state, bool forced) {
    QMutexLocker ingestLocker(&runtime->ingestMutex);
    if (isPendingRemoval(runtime->host)) {
        common::log_debug(kCategory, QStringLiteral("Dropping snapshot #%1 for %2, disconnect in progress")
                                         .arg(sequence)
                                         .arg(runtime->host));
        return;
    }
    const auto entry = registry_.entry(runtime->host);
    if (!entry || entry->generation != runtime->generation) {
        common::log_debug(kCategory, QStringLiteral("Dropping snapshot #%1 for retired connection %2")
                                         .arg(sequence)
                                         .arg(runtime->host));
        return;
    }

    const bool reconnected = runtime->forceNext.exchange(false);
    model::Snapshot snapshot;
    snapshot.host = runtime->host;
    snapshot.sequence = sequence;
    snapshot.status = state.status;
    snapshot.inputs = state.inputs;
    snapshot.videoLists = state.videoLists;

    const bool force = forced || reconnected || entry->connection.status != ConnectionStatus::Connected;
    const Reconciliation result = reconciler_.reconcile(entry->connection, entry->snapshot, snapshot, force);
    if (!result.accepted) {
        if (reconnected) {
            runtime->forceNext = true;
        }
        common::log_debug(QStringLiteral("reconciler"), QStringLiteral("Discarding stale snapshot #%1 for %2 (cached #%3)")
                                                            .arg(sequence)
                                                            .arg(runtime->host)
                                                            .arg(entry->snapshot ? entry->snapshot->sequence : 0));
        return;
    }

    registry_.update(result.connection, result.snapshot);
    if (result.statusChanged) {
        events_->publishStatus(result.connection);
    }
    if (result.inputsChanged) {
        events_->publishInputs(runtime->host, result.snapshot.inputs);
    }
    if (result.videoListsChanged) {
        events_->publishVideoLists(runtime->host, result.snapshot.videoLists);
    }
}

void Supervisor::markLinkState(const RuntimePtr &runtime, ConnectionStatus status, const QString &reason) {
    QMutexLocker ingestLocker(&runtime->ingestMutex);
    if (isPendingRemoval(runtime->host)) {
        return;
    }
    const auto entry = registry_.entry(runtime->host);
    if (!entry || entry->generation != runtime->generation) {
        return;
    }
    model::Connection next = entry->connection;
    next.status = status;
    if (!reason.isEmpty()) {
        next.lastError = reason;
    }
    if (next == entry->connection) {
        return;
    }
    registry_.update(next);
    events_->publishStatus(next);
}

}  // namespace vms::sync
