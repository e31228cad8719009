#pragma once

#include "transport/transport_client.hpp"

#include <QtCore/QObject>
#include <QtCore/QString>

#include <deque>
#include <future>
#include <memory>

namespace vms::sync {

// Receives the results of a HostTask. Called on the task's thread.
class FetchSink {
public:
    virtual ~FetchSink() = default;

    virtual quint64 beginFetch(const QString &host, quint64 generation) = 0;
    virtual void fetchSucceeded(const QString &host, quint64 generation, quint64 sequence,
                                const protocol::VmixState &state, bool forced, bool scheduled) = 0;
    virtual void fetchFailed(const QString &host, quint64 generation, const transport::TransportError &error,
                             bool scheduled) = 0;
};

// Per-host worker living on its own thread. Runs at most one fetch at a time: requests that
// arrive while one is running are folded into the next fetch.
class HostTask : public QObject {
    Q_OBJECT

public:
    struct Outcome {
        bool ok = false;
        transport::TransportError error;
        protocol::VmixState state;
    };
    using OutcomePromise = std::shared_ptr<std::promise<Outcome>>;

    HostTask(QString host, quint64 generation, std::shared_ptr<transport::TransportClient> transport, FetchSink *sink,
             QObject *parent = nullptr);
    ~HostTask() override;

    const QString &host() const { return host_; }
    quint64 generation() const { return generation_; }

    // Manual refresh: fetched immediately (after any running fetch) and emitted unconditionally.
    void requestFetch(OutcomePromise promise);

public slots:
    void scheduledFetch();
    // One unforced fetch outside the polling schedule; failures do not count against the host.
    void backgroundFetch();

private:
    void drain();
    Outcome runFetch(bool forced, bool scheduled);
    void cancelWaiting();

    QString host_;
    quint64 generation_ = 0;
    std::shared_ptr<transport::TransportClient> transport_;
    FetchSink *sink_ = nullptr;
    bool busy_ = false;
    bool scheduledPending_ = false;
    bool backgroundPending_ = false;
    std::deque<OutcomePromise> waiting_;
};

}  // namespace vms::sync
