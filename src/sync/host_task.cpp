#include "host_task.hpp"

#include "common/logger.hpp"

#include <QtCore/QThread>

namespace vms::sync {

namespace {

const QString kCategory = QStringLiteral("supervisor");

}  // namespace

HostTask::HostTask(QString host, quint64 generation, std::shared_ptr<transport::TransportClient> transport,
                   FetchSink *sink, QObject *parent)
    : QObject(parent), host_(std::move(host)), generation_(generation), transport_(std::move(transport)), sink_(sink) {}

HostTask::~HostTask() {
    cancelWaiting();
}

void HostTask::scheduledFetch() {
    scheduledPending_ = true;
    drain();
}

void HostTask::backgroundFetch() {
    backgroundPending_ = true;
    drain();
}

void HostTask::requestFetch(OutcomePromise promise) {
    waiting_.push_back(std::move(promise));
    drain();
}

void HostTask::drain() {
    // Re-entered from the nested event loop of a running HTTP fetch: that fetch picks the work up.
    if (busy_) {
        return;
    }
    busy_ = true;
    while (scheduledPending_ || backgroundPending_ || !waiting_.empty()) {
        if (QThread::currentThread()->isInterruptionRequested()) {
            scheduledPending_ = false;
            backgroundPending_ = false;
            cancelWaiting();
            break;
        }
        const bool scheduled = scheduledPending_;
        scheduledPending_ = false;
        backgroundPending_ = false;
        if (!waiting_.empty()) {
            std::deque<OutcomePromise> batch;
            batch.swap(waiting_);
            const Outcome outcome = runFetch(true, scheduled);
            for (auto &promise : batch) {
                promise->set_value(outcome);
            }
        } else {
            runFetch(false, scheduled);
        }
    }
    busy_ = false;
}

HostTask::Outcome HostTask::runFetch(bool forced, bool scheduled) {
    Outcome outcome;
    const quint64 sequence = sink_->beginFetch(host_, generation_);
    auto state = transport_->fetchState(&outcome.error);
    if (!state) {
        common::log_debug(kCategory, QStringLiteral("Fetch #%1 for %2 failed: %3")
                                         .arg(sequence)
                                         .arg(host_, outcome.error.message));
        sink_->fetchFailed(host_, generation_, outcome.error, scheduled);
        return outcome;
    }
    outcome.ok = true;
    outcome.state = std::move(*state);
    sink_->fetchSucceeded(host_, generation_, sequence, outcome.state, forced, scheduled);
    return outcome;
}

void HostTask::cancelWaiting() {
    Outcome cancelled;
    cancelled.error.kind = transport::TransportError::Kind::Cancelled;
    cancelled.error.message = QStringLiteral("Worker for %1 stopped").arg(host_);
    for (auto &promise : waiting_) {
        promise->set_value(cancelled);
    }
    waiting_.clear();
}

}  // namespace vms::sync
