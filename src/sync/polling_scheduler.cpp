#include "polling_scheduler.hpp"

#include "common/logger.hpp"

#include <QtCore/QMutexLocker>

#include <algorithm>

namespace vms::sync {

namespace {

const QString kCategory = QStringLiteral("scheduler");

}  // namespace

SteadyClock::SteadyClock() {
    timer_.start();
}

qint64 SteadyClock::nowMs() const {
    return timer_.elapsed();
}

PollingScheduler::PollingScheduler(std::shared_ptr<Clock> clock, QObject *parent)
    : QObject(parent), clock_(clock ? std::move(clock) : std::make_shared<SteadyClock>()), timer_(this) {
    timer_.setInterval(kTickResolutionMs);
    connect(&timer_, &QTimer::timeout, this, &PollingScheduler::poll);
}

void PollingScheduler::start() {
    timer_.start();
}

void PollingScheduler::stop() {
    timer_.stop();
}

qint64 PollingScheduler::intervalOf(const model::AutoRefreshConfig &config) {
    return static_cast<qint64>(std::max<quint32>(config.intervalSeconds, 1)) * 1000;
}

qint64 PollingScheduler::backoffFor(int failures) {
    const int shift = std::min(failures - kFailureThreshold, 5);
    return std::min(kBackoffInitialMs << std::max(shift, 0), kBackoffMaxMs);
}

void PollingScheduler::attach(const QString &host, const model::AutoRefreshConfig &config) {
    QMutexLocker locker(&mutex_);
    Entry entry;
    entry.intervalMs = intervalOf(config);
    entry.enabled = config.enabled;
    entry.nextDueMs = clock_->nowMs() + entry.intervalMs;
    entries_.insert(host, entry);
    common::log_debug(kCategory, QStringLiteral("Polling %1 every %2 ms (%3)")
                                     .arg(host)
                                     .arg(entry.intervalMs)
                                     .arg(entry.enabled ? QStringLiteral("enabled") : QStringLiteral("disabled")));
}

void PollingScheduler::detach(const QString &host) {
    QMutexLocker locker(&mutex_);
    entries_.remove(host);
}

void PollingScheduler::configure(const QString &host, const model::AutoRefreshConfig &config) {
    QMutexLocker locker(&mutex_);
    auto it = entries_.find(host);
    if (it == entries_.end()) {
        return;
    }
    const qint64 interval = intervalOf(config);
    const qint64 now = clock_->nowMs();
    if (!config.enabled) {
        it->enabled = false;
    } else if (!it->enabled) {
        it->enabled = true;
        it->nextDueMs = now + interval;
    } else if (interval != it->intervalMs && it->failures < kFailureThreshold) {
        // Re-anchor on the last tick so the new interval applies from the next one.
        it->nextDueMs = it->nextDueMs - it->intervalMs + interval;
    }
    it->intervalMs = interval;
}

QStringList PollingScheduler::takeDue(qint64 nowMs) {
    QMutexLocker locker(&mutex_);
    QStringList due;
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        Entry &entry = it.value();
        if (!entry.enabled || entry.nextDueMs > nowMs) {
            continue;
        }
        if (!entry.inFlight) {
            entry.inFlight = true;
            due.append(it.key());
        } else {
            common::log_debug(kCategory, QStringLiteral("Skipping tick for %1, previous fetch still running").arg(it.key()));
        }
        while (entry.nextDueMs <= nowMs) {
            entry.nextDueMs += entry.intervalMs;
        }
    }
    return due;
}

int PollingScheduler::fetchFinished(const QString &host, bool ok) {
    QMutexLocker locker(&mutex_);
    auto it = entries_.find(host);
    if (it == entries_.end()) {
        return 0;
    }
    it->inFlight = false;
    const qint64 now = clock_->nowMs();
    if (ok) {
        if (it->failures > 0) {
            it->failures = 0;
            it->nextDueMs = now + it->intervalMs;
        }
        return 0;
    }

    ++it->failures;
    if (it->failures >= kFailureThreshold) {
        const qint64 delay = backoffFor(it->failures);
        it->nextDueMs = now + delay;
        common::log_debug(kCategory, QStringLiteral("%1 failed %2 times, next attempt in %3 ms")
                                         .arg(host)
                                         .arg(it->failures)
                                         .arg(delay));
    }
    return it->failures;
}

bool PollingScheduler::isAttached(const QString &host) const {
    QMutexLocker locker(&mutex_);
    return entries_.contains(host);
}

bool PollingScheduler::isInFlight(const QString &host) const {
    QMutexLocker locker(&mutex_);
    auto it = entries_.constFind(host);
    return it != entries_.constEnd() && it->inFlight;
}

std::optional<qint64> PollingScheduler::nextDue(const QString &host) const {
    QMutexLocker locker(&mutex_);
    auto it = entries_.constFind(host);
    if (it == entries_.constEnd() || !it->enabled) {
        return std::nullopt;
    }
    return it->nextDueMs;
}

int PollingScheduler::failures(const QString &host) const {
    QMutexLocker locker(&mutex_);
    auto it = entries_.constFind(host);
    return it == entries_.constEnd() ? 0 : it->failures;
}

void PollingScheduler::poll() {
    const QStringList due = takeDue(clock_->nowMs());
    for (const QString &host : due) {
        emit refreshDue(host);
    }
}

}  // namespace vms::sync
