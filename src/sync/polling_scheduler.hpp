#pragma once

#include "common/model.hpp"

#include <QtCore/QElapsedTimer>
#include <QtCore/QHash>
#include <QtCore/QMutex>
#include <QtCore/QObject>
#include <QtCore/QStringList>
#include <QtCore/QTimer>

#include <memory>
#include <optional>

namespace vms::sync {

constexpr int kTickResolutionMs = 100;
constexpr int kFailureThreshold = 3;
constexpr qint64 kBackoffInitialMs = 1000;
constexpr qint64 kBackoffMaxMs = 30000;

class Clock {
public:
    virtual ~Clock() = default;
    virtual qint64 nowMs() const = 0;
};

class SteadyClock : public Clock {
public:
    SteadyClock();
    qint64 nowMs() const override;

private:
    QElapsedTimer timer_;
};

// Deadline book-keeping for every polled host. A host is due when its deadline has passed,
// it is enabled and no scheduled fetch for it is still running.
class PollingScheduler : public QObject {
    Q_OBJECT

public:
    explicit PollingScheduler(std::shared_ptr<Clock> clock = nullptr, QObject *parent = nullptr);

    void start();
    void stop();

    void attach(const QString &host, const model::AutoRefreshConfig &config);
    void detach(const QString &host);
    void configure(const QString &host, const model::AutoRefreshConfig &config);

    // Returns the due hosts and marks them in flight. Ticks missed while a fetch was
    // still running are skipped, not queued.
    QStringList takeDue(qint64 nowMs);
    // Returns the consecutive failure count after recording the result.
    int fetchFinished(const QString &host, bool ok);

    bool isAttached(const QString &host) const;
    bool isInFlight(const QString &host) const;
    std::optional<qint64> nextDue(const QString &host) const;
    int failures(const QString &host) const;

    const Clock &clock() const { return *clock_; }

public slots:
    void poll();

signals:
    void refreshDue(const QString &host);

private:
    struct Entry {
        qint64 intervalMs = 0;
        qint64 nextDueMs = 0;
        bool enabled = true;
        bool inFlight = false;
        int failures = 0;
    };

    static qint64 intervalOf(const model::AutoRefreshConfig &config);
    static qint64 backoffFor(int failures);

    std::shared_ptr<Clock> clock_;
    QTimer timer_;
    mutable QMutex mutex_;
    QHash<QString, Entry> entries_;
};

}  // namespace vms::sync
