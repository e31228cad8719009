#include "sync/polling_scheduler.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace vms;
using vms::sync::PollingScheduler;

namespace {

const QString kHost = QStringLiteral("studio");

class PollingSchedulerTest : public ::testing::Test {
protected:
    std::shared_ptr<test::ManualClock> clock_ = std::make_shared<test::ManualClock>();
    PollingScheduler scheduler_{clock_};

    QStringList advance(qint64 ms) {
        clock_->advance(ms);
        return scheduler_.takeDue(clock_->nowMs());
    }
};

}  // namespace

TEST_F(PollingSchedulerTest, FiresOncePerInterval) {
    scheduler_.attach(kHost, {true, 5});
    EXPECT_EQ(scheduler_.nextDue(kHost), std::optional<qint64>(5000));

    int fired = 0;
    for (int step = 0; step < 3; ++step) {
        const QStringList due = advance(5000);
        fired += due.size();
        for (const auto &host : due) {
            scheduler_.fetchFinished(host, true);
        }
    }
    EXPECT_EQ(fired, 3);
}

TEST_F(PollingSchedulerTest, NotDueBeforeFirstInterval) {
    scheduler_.attach(kHost, {true, 3});
    EXPECT_TRUE(advance(2999).isEmpty());
    EXPECT_EQ(advance(1), QStringList{kHost});
    EXPECT_TRUE(scheduler_.isInFlight(kHost));
}

TEST_F(PollingSchedulerTest, SkipsTicksWhileFetchRuns) {
    scheduler_.attach(kHost, {true, 1});
    EXPECT_EQ(advance(1000).size(), 1);

    // The fetch takes three intervals; none of those ticks queue up.
    EXPECT_TRUE(advance(1000).isEmpty());
    EXPECT_TRUE(advance(1000).isEmpty());
    EXPECT_TRUE(advance(1000).isEmpty());
    scheduler_.fetchFinished(kHost, true);
    EXPECT_FALSE(scheduler_.isInFlight(kHost));

    EXPECT_EQ(scheduler_.nextDue(kHost), std::optional<qint64>(5000));
    EXPECT_EQ(advance(1000).size(), 1);
}

TEST_F(PollingSchedulerTest, DisabledHostIsNeverDue) {
    scheduler_.attach(kHost, {false, 1});
    EXPECT_FALSE(scheduler_.nextDue(kHost).has_value());
    EXPECT_TRUE(advance(60000).isEmpty());

    scheduler_.configure(kHost, {true, 2});
    EXPECT_EQ(scheduler_.nextDue(kHost), std::optional<qint64>(62000));
    EXPECT_TRUE(advance(1999).isEmpty());
    EXPECT_EQ(advance(1).size(), 1);
    scheduler_.fetchFinished(kHost, true);

    scheduler_.configure(kHost, {false, 2});
    EXPECT_TRUE(advance(10000).isEmpty());
}

TEST_F(PollingSchedulerTest, IntervalChangeReanchorsDeadline) {
    scheduler_.attach(kHost, {true, 10});
    advance(4000);
    scheduler_.configure(kHost, {true, 2});
    EXPECT_EQ(scheduler_.nextDue(kHost), std::optional<qint64>(2000));
    EXPECT_EQ(advance(0).size(), 1);
}

TEST_F(PollingSchedulerTest, BacksOffAfterRepeatedFailures) {
    scheduler_.attach(kHost, {true, 1});

    for (int attempt = 1; attempt <= 2; ++attempt) {
        ASSERT_EQ(advance(1000).size(), 1);
        EXPECT_EQ(scheduler_.fetchFinished(kHost, false), attempt);
    }
    ASSERT_EQ(advance(1000).size(), 1);
    EXPECT_EQ(scheduler_.fetchFinished(kHost, false), 3);
    EXPECT_EQ(scheduler_.nextDue(kHost), std::optional<qint64>(clock_->nowMs() + sync::kBackoffInitialMs));

    ASSERT_EQ(advance(1000).size(), 1);
    EXPECT_EQ(scheduler_.fetchFinished(kHost, false), 4);
    EXPECT_EQ(scheduler_.nextDue(kHost), std::optional<qint64>(clock_->nowMs() + 2 * sync::kBackoffInitialMs));

    for (int attempt = 0; attempt < 10; ++attempt) {
        advance(sync::kBackoffMaxMs);
        scheduler_.fetchFinished(kHost, false);
    }
    EXPECT_EQ(scheduler_.nextDue(kHost), std::optional<qint64>(clock_->nowMs() + sync::kBackoffMaxMs));

    advance(sync::kBackoffMaxMs);
    EXPECT_EQ(scheduler_.fetchFinished(kHost, true), 0);
    EXPECT_EQ(scheduler_.failures(kHost), 0);
    EXPECT_EQ(scheduler_.nextDue(kHost), std::optional<qint64>(clock_->nowMs() + 1000));
}

TEST_F(PollingSchedulerTest, DetachForgetsHost) {
    scheduler_.attach(kHost, {true, 1});
    scheduler_.detach(kHost);
    EXPECT_FALSE(scheduler_.isAttached(kHost));
    EXPECT_TRUE(advance(5000).isEmpty());
    EXPECT_EQ(scheduler_.fetchFinished(kHost, false), 0);
}

TEST_F(PollingSchedulerTest, PollEmitsRefreshDue) {
    QStringList emitted;
    QObject::connect(&scheduler_, &PollingScheduler::refreshDue,
                     [&emitted](const QString &host) { emitted.append(host); });
    scheduler_.attach(kHost, {true, 1});
    scheduler_.attach(QStringLiteral("other"), {true, 5});

    clock_->advance(1000);
    scheduler_.poll();
    EXPECT_EQ(emitted, QStringList{kHost});
}
