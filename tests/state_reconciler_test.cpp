#include "sync/state_reconciler.hpp"

#include <gtest/gtest.h>

using namespace vms;
using vms::sync::StateReconciler;

namespace {

model::VideoListInput make_list(const QString &key, int selected) {
    model::VideoListInput list;
    list.key = key;
    list.number = 3;
    list.title = QStringLiteral("Playlist");
    list.type = QStringLiteral("VideoList");
    list.state = QStringLiteral("Running");
    for (int i = 0; i < 3; ++i) {
        model::VideoListItem item;
        item.key = QStringLiteral("%1_%2").arg(key).arg(i);
        item.title = QStringLiteral("clip%1.mp4").arg(i);
        item.type = QStringLiteral("VideoListItem");
        item.state = QStringLiteral("Available");
        item.selected = i == selected;
        list.items.append(item);
    }
    model::normalize_selection(list);
    return list;
}

model::Snapshot make_snapshot(quint64 sequence, int active, int selected = 0) {
    model::Snapshot snapshot;
    snapshot.host = QStringLiteral("studio");
    snapshot.sequence = sequence;
    snapshot.status.activeInput = active;
    snapshot.status.previewInput = 2;
    snapshot.status.version = QStringLiteral("27.0.0.49");
    snapshot.status.edition = QStringLiteral("4K");
    model::Input input;
    input.key = QStringLiteral("a1");
    input.number = 1;
    input.title = QStringLiteral("Camera 1");
    snapshot.inputs.append(input);
    snapshot.videoLists.append(make_list(QStringLiteral("c3"), selected));
    return snapshot;
}

model::Connection connected(const model::Snapshot &snapshot) {
    model::Connection connection;
    connection.host = snapshot.host;
    connection.port = 8088;
    connection.label = QStringLiteral("Studio");
    connection.status = model::ConnectionStatus::Connected;
    connection.activeInput = snapshot.status.activeInput;
    connection.previewInput = snapshot.status.previewInput;
    connection.version = snapshot.status.version;
    connection.edition = snapshot.status.edition;
    return connection;
}

}  // namespace

TEST(StateReconcilerTest, FirstSnapshotReportsEverything) {
    StateReconciler reconciler;
    const auto snapshot = make_snapshot(1, 1);
    model::Connection current;
    current.host = snapshot.host;
    current.status = model::ConnectionStatus::Connecting;

    const auto result = reconciler.reconcile(current, std::nullopt, snapshot, false);
    EXPECT_TRUE(result.accepted);
    EXPECT_TRUE(result.statusChanged);
    EXPECT_TRUE(result.inputsChanged);
    EXPECT_TRUE(result.videoListsChanged);
    EXPECT_EQ(result.connection.status, model::ConnectionStatus::Connected);
    EXPECT_EQ(result.connection.activeInput, 1);
    EXPECT_EQ(result.snapshot.sequence, 1u);
}

TEST(StateReconcilerTest, RejectsStaleAndDuplicateSequences) {
    StateReconciler reconciler;
    const auto cached = make_snapshot(5, 1);
    const auto current = connected(cached);

    EXPECT_FALSE(reconciler.reconcile(current, cached, make_snapshot(4, 3), false).accepted);
    EXPECT_FALSE(reconciler.reconcile(current, cached, make_snapshot(5, 3), true).accepted);
    EXPECT_TRUE(reconciler.reconcile(current, cached, make_snapshot(6, 3), false).accepted);
}

TEST(StateReconcilerTest, SuppressesIdenticalSnapshot) {
    StateReconciler reconciler;
    const auto cached = make_snapshot(1, 1);
    const auto result = reconciler.reconcile(connected(cached), cached, make_snapshot(2, 1), false);

    EXPECT_TRUE(result.accepted);
    EXPECT_FALSE(result.statusChanged);
    EXPECT_FALSE(result.inputsChanged);
    EXPECT_FALSE(result.videoListsChanged);
    EXPECT_EQ(result.snapshot.sequence, 2u);
}

TEST(StateReconcilerTest, ReportsOnlyChangedParts) {
    StateReconciler reconciler;
    const auto cached = make_snapshot(1, 1, 0);

    const auto statusOnly = reconciler.reconcile(connected(cached), cached, make_snapshot(2, 2, 0), false);
    EXPECT_TRUE(statusOnly.statusChanged);
    EXPECT_FALSE(statusOnly.inputsChanged);
    EXPECT_FALSE(statusOnly.videoListsChanged);
    EXPECT_EQ(statusOnly.connection.activeInput, 2);

    const auto listOnly = reconciler.reconcile(connected(cached), cached, make_snapshot(3, 1, 2), false);
    EXPECT_FALSE(listOnly.statusChanged);
    EXPECT_TRUE(listOnly.videoListsChanged);
    EXPECT_EQ(listOnly.snapshot.videoLists.first().selectedIndex, std::optional<int>(2));
}

TEST(StateReconcilerTest, ForcedPassReportsEverything) {
    StateReconciler reconciler;
    const auto cached = make_snapshot(1, 1);
    const auto result = reconciler.reconcile(connected(cached), cached, make_snapshot(2, 1), true);

    EXPECT_TRUE(result.statusChanged);
    EXPECT_TRUE(result.inputsChanged);
    EXPECT_TRUE(result.videoListsChanged);
}

TEST(StateReconcilerTest, RecoveryClearsErrorAndRestoresConnected) {
    StateReconciler reconciler;
    const auto cached = make_snapshot(1, 1);
    auto current = connected(cached);
    current.status = model::ConnectionStatus::Reconnecting;
    current.lastError = QStringLiteral("Host unreachable");

    const auto result = reconciler.reconcile(current, cached, make_snapshot(2, 1), false);
    EXPECT_TRUE(result.statusChanged);
    EXPECT_EQ(result.connection.status, model::ConnectionStatus::Connected);
    EXPECT_FALSE(result.connection.lastError.has_value());
}

TEST(StateReconcilerTest, ChangedListsAreFreshContainers) {
    StateReconciler reconciler;
    const auto cached = make_snapshot(1, 1, 0);
    const auto incoming = make_snapshot(2, 1, 1);

    const auto result = reconciler.reconcile(connected(cached), cached, incoming, false);
    ASSERT_TRUE(result.videoListsChanged);
    ASSERT_EQ(result.snapshot.videoLists.size(), 1);
    EXPECT_NE(result.snapshot.videoLists.constData(), cached.videoLists.constData());
    EXPECT_NE(result.snapshot.videoLists.constData(), incoming.videoLists.constData());
    EXPECT_NE(result.snapshot.videoLists.first().items.constData(), incoming.videoLists.first().items.constData());
}

TEST(StateReconcilerTest, RebuildNormalisesSelection) {
    model::VideoListInput list = make_list(QStringLiteral("k"), -1);
    list.items[1].selected = true;
    list.items[2].selected = true;
    list.selectedIndex = 0;

    const model::VideoLists rebuilt = StateReconciler::rebuild(model::VideoLists{list});
    ASSERT_EQ(rebuilt.size(), 1);
    EXPECT_EQ(rebuilt.first().selectedIndex, std::optional<int>(1));
    EXPECT_FALSE(rebuilt.first().items[2].selected);
    EXPECT_TRUE(model::selection_consistent(rebuilt.first()));
}
