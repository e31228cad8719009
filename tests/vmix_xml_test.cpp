#include "common/vmix_xml.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace vms;
using vms::test::XmlInput;

TEST(VmixXmlTest, ParsesStatusAndInputs) {
    const QByteArray xml = test::state_xml(QStringLiteral("27.0.0.49"), 1, 2, test::three_inputs());

    QString error;
    auto state = protocol::parse_state(xml, &error);
    ASSERT_TRUE(state.has_value()) << error.toStdString();

    EXPECT_EQ(state->status.version, QStringLiteral("27.0.0.49"));
    EXPECT_EQ(state->status.edition, QStringLiteral("4K"));
    EXPECT_EQ(state->status.activeInput, 1);
    EXPECT_EQ(state->status.previewInput, 2);
    EXPECT_FALSE(state->status.preset.has_value());

    ASSERT_EQ(state->inputs.size(), 3);
    EXPECT_EQ(state->inputs[0].key, QStringLiteral("a1"));
    EXPECT_EQ(state->inputs[0].title, QStringLiteral("Camera 1"));
    EXPECT_EQ(state->inputs[0].type, QStringLiteral("Capture"));
    EXPECT_EQ(state->inputs[2].number, 3);
}

TEST(VmixXmlTest, ExtractsVideoListsWithItems) {
    auto state = protocol::parse_state(test::state_xml(QStringLiteral("27"), 1, 1, test::three_inputs()));
    ASSERT_TRUE(state.has_value());
    ASSERT_EQ(state->videoLists.size(), 1);

    const model::VideoListInput &list = state->videoLists.first();
    EXPECT_EQ(list.key, QStringLiteral("c3"));
    EXPECT_EQ(list.number, 3);
    ASSERT_EQ(list.items.size(), 3);
    EXPECT_EQ(list.items[0].title, QStringLiteral("intro.mp4"));
    EXPECT_EQ(list.items[0].key, QStringLiteral("c3_0"));
    EXPECT_TRUE(list.items[0].selected);
    EXPECT_FALSE(list.items[2].enabled);
    ASSERT_TRUE(list.selectedIndex.has_value());
    EXPECT_EQ(*list.selectedIndex, 0);
    EXPECT_TRUE(model::selection_consistent(list));
}

TEST(VmixXmlTest, FallsBackToOneBasedSelectedIndex) {
    XmlInput list{QStringLiteral("k"), 1, QStringLiteral("VideoList"), QStringLiteral("List")};
    list.items = {QStringLiteral("<item>a.mp4</item>"), QStringLiteral("<item>b.mp4</item>")};
    list.selectedIndex = 2;

    auto state = protocol::parse_state(test::state_xml(QStringLiteral("27"), 1, 1, {list}));
    ASSERT_TRUE(state.has_value());
    ASSERT_EQ(state->videoLists.size(), 1);
    const auto &items = state->videoLists.first().items;
    EXPECT_FALSE(items[0].selected);
    EXPECT_TRUE(items[1].selected);
    EXPECT_EQ(state->videoLists.first().selectedIndex, std::optional<int>(1));
}

TEST(VmixXmlTest, KeepsOnlyFirstSelectedItem) {
    XmlInput list{QStringLiteral("k"), 1, QStringLiteral("VideoList"), QStringLiteral("List")};
    list.items = {QStringLiteral("<item>a.mp4</item>"), QStringLiteral("<item selected=\"true\">b.mp4</item>"),
                  QStringLiteral("<item selected=\"true\">c.mp4</item>")};

    auto state = protocol::parse_state(test::state_xml(QStringLiteral("27"), 1, 1, {list}));
    ASSERT_TRUE(state.has_value());
    const model::VideoListInput &parsed = state->videoLists.first();
    EXPECT_EQ(parsed.selectedIndex, std::optional<int>(1));
    EXPECT_FALSE(parsed.items[2].selected);
    EXPECT_TRUE(model::selection_consistent(parsed));
}

TEST(VmixXmlTest, EmptyVideoListHasNoSelection) {
    XmlInput list{QStringLiteral("k"), 4, QStringLiteral("VideoList"), QStringLiteral("Empty")};

    auto state = protocol::parse_state(test::state_xml(QStringLiteral("27"), 1, 1, {list}));
    ASSERT_TRUE(state.has_value());
    ASSERT_EQ(state->videoLists.size(), 1);
    EXPECT_TRUE(state->videoLists.first().items.isEmpty());
    EXPECT_FALSE(state->videoLists.first().selectedIndex.has_value());
}

TEST(VmixXmlTest, ReadsPresetAndMissingAttributes) {
    const QByteArray xml = "<vmix><version>26</version><preset>C:\\show.vmix</preset>"
                           "<inputs><input key=\"x\" number=\"1\" title=\"Bare\"/></inputs>"
                           "<active>1</active><preview>0</preview></vmix>";
    auto state = protocol::parse_state(xml);
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->status.preset, std::optional<QString>(QStringLiteral("C:\\show.vmix")));
    EXPECT_TRUE(state->status.edition.isEmpty());
    ASSERT_EQ(state->inputs.size(), 1);
    EXPECT_EQ(state->inputs[0].type, QStringLiteral("Unknown"));
    EXPECT_EQ(state->inputs[0].state, QStringLiteral("Unknown"));
}

TEST(VmixXmlTest, RejectsBrokenDocuments) {
    QString error;
    EXPECT_FALSE(protocol::parse_state("<vmix><inputs>", &error).has_value());
    EXPECT_FALSE(error.isEmpty());

    error.clear();
    EXPECT_FALSE(protocol::parse_state("<html></html>", &error).has_value());
    EXPECT_TRUE(error.contains(QStringLiteral("html")));

    EXPECT_FALSE(protocol::parse_state(QByteArray()).has_value());
}
