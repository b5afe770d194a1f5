#include "gtest/gtest.h"
#include "test_utils.h"
#include "escpos/Protocol.hpp"

using namespace escpos;
using namespace escpos::domain;
using namespace escpos::domain::ui;

class LineTest : public ::testing::Test {
protected:
    Protocol protocol;
    printer::PrinterOptions options{std::nullopt, std::nullopt, 10};
    printer::PrinterStyleState style;

    static Command text(const std::string &value) {
        return Command(value.begin(), value.end());
    }
};

TEST_F(LineTest, DefaultLineFillsWidth) {
    const auto cmds = protocol.ui()->drawLine(Line(), options, style);
    ASSERT_EQ(cmds.size(), 2u);
    EXPECT_EQ(cmds[0], text("----------"));
    EXPECT_EQ(cmds[1], test::bytes({0x1B, 0x64, 0x01}));
}

TEST_F(LineTest, OffsetPrecedesLeftJustifiedLine) {
    const auto line = LineBuilder().style(LineStyle::Kind::Double).width(4).offset(2).build();
    const auto cmds = protocol.ui()->drawLine(line, options, style);
    EXPECT_EQ(cmds[0], text("  ===="));
}

TEST_F(LineTest, OffsetFollowsOtherJustification) {
    const auto line = LineBuilder().justify(JustifyMode::Right).width(3).offset(2).build();
    const auto cmds = protocol.ui()->drawLine(line, options, style);
    ASSERT_EQ(cmds.size(), 4u);
    EXPECT_EQ(cmds[0], test::bytes({0x1B, 0x61, 0x02}));
    EXPECT_EQ(cmds[1], text("---  "));
    EXPECT_EQ(cmds[3], test::bytes({0x1B, 0x61, 0x00}));
}

TEST_F(LineTest, SizeDividesAvailableColumns) {
    const auto line = LineBuilder().size({2, 1}).build();
    const auto cmds = protocol.ui()->drawLine(line, options, style);
    ASSERT_EQ(cmds.size(), 4u);
    EXPECT_EQ(cmds[0], test::bytes({0x1D, 0x21, 0x10}));
    EXPECT_EQ(cmds[1], text("-----"));
    EXPECT_EQ(cmds[3], test::bytes({0x1D, 0x21, 0x00}));
}

TEST_F(LineTest, MultiCharacterPatternIsTruncated) {
    const auto line = LineBuilder().style(LineStyle::Kind::Dashed).build();
    const auto cmds = protocol.ui()->drawLine(line, options, style);
    EXPECT_EQ(cmds[0], text("- - - - - "));
}

TEST_F(LineTest, OffsetBeyondWidthLeavesOnlyPadding) {
    const auto line = LineBuilder().offset(12).build();
    const auto cmds = protocol.ui()->drawLine(line, options, style);
    EXPECT_EQ(cmds[0], text("          "));
}

TEST_F(LineTest, FontIsRestoredFromStyleState) {
    style.font = Font::B;
    const auto line = LineBuilder().font(Font::C).width(1).build();
    const auto cmds = protocol.ui()->drawLine(line, options, style);
    ASSERT_EQ(cmds.size(), 4u);
    EXPECT_EQ(cmds[0], test::bytes({0x1B, 0x4D, 0x02}));
    EXPECT_EQ(cmds[3], test::bytes({0x1B, 0x4D, 0x01}));
}

TEST_F(LineTest, TruncateKeepsWholeCharacters) {
    EXPECT_EQ(command::ui::UiCommands::truncateUtf8("a€b", 2), "a");
    EXPECT_EQ(command::ui::UiCommands::truncateUtf8("a€b", 4), "a€");
    EXPECT_EQ(command::ui::UiCommands::truncateUtf8("abc", 5), "abc");
}
