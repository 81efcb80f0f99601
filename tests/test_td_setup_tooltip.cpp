#include <gtest/gtest.h>
#include "indicators/TdSetupCalculator.hpp"
#include "indicators/TdSetupTooltip.hpp"
#include "fixtures/bar_builders.hpp"

using namespace tdchart;
using namespace tdchart::test;

class TdSetupTooltipTest : public ::testing::Test {
protected:
    void SetUp() override {
        results = TdSetupCalculator::calculate(risingBars(13), TdSetupVariant{});
    }

    SetupResults results;
};

TEST_F(TdSetupTooltipTest, DefaultsToLastBar) {
    auto payload = TdSetupTooltip::project(results, std::nullopt, "TD Setup");

    EXPECT_EQ(payload.name, "TD Setup");
    ASSERT_EQ(payload.values.size(), 2u);
    EXPECT_EQ(payload.values[0].title, "Sell Setup");
    EXPECT_EQ(payload.values[0].value, "9");
    EXPECT_EQ(payload.values[1].title, "Buy Setup");
    EXPECT_EQ(payload.values[1].value, "--");
}

TEST_F(TdSetupTooltipTest, UsesCursorIndexWhenInRange) {
    auto payload = TdSetupTooltip::project(results, 5);
    EXPECT_EQ(payload.valueFor("Sell Setup"), "2");
    EXPECT_EQ(payload.valueFor("Buy Setup"), "--");

    auto warmUp = TdSetupTooltip::project(results, 2);
    EXPECT_EQ(warmUp.valueFor("Sell Setup"), "--");
}

TEST_F(TdSetupTooltipTest, OutOfRangeCursorFallsBackToLastBar) {
    EXPECT_EQ(TdSetupTooltip::project(results, 13).valueFor("Sell Setup"), "9");
    EXPECT_EQ(TdSetupTooltip::project(results, 1000).valueFor("Sell Setup"), "9");
    EXPECT_EQ(TdSetupTooltip::project(results, -1).valueFor("Sell Setup"), "9");
}

TEST_F(TdSetupTooltipTest, EmptyResultsUsePlaceholders) {
    SetupResults empty;
    auto payload = TdSetupTooltip::project(empty, 0, "TD Setup Close");

    EXPECT_EQ(payload.name, "TD Setup Close");
    ASSERT_EQ(payload.values.size(), 2u);
    EXPECT_EQ(payload.values[0].value, TdSetupTooltip::kPlaceholder);
    EXPECT_EQ(payload.values[1].value, TdSetupTooltip::kPlaceholder);
    EXPECT_FALSE(TdSetupTooltip::resolveIndex(empty, 0).has_value());
}

TEST_F(TdSetupTooltipTest, BuySetupIsRendered) {
    auto falling = TdSetupCalculator::calculate(fallingBars(7), TdSetupVariant{});
    auto payload = TdSetupTooltip::project(falling, std::nullopt);

    EXPECT_EQ(payload.valueFor("Sell Setup"), "--");
    EXPECT_EQ(payload.valueFor("Buy Setup"), "3");
}

TEST_F(TdSetupTooltipTest, UnknownTitleIsEmpty) {
    auto payload = TdSetupTooltip::project(results, std::nullopt);
    EXPECT_TRUE(payload.valueFor("Countdown").empty());
}
