#include <gtest/gtest.h>
#include "market_data/anomaly_detector.hpp"
#include "test_helpers.hpp"

using namespace lumen;
using namespace lumen::testing_helpers;

class AnomalyDetectorTest : public ::testing::Test {
protected:
    AnomalyConfig config_;
    AnomalyDetector detector_{config_};
};

TEST_F(AnomalyDetectorTest, TooFewCandlesReturnsEmpty) {
    auto candles = flat_candles(19);
    candles.back().volume = 1000.0;
    EXPECT_TRUE(detector_.check_candles(candles, T0).empty());
    EXPECT_TRUE(detector_.check_volume_spike(candles).empty());
    EXPECT_TRUE(detector_.check_price_gap(candles).empty());
    EXPECT_TRUE(detector_.check_wick(candles).empty());
}

TEST_F(AnomalyDetectorTest, QuietMarketHasNoAnomalies) {
    auto candles = flat_candles(60);
    EXPECT_TRUE(detector_.check_candles(candles, candles.back().time).empty());
}

TEST_F(AnomalyDetectorTest, VolumeSpikeAgainstMedian) {
    auto candles = flat_candles(60);
    candles.back().volume = 60.0;

    auto found = detector_.check_volume_spike(candles);
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].type, AnomalyType::VOLUME_SPIKE);
    EXPECT_EQ(found[0].severity, AnomalySeverity::HIGH);
    EXPECT_DOUBLE_EQ(found[0].value, 6.0);
}

TEST_F(AnomalyDetectorTest, ModerateVolumeSpikeIsLow) {
    auto candles = flat_candles(60);
    candles.back().volume = 32.0;
    auto found = detector_.check_volume_spike(candles);
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].severity, AnomalySeverity::MEDIUM);
}

TEST_F(AnomalyDetectorTest, PriceGapBetweenCandles) {
    auto candles = flat_candles(30);
    Candle& c = candles.back();
    c.open = 106.0;
    c.high = 107.0;
    c.low = 105.5;
    c.close = 106.5;

    auto found = detector_.check_price_gap(candles);
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].type, AnomalyType::PRICE_GAP);
    EXPECT_EQ(found[0].severity, AnomalySeverity::HIGH);
}

TEST_F(AnomalyDetectorTest, SmallGapIgnored) {
    auto candles = flat_candles(30);
    EXPECT_TRUE(detector_.check_price_gap(candles).empty());   // 0.5%
}

TEST_F(AnomalyDetectorTest, ExtremeWick) {
    auto candles = flat_candles(30);
    Candle& c = candles.back();
    c.open = 100.0;
    c.close = 100.1;
    c.high = 105.0;
    c.low = 95.0;

    auto found = detector_.check_wick(candles);
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].type, AnomalyType::WICK_ANOMALY);
    EXPECT_EQ(found[0].severity, AnomalySeverity::HIGH);
}

TEST_F(AnomalyDetectorTest, DojiIsNotAWickAnomaly) {
    auto candles = flat_candles(30);
    Candle& c = candles.back();
    c.open = 100.0;
    c.close = 100.0;
    c.high = 110.0;
    c.low = 90.0;
    EXPECT_TRUE(detector_.check_wick(candles).empty());
}

TEST_F(AnomalyDetectorTest, StaleDataOnlyAfterFirstCall) {
    auto candles = flat_candles(30);
    int64_t late = candles.back().time + 10 * MINUTE;

    auto first = detector_.check_candles(candles, late);
    EXPECT_TRUE(first.empty());

    auto second = detector_.check_candles(candles, late);
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(second[0].type, AnomalyType::STALE_DATA);
    EXPECT_EQ(second[0].severity, AnomalySeverity::HIGH);
}

TEST_F(AnomalyDetectorTest, FreshDataNotStale) {
    auto candles = flat_candles(30);
    detector_.check_candles(candles, candles.back().time);
    EXPECT_TRUE(detector_.check_candles(candles, candles.back().time + 2 * MINUTE).empty());
}

TEST_F(AnomalyDetectorTest, StaleUsesCandleSpacingWithoutInterval) {
    auto candles = flat_candles(30);
    for (auto& c : candles) c.interval.clear();
    int64_t late = candles.back().time + 4 * MINUTE;

    detector_.check_candles(candles, late);
    auto found = detector_.check_candles(candles, late);
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].severity, AnomalySeverity::MEDIUM);
}

// ============================================================================
// Ticker
// ============================================================================

TEST_F(AnomalyDetectorTest, SpreadBlowoutIsHigh) {
    auto found = detector_.check_ticker(make_ticker(49000, 51000, 50000));
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].type, AnomalyType::SPREAD_BLOWOUT);
    EXPECT_EQ(found[0].severity, AnomalySeverity::HIGH);
    EXPECT_DOUBLE_EQ(found[0].value, 400.0);
}

TEST_F(AnomalyDetectorTest, TightSpreadIsQuiet) {
    EXPECT_TRUE(detector_.check_ticker(tight_ticker()).empty());
}

TEST_F(AnomalyDetectorTest, MissingQuoteIsHighBlowout) {
    auto found = detector_.check_ticker(make_ticker(0, 0, 50000));
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].severity, AnomalySeverity::HIGH);
}
