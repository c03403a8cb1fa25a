#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "execution/order.hpp"
#include "persistence/order_store.hpp"
#include "utils/alerter.hpp"
#include "utils/crypto.hpp"
#include "utils/time_utils.hpp"
#include "test_helpers.hpp"
#include <filesystem>
#include <fstream>

using namespace lumen;
using namespace lumen::testing_helpers;

// ============================================================================
// Time
// ============================================================================

TEST(TimeUtilsTest, IsoRoundTrip) {
    EXPECT_EQ(time_utils::to_iso8601(T0), "2023-11-14T22:13:20.000Z");
    EXPECT_EQ(time_utils::parse_iso8601_ms("2023-11-14T22:13:20.250Z"), T0 + 250);
    EXPECT_THROW(time_utils::parse_iso8601_ms("yesterday"), ValidationError);
}

TEST(TimeUtilsTest, Intervals) {
    EXPECT_EQ(time_utils::interval_to_ms("1m"), 60000);
    EXPECT_EQ(time_utils::interval_to_ms("15m"), 15 * 60000);
    EXPECT_EQ(time_utils::interval_to_ms("4h"), 4 * 3600000);
    EXPECT_EQ(time_utils::interval_to_ms("1d"), 86400000);
    EXPECT_EQ(time_utils::interval_to_ms("1w"), 0);
    EXPECT_EQ(time_utils::interval_to_ms(""), 0);
}

// ============================================================================
// Ids
// ============================================================================

TEST(CryptoTest, UuidFormat) {
    std::string a = crypto::uuid_v4();
    std::string b = crypto::uuid_v4();
    EXPECT_EQ(a.length(), 36u);
    EXPECT_NE(a, b);
    EXPECT_EQ(a[14], '4');
}

TEST(CryptoTest, ClientOrderIdFormat) {
    std::string id = generate_client_order_id("BTC-USD", Side::BUY, T0);
    EXPECT_EQ(id.rfind("BTC-USD-buy-1700000000000-", 0), 0u);
    EXPECT_EQ(id.size(), std::string("BTC-USD-buy-1700000000000-").size() + 8);
    EXPECT_NE(id, generate_client_order_id("BTC-USD", Side::BUY, T0));
}

// ============================================================================
// Order store
// ============================================================================

TEST(InMemoryOrderStoreTest, UpsertReplacesByClientId) {
    InMemoryOrderStore store;
    Order o;
    o.client_order_id = "c1";
    o.order_id = "o1";
    o.symbol = "BTC-USD";
    o.status = OrderStatus::OPEN;
    store.upsert(o);

    o.mark_filled(50000.0, T0);
    store.upsert(o);

    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(store.get_by_order_id("o1")->status, OrderStatus::FILLED);
    EXPECT_TRUE(store.open_orders().empty());
}

// ============================================================================
// Alerts
// ============================================================================

namespace {

class CountingChannel : public AlertChannel {
public:
    bool send(const Alert& alert) override {
        titles.push_back(alert.title);
        return true;
    }
    std::string name() const override { return "counting"; }
    bool is_available() const override { return true; }

    std::vector<std::string> titles;
};

class BrokenChannel : public AlertChannel {
public:
    bool send(const Alert&) override { throw std::runtime_error("smtp down"); }
    std::string name() const override { return "broken"; }
    bool is_available() const override { return true; }
};

} // namespace

TEST(AlerterTest, DeduplicatesSameTitleAndSeverity) {
    Alerter alerter;
    auto channel = std::make_shared<CountingChannel>();
    alerter.add_channel(channel);

    alerter.notify(AlertSeverity::WARNING, "Spread blowout", "400 bps");
    alerter.notify(AlertSeverity::WARNING, "Spread blowout", "410 bps");
    alerter.notify(AlertSeverity::CRITICAL, "Spread blowout", "420 bps");

    EXPECT_EQ(channel->titles.size(), 2u);
    EXPECT_EQ(alerter.alerts_dropped(), 1);
}

TEST(AlerterTest, MinSeverityPerChannel) {
    Alerter::Config config;
    config.deduplicate = false;
    Alerter alerter(config);
    auto channel = std::make_shared<CountingChannel>();
    alerter.add_channel(channel, AlertSeverity::ERROR);

    alerter.notify(AlertSeverity::INFO, "a", "");
    alerter.notify(AlertSeverity::CRITICAL, "b", "");
    ASSERT_EQ(channel->titles.size(), 1u);
    EXPECT_EQ(channel->titles[0], "b");
}

TEST(AlerterTest, BrokenChannelDoesNotBlockOthers) {
    Alerter alerter;
    auto channel = std::make_shared<CountingChannel>();
    alerter.add_channel(std::make_shared<BrokenChannel>());
    alerter.add_channel(channel);

    alerter.notify(AlertSeverity::CRITICAL, "Kill switch triggered", "3 consecutive losses");
    EXPECT_EQ(channel->titles.size(), 1u);
    EXPECT_EQ(alerter.alerts_sent(), 1);
}

TEST(AlerterTest, LogFileChannelWritesJsonLines) {
    std::string path = "/tmp/test_lumen_alerts_" + crypto::uuid_v4() + ".jsonl";
    {
        LogFileChannel channel(path);
        Alert alert;
        alert.id = "ALT-1";
        alert.severity = AlertSeverity::ERROR;
        alert.title = "Order submission failed";
        alert.message = "TRANSIENT: 503";
        alert.metadata = {{"symbol", "BTC-USD"}};
        EXPECT_TRUE(channel.send(alert));
    }

    std::ifstream in(path);
    std::string line;
    ASSERT_TRUE(std::getline(in, line));
    EXPECT_NE(line.find("\"title\":\"Order submission failed\""), std::string::npos);
    EXPECT_NE(line.find("\"severity\":\"ERROR\""), std::string::npos);
    std::filesystem::remove(path);
}
