#include <gtest/gtest.h>
#include "position/account_book.hpp"
#include "test_helpers.hpp"

using namespace lumen;
using namespace lumen::testing_helpers;

namespace {

Order filled(Side side, Size qty, Price price, const std::string& symbol = "BTC-USD") {
    Order o;
    o.client_order_id = "cid";
    o.symbol = symbol;
    o.side = side;
    o.quantity = qty;
    o.mark_filled(price, T0);
    return o;
}

} // namespace

TEST(AccountBookTest, StartsFlat) {
    AccountBook book(10000.0);
    EXPECT_DOUBLE_EQ(book.equity(), 10000.0);
    EXPECT_DOUBLE_EQ(book.peak_equity(), 10000.0);
    EXPECT_TRUE(book.open_positions().empty());
}

TEST(AccountBookTest, BuyOpensAndAveragesPosition) {
    AccountBook book(10000.0);
    book.apply_fill(filled(Side::BUY, 1.0, 100.0));
    book.apply_fill(filled(Side::BUY, 1.0, 200.0));

    auto pos = book.get_position("BTC-USD");
    ASSERT_TRUE(pos.has_value());
    EXPECT_DOUBLE_EQ(pos->quantity, 2.0);
    EXPECT_DOUBLE_EQ(pos->avg_entry_price, 150.0);
    EXPECT_DOUBLE_EQ(book.cash(), 9700.0);
}

TEST(AccountBookTest, NonFilledOrdersIgnored) {
    AccountBook book(10000.0);
    Order pending;
    pending.symbol = "BTC-USD";
    pending.quantity = 1.0;
    pending.status = OrderStatus::PENDING;
    EXPECT_FALSE(book.apply_fill(pending).has_value());
    EXPECT_DOUBLE_EQ(book.cash(), 10000.0);
}

TEST(AccountBookTest, WinningSellBooksProfit) {
    AccountBook book(10000.0);
    book.apply_fill(filled(Side::BUY, 2.0, 100.0));
    auto trade = book.apply_fill(filled(Side::SELL, 2.0, 110.0), T0);

    ASSERT_TRUE(trade.has_value());
    EXPECT_TRUE(trade->won());
    EXPECT_DOUBLE_EQ(trade->realized_pnl, 20.0);
    EXPECT_FALSE(book.get_position("BTC-USD").has_value());
    EXPECT_DOUBLE_EQ(book.equity(), 10020.0);
    EXPECT_EQ(book.wins(), 1);
    EXPECT_TRUE(book.snapshot().last_stop_out_at.empty());
}

TEST(AccountBookTest, LosingSellStampsStopOut) {
    AccountBook book(10000.0);
    book.apply_fill(filled(Side::BUY, 1.0, 100.0));
    auto trade = book.apply_fill(filled(Side::SELL, 1.0, 90.0), T0 + 5);

    ASSERT_TRUE(trade.has_value());
    EXPECT_FALSE(trade->won());
    auto snap = book.snapshot();
    EXPECT_DOUBLE_EQ(snap.realized_pnl_usd, -10.0);
    ASSERT_EQ(snap.last_stop_out_at.count("BTC-USD"), 1u);
    EXPECT_EQ(snap.last_stop_out_at.at("BTC-USD"), T0 + 5);
}

TEST(AccountBookTest, SellClosesAtMostHeldQuantity) {
    AccountBook book(10000.0);
    book.apply_fill(filled(Side::BUY, 1.0, 100.0));
    auto trade = book.apply_fill(filled(Side::SELL, 3.0, 100.0));
    ASSERT_TRUE(trade.has_value());
    EXPECT_DOUBLE_EQ(trade->quantity, 1.0);
    EXPECT_DOUBLE_EQ(book.cash(), 10000.0);
}

TEST(AccountBookTest, SellWithoutPositionIgnored) {
    AccountBook book(10000.0);
    EXPECT_FALSE(book.apply_fill(filled(Side::SELL, 1.0, 100.0)).has_value());
}

TEST(AccountBookTest, MarkToMarketTracksPeakAndUnrealized) {
    AccountBook book(10000.0);
    book.apply_fill(filled(Side::BUY, 10.0, 100.0));

    book.mark_to_market("BTC-USD", 150.0);
    EXPECT_DOUBLE_EQ(book.unrealized_pnl(), 500.0);
    EXPECT_DOUBLE_EQ(book.peak_equity(), 10500.0);

    book.mark_to_market("BTC-USD", 80.0);
    EXPECT_DOUBLE_EQ(book.equity(), 9800.0);
    EXPECT_DOUBLE_EQ(book.peak_equity(), 10500.0);
    EXPECT_DOUBLE_EQ(book.snapshot().unrealized_pnl_usd, -200.0);
}

TEST(AccountBookTest, DailyResetKeepsTotal) {
    AccountBook book(10000.0);
    book.apply_fill(filled(Side::BUY, 1.0, 100.0));
    book.apply_fill(filled(Side::SELL, 1.0, 90.0));
    book.reset_daily_pnl();
    EXPECT_DOUBLE_EQ(book.daily_realized_pnl(), 0.0);
    EXPECT_DOUBLE_EQ(book.realized_pnl(), -10.0);
}
