#pragma once

#include <string>
#include <chrono>
#include <optional>
#include <vector>
#include <map>
#include <cstdint>

namespace lumen {

// Time types
using Timestamp = std::chrono::time_point<std::chrono::steady_clock>;
using WallClock = std::chrono::time_point<std::chrono::system_clock>;
using Duration = std::chrono::nanoseconds;

inline Timestamp now() {
    return std::chrono::steady_clock::now();
}

inline WallClock wall_now() {
    return std::chrono::system_clock::now();
}

inline int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

using Price = double;
using Size = double;
using Notional = double;

enum class Side {
    BUY,
    SELL
};

inline std::string side_to_string(Side s) {
    return s == Side::BUY ? "buy" : "sell";
}

inline Side side_from_string(const std::string& s) {
    return s == "sell" ? Side::SELL : Side::BUY;
}

enum class OrderType {
    MARKET,
    LIMIT
};

inline std::string order_type_to_string(OrderType t) {
    switch (t) {
        case OrderType::MARKET: return "market";
        case OrderType::LIMIT: return "limit";
    }
    return "market";
}

inline OrderType order_type_from_string(const std::string& s) {
    return s == "limit" ? OrderType::LIMIT : OrderType::MARKET;
}

enum class OrderStatus {
    PENDING,
    OPEN,
    FILLED,
    CANCELED,
    REJECTED
};

inline std::string order_status_to_string(OrderStatus s) {
    switch (s) {
        case OrderStatus::PENDING: return "pending";
        case OrderStatus::OPEN: return "open";
        case OrderStatus::FILLED: return "filled";
        case OrderStatus::CANCELED: return "canceled";
        case OrderStatus::REJECTED: return "rejected";
    }
    return "pending";
}

inline OrderStatus order_status_from_string(const std::string& s) {
    if (s == "open") return OrderStatus::OPEN;
    if (s == "filled") return OrderStatus::FILLED;
    if (s == "canceled") return OrderStatus::CANCELED;
    if (s == "rejected") return OrderStatus::REJECTED;
    return OrderStatus::PENDING;
}

// Trading mode, chosen once at startup
enum class TradingMode {
    PAPER,    // Simulated execution
    LIVE      // Real orders
};

inline std::string mode_to_string(TradingMode m) {
    return m == TradingMode::LIVE ? "live" : "paper";
}

inline TradingMode mode_from_string(const std::string& s) {
    return s == "live" ? TradingMode::LIVE : TradingMode::PAPER;
}

enum class SignalAction {
    BUY,
    SELL,
    HOLD
};

inline std::string action_to_string(SignalAction a) {
    switch (a) {
        case SignalAction::BUY: return "BUY";
        case SignalAction::SELL: return "SELL";
        case SignalAction::HOLD: return "HOLD";
    }
    return "HOLD";
}

inline SignalAction action_from_string(const std::string& s) {
    if (s == "BUY" || s == "buy") return SignalAction::BUY;
    if (s == "SELL" || s == "sell") return SignalAction::SELL;
    return SignalAction::HOLD;
}

// Top of book for one symbol
struct Ticker {
    std::string symbol;
    Price bid{0.0};
    Price ask{0.0};
    Price last{0.0};
    std::optional<double> volume_24h;
    int64_t time{0};  // epoch ms
};

struct Candle {
    std::string symbol;
    std::string interval;
    int64_t time{0};  // epoch ms, candle open
    Price open{0.0};
    Price high{0.0};
    Price low{0.0};
    Price close{0.0};
    double volume{0.0};
};

// Signal from an upstream strategy
struct Signal {
    SignalAction action{SignalAction::HOLD};
    double confidence{0.0};  // 0.0 to 1.0
    std::string reason;
};

struct Position {
    std::string symbol;
    Size quantity{0.0};
    Price avg_entry_price{0.0};
    Price market_price{0.0};
};

/**
 * Read-only account view handed to every guard in one evaluation cycle.
 */
struct AccountSnapshot {
    double cash_usd{0.0};
    double realized_pnl_usd{0.0};
    double unrealized_pnl_usd{0.0};
    std::vector<Position> open_positions;
    std::map<std::string, int64_t> last_stop_out_at;  // symbol -> epoch ms

    const Position* find_position(const std::string& symbol) const {
        for (const auto& p : open_positions) {
            if (p.symbol == symbol) return &p;
        }
        return nullptr;
    }
};

enum class BlockedBy {
    KILL_SWITCH,
    LIVE_DISABLED,
    PAIR_NOT_WHITELISTED,
    MAX_DAILY_LOSS,
    MAX_OPEN_POSITIONS,
    MAX_POSITION_USD,
    COOLDOWN,
    MIN_VOLUME,
    SPREAD_GUARD,
    SLIPPAGE_GUARD,
    MAX_LEVERAGE,
    VOLATILITY_CIRCUIT_BREAKER,
    EVENT_LOCKOUT
};

inline std::string blocked_by_to_string(BlockedBy b) {
    switch (b) {
        case BlockedBy::KILL_SWITCH: return "kill_switch";
        case BlockedBy::LIVE_DISABLED: return "live_disabled";
        case BlockedBy::PAIR_NOT_WHITELISTED: return "pair_not_whitelisted";
        case BlockedBy::MAX_DAILY_LOSS: return "max_daily_loss";
        case BlockedBy::MAX_OPEN_POSITIONS: return "max_open_positions";
        case BlockedBy::MAX_POSITION_USD: return "max_position_usd";
        case BlockedBy::COOLDOWN: return "cooldown";
        case BlockedBy::MIN_VOLUME: return "min_volume";
        case BlockedBy::SPREAD_GUARD: return "spread_guard";
        case BlockedBy::SLIPPAGE_GUARD: return "slippage_guard";
        case BlockedBy::MAX_LEVERAGE: return "max_leverage";
        case BlockedBy::VOLATILITY_CIRCUIT_BREAKER: return "volatility_circuit_breaker";
        case BlockedBy::EVENT_LOCKOUT: return "event_lockout";
    }
    return "unknown";
}

struct RiskDecision {
    bool allowed{false};
    std::string reason;
    std::optional<BlockedBy> blocked_by;

    static RiskDecision allow(const std::string& reason) {
        return RiskDecision{true, reason, std::nullopt};
    }

    static RiskDecision block(const std::string& reason,
                              std::optional<BlockedBy> code = std::nullopt) {
        return RiskDecision{false, reason, code};
    }
};

struct Balance {
    std::string asset;
    double free{0.0};
    double locked{0.0};
};

struct OrderRequest {
    std::string symbol;
    Side side{Side::BUY};
    OrderType type{OrderType::MARKET};
    Size quantity{0.0};
    std::optional<Price> price;
    std::string client_order_id;
};

} // namespace lumen
