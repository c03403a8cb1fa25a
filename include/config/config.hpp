#pragma once

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>
#include "common/types.hpp"

namespace lumen {

struct RiskConfig {
    double max_daily_loss_usd{150.0};        // Realized + unrealized floor
    double max_position_usd{250.0};          // Per-symbol notional cap
    int max_open_positions{2};               // Distinct symbols held
    int cooldown_minutes{15};                // After a losing close
    double min_order_usd{25.0};              // Floor for sized notional
    std::vector<std::string> allowed_pairs;  // Empty = all pairs
    double max_leverage{1.0};                // Spot only by default
};

struct GuardConfig {
    double max_spread_bps{25.0};
    double max_slippage_bps{20.0};
    double min_volume{0.0};                  // 24h volume floor
    double volatility_atr_threshold{2.5};    // Current ATR vs median ATR
    bool event_lockout_enabled{true};
};

struct KillSwitchLimits {
    double max_drawdown_pct{5.0};
    int max_consecutive_losses{3};
    int api_error_threshold{5};
    int spread_violations_limit{3};
    int spread_violations_window_min{10};
};

struct CircuitBreakerConfig {
    int max_consecutive_failures{5};
    int64_t reset_timeout_ms{5 * 60 * 1000};
};

struct RetryConfig {
    int max_attempts{3};
    int64_t base_delay_ms{200};              // Linear: base * attempt
};

struct AnomalyConfig {
    double volume_spike_threshold{3.0};      // Current / median volume
    double spread_blowout_bps{50.0};
    double price_gap_threshold{0.02};        // 2%
    double wick_anomaly_ratio{5.0};          // Wick / body
    double stale_data_multiplier{3.0};       // Expected intervals
    int min_candles{20};
};

struct PersistenceConfig {
    std::string db_path{"./data/lumen.sqlite"};
};

struct LoggingConfig {
    std::string log_dir{"./logs"};
    std::string log_level{"info"};           // debug, info, warn, error
    bool log_to_console{true};
    bool log_to_file{true};
    bool json_format{true};                  // JSON lines format
    int max_log_file_size_mb{100};
    int max_log_files{5};
};

struct MetricsConfig {
    std::string prefix{"lumen"};
    std::string export_path;                 // Empty = no file export
};

struct Config {
    TradingMode mode{TradingMode::PAPER};
    bool allow_live_trading{false};
    bool kill_switch{false};                 // Static operator halt for live mode
    double starting_cash_usd{10000.0};
    std::vector<std::string> symbols{"BTC-USD", "ETH-USD"};

    RiskConfig risk;
    GuardConfig guards;
    KillSwitchLimits kill_switch_limits;
    CircuitBreakerConfig circuit_breaker;
    RetryConfig retry;
    AnomalyConfig anomaly;
    PersistenceConfig persistence;
    LoggingConfig logging;
    MetricsConfig metrics;

    // Load from file, apply environment overrides, validate
    static Config load(const std::string& path);

    // Save to file
    void save(const std::string& path) const;

    // Overlay LUMEN_* environment variables
    void apply_env_overrides();

    // Validate configuration
    bool validate() const;

    // Get environment variable with default
    static std::string get_env(const std::string& name, const std::string& default_val = "");
};

// JSON serialization
void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);

} // namespace lumen
