#include "config/config.hpp"
#include "common/errors.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cstdlib>
#include <spdlog/spdlog.h>

namespace lumen {

void to_json(nlohmann::json& j, const RiskConfig& c) {
    j = nlohmann::json{
        {"max_daily_loss_usd", c.max_daily_loss_usd},
        {"max_position_usd", c.max_position_usd},
        {"max_open_positions", c.max_open_positions},
        {"cooldown_minutes", c.cooldown_minutes},
        {"min_order_usd", c.min_order_usd},
        {"allowed_pairs", c.allowed_pairs},
        {"max_leverage", c.max_leverage}
    };
}

void from_json(const nlohmann::json& j, RiskConfig& c) {
    if (j.contains("max_daily_loss_usd")) j.at("max_daily_loss_usd").get_to(c.max_daily_loss_usd);
    if (j.contains("max_position_usd")) j.at("max_position_usd").get_to(c.max_position_usd);
    if (j.contains("max_open_positions")) j.at("max_open_positions").get_to(c.max_open_positions);
    if (j.contains("cooldown_minutes")) j.at("cooldown_minutes").get_to(c.cooldown_minutes);
    if (j.contains("min_order_usd")) j.at("min_order_usd").get_to(c.min_order_usd);
    if (j.contains("allowed_pairs")) j.at("allowed_pairs").get_to(c.allowed_pairs);
    if (j.contains("max_leverage")) j.at("max_leverage").get_to(c.max_leverage);
}

void to_json(nlohmann::json& j, const GuardConfig& c) {
    j = nlohmann::json{
        {"max_spread_bps", c.max_spread_bps},
        {"max_slippage_bps", c.max_slippage_bps},
        {"min_volume", c.min_volume},
        {"volatility_atr_threshold", c.volatility_atr_threshold},
        {"event_lockout_enabled", c.event_lockout_enabled}
    };
}

void from_json(const nlohmann::json& j, GuardConfig& c) {
    if (j.contains("max_spread_bps")) j.at("max_spread_bps").get_to(c.max_spread_bps);
    if (j.contains("max_slippage_bps")) j.at("max_slippage_bps").get_to(c.max_slippage_bps);
    if (j.contains("min_volume")) j.at("min_volume").get_to(c.min_volume);
    if (j.contains("volatility_atr_threshold")) j.at("volatility_atr_threshold").get_to(c.volatility_atr_threshold);
    if (j.contains("event_lockout_enabled")) j.at("event_lockout_enabled").get_to(c.event_lockout_enabled);
}

void to_json(nlohmann::json& j, const KillSwitchLimits& c) {
    j = nlohmann::json{
        {"max_drawdown_pct", c.max_drawdown_pct},
        {"max_consecutive_losses", c.max_consecutive_losses},
        {"api_error_threshold", c.api_error_threshold},
        {"spread_violations_limit", c.spread_violations_limit},
        {"spread_violations_window_min", c.spread_violations_window_min}
    };
}

void from_json(const nlohmann::json& j, KillSwitchLimits& c) {
    if (j.contains("max_drawdown_pct")) j.at("max_drawdown_pct").get_to(c.max_drawdown_pct);
    if (j.contains("max_consecutive_losses")) j.at("max_consecutive_losses").get_to(c.max_consecutive_losses);
    if (j.contains("api_error_threshold")) j.at("api_error_threshold").get_to(c.api_error_threshold);
    if (j.contains("spread_violations_limit")) j.at("spread_violations_limit").get_to(c.spread_violations_limit);
    if (j.contains("spread_violations_window_min")) j.at("spread_violations_window_min").get_to(c.spread_violations_window_min);
}

void to_json(nlohmann::json& j, const CircuitBreakerConfig& c) {
    j = nlohmann::json{
        {"max_consecutive_failures", c.max_consecutive_failures},
        {"reset_timeout_ms", c.reset_timeout_ms}
    };
}

void from_json(const nlohmann::json& j, CircuitBreakerConfig& c) {
    if (j.contains("max_consecutive_failures")) j.at("max_consecutive_failures").get_to(c.max_consecutive_failures);
    if (j.contains("reset_timeout_ms")) j.at("reset_timeout_ms").get_to(c.reset_timeout_ms);
}

void to_json(nlohmann::json& j, const RetryConfig& c) {
    j = nlohmann::json{
        {"max_attempts", c.max_attempts},
        {"base_delay_ms", c.base_delay_ms}
    };
}

void from_json(const nlohmann::json& j, RetryConfig& c) {
    if (j.contains("max_attempts")) j.at("max_attempts").get_to(c.max_attempts);
    if (j.contains("base_delay_ms")) j.at("base_delay_ms").get_to(c.base_delay_ms);
}

void to_json(nlohmann::json& j, const AnomalyConfig& c) {
    j = nlohmann::json{
        {"volume_spike_threshold", c.volume_spike_threshold},
        {"spread_blowout_bps", c.spread_blowout_bps},
        {"price_gap_threshold", c.price_gap_threshold},
        {"wick_anomaly_ratio", c.wick_anomaly_ratio},
        {"stale_data_multiplier", c.stale_data_multiplier},
        {"min_candles", c.min_candles}
    };
}

void from_json(const nlohmann::json& j, AnomalyConfig& c) {
    if (j.contains("volume_spike_threshold")) j.at("volume_spike_threshold").get_to(c.volume_spike_threshold);
    if (j.contains("spread_blowout_bps")) j.at("spread_blowout_bps").get_to(c.spread_blowout_bps);
    if (j.contains("price_gap_threshold")) j.at("price_gap_threshold").get_to(c.price_gap_threshold);
    if (j.contains("wick_anomaly_ratio")) j.at("wick_anomaly_ratio").get_to(c.wick_anomaly_ratio);
    if (j.contains("stale_data_multiplier")) j.at("stale_data_multiplier").get_to(c.stale_data_multiplier);
    if (j.contains("min_candles")) j.at("min_candles").get_to(c.min_candles);
}

void to_json(nlohmann::json& j, const PersistenceConfig& c) {
    j = nlohmann::json{{"db_path", c.db_path}};
}

void from_json(const nlohmann::json& j, PersistenceConfig& c) {
    if (j.contains("db_path")) j.at("db_path").get_to(c.db_path);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = nlohmann::json{
        {"log_dir", c.log_dir},
        {"log_level", c.log_level},
        {"log_to_console", c.log_to_console},
        {"log_to_file", c.log_to_file},
        {"json_format", c.json_format},
        {"max_log_file_size_mb", c.max_log_file_size_mb},
        {"max_log_files", c.max_log_files}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    if (j.contains("log_dir")) j.at("log_dir").get_to(c.log_dir);
    if (j.contains("log_level")) j.at("log_level").get_to(c.log_level);
    if (j.contains("log_to_console")) j.at("log_to_console").get_to(c.log_to_console);
    if (j.contains("log_to_file")) j.at("log_to_file").get_to(c.log_to_file);
    if (j.contains("json_format")) j.at("json_format").get_to(c.json_format);
    if (j.contains("max_log_file_size_mb")) j.at("max_log_file_size_mb").get_to(c.max_log_file_size_mb);
    if (j.contains("max_log_files")) j.at("max_log_files").get_to(c.max_log_files);
}

void to_json(nlohmann::json& j, const MetricsConfig& c) {
    j = nlohmann::json{
        {"prefix", c.prefix},
        {"export_path", c.export_path}
    };
}

void from_json(const nlohmann::json& j, MetricsConfig& c) {
    if (j.contains("prefix")) j.at("prefix").get_to(c.prefix);
    if (j.contains("export_path")) j.at("export_path").get_to(c.export_path);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"mode", mode_to_string(c.mode)},
        {"allow_live_trading", c.allow_live_trading},
        {"kill_switch", c.kill_switch},
        {"starting_cash_usd", c.starting_cash_usd},
        {"symbols", c.symbols},
        {"risk", c.risk},
        {"guards", c.guards},
        {"kill_switch_limits", c.kill_switch_limits},
        {"circuit_breaker", c.circuit_breaker},
        {"retry", c.retry},
        {"anomaly", c.anomaly},
        {"persistence", c.persistence},
        {"logging", c.logging},
        {"metrics", c.metrics}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("mode")) {
        std::string mode_str = j.at("mode").get<std::string>();
        if (mode_str != "paper" && mode_str != "live") {
            throw ValidationError("Unknown trading mode: " + mode_str);
        }
        c.mode = mode_from_string(mode_str);
    }
    if (j.contains("allow_live_trading")) j.at("allow_live_trading").get_to(c.allow_live_trading);
    if (j.contains("kill_switch")) j.at("kill_switch").get_to(c.kill_switch);
    if (j.contains("starting_cash_usd")) j.at("starting_cash_usd").get_to(c.starting_cash_usd);
    if (j.contains("symbols")) j.at("symbols").get_to(c.symbols);
    if (j.contains("risk")) j.at("risk").get_to(c.risk);
    if (j.contains("guards")) j.at("guards").get_to(c.guards);
    if (j.contains("kill_switch_limits")) j.at("kill_switch_limits").get_to(c.kill_switch_limits);
    if (j.contains("circuit_breaker")) j.at("circuit_breaker").get_to(c.circuit_breaker);
    if (j.contains("retry")) j.at("retry").get_to(c.retry);
    if (j.contains("anomaly")) j.at("anomaly").get_to(c.anomaly);
    if (j.contains("persistence")) j.at("persistence").get_to(c.persistence);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
    if (j.contains("metrics")) j.at("metrics").get_to(c.metrics);
}

namespace {

bool parse_bool(const std::string& v, bool fallback) {
    if (v.empty()) return fallback;
    std::string s = v;
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    return s == "1" || s == "true" || s == "yes" || s == "on";
}

std::vector<std::string> parse_symbols(const std::string& v) {
    std::vector<std::string> out;
    std::stringstream ss(v);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item.erase(std::remove(item.begin(), item.end(), ' '), item.end());
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

} // namespace

void Config::apply_env_overrides() {
    std::string mode_str = get_env("LUMEN_MODE");
    if (!mode_str.empty()) {
        if (mode_str != "paper" && mode_str != "live") {
            throw ValidationError("LUMEN_MODE must be paper or live, got: " + mode_str);
        }
        mode = mode_from_string(mode_str);
    }

    allow_live_trading = parse_bool(get_env("LUMEN_ALLOW_LIVE_TRADING"), allow_live_trading);
    kill_switch = parse_bool(get_env("LUMEN_KILL_SWITCH"), kill_switch);

    std::string db = get_env("LUMEN_DB_PATH");
    if (!db.empty()) persistence.db_path = db;

    std::string level = get_env("LUMEN_LOG_LEVEL");
    if (!level.empty()) logging.log_level = level;

    std::string syms = get_env("LUMEN_SYMBOLS");
    if (!syms.empty()) symbols = parse_symbols(syms);
}

Config Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ValidationError("Malformed config " + path + ": " + e.what());
    }

    Config config;
    from_json(j, config);
    config.apply_env_overrides();

    if (!config.validate()) {
        throw ValidationError("Invalid configuration in: " + path);
    }

    return config;
}

void Config::save(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to create config file: " + path);
    }

    nlohmann::json j;
    to_json(j, *this);
    file << j.dump(2);
}

bool Config::validate() const {
    if (starting_cash_usd <= 0) {
        spdlog::error("starting_cash_usd must be positive");
        return false;
    }

    if (risk.max_position_usd <= 0) {
        spdlog::error("risk.max_position_usd must be positive");
        return false;
    }

    if (risk.max_daily_loss_usd <= 0) {
        spdlog::error("risk.max_daily_loss_usd must be positive");
        return false;
    }

    if (risk.max_open_positions < 1) {
        spdlog::error("risk.max_open_positions must be at least 1");
        return false;
    }

    if (risk.min_order_usd < 0 || risk.cooldown_minutes < 0) {
        spdlog::error("risk.min_order_usd and risk.cooldown_minutes must be non-negative");
        return false;
    }

    if (risk.min_order_usd > risk.max_position_usd) {
        spdlog::warn("risk.min_order_usd exceeds max_position_usd, every BUY will be blocked");
    }

    if (kill_switch_limits.max_drawdown_pct <= 0 ||
        kill_switch_limits.max_consecutive_losses < 1 ||
        kill_switch_limits.api_error_threshold < 1 ||
        kill_switch_limits.spread_violations_limit < 1 ||
        kill_switch_limits.spread_violations_window_min < 1) {
        spdlog::error("kill_switch_limits thresholds must be positive");
        return false;
    }

    if (circuit_breaker.max_consecutive_failures < 1 || circuit_breaker.reset_timeout_ms <= 0) {
        spdlog::error("circuit_breaker settings must be positive");
        return false;
    }

    if (retry.max_attempts < 1 || retry.base_delay_ms < 0) {
        spdlog::error("retry.max_attempts must be >= 1 and base_delay_ms >= 0");
        return false;
    }

    if (anomaly.min_candles < 2) {
        spdlog::error("anomaly.min_candles must be at least 2");
        return false;
    }

    if (mode == TradingMode::LIVE && symbols.empty()) {
        spdlog::error("live mode requires at least one symbol");
        return false;
    }

    if (mode == TradingMode::LIVE && !allow_live_trading) {
        spdlog::warn("mode=live without allow_live_trading, every signal will be blocked");
    }

    return true;
}

std::string Config::get_env(const std::string& name, const std::string& default_val) {
    const char* val = std::getenv(name.c_str());
    return val ? std::string(val) : default_val;
}

} // namespace lumen
