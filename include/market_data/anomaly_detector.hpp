#pragma once

#include <string>
#include <vector>
#include "common/types.hpp"
#include "config/config.hpp"

namespace lumen {

enum class AnomalyType {
    VOLUME_SPIKE,
    SPREAD_BLOWOUT,
    PRICE_GAP,
    WICK_ANOMALY,
    STALE_DATA
};

enum class AnomalySeverity {
    LOW,
    MEDIUM,
    HIGH
};

std::string anomaly_type_to_string(AnomalyType t);
std::string anomaly_severity_to_string(AnomalySeverity s);

struct Anomaly {
    AnomalyType type;
    AnomalySeverity severity;
    std::string message;
    double value{0.0};       // Observed value
    double threshold{0.0};
    int64_t timestamp{0};    // epoch ms
};

/**
 * Statistical outlier checks over candle and ticker history.
 *
 * Flags, never blocks: callers decide what to do with a result. Every
 * candle check returns nothing below min_candles of history.
 */
class AnomalyDetector {
public:
    static constexpr size_t VOLUME_LOOKBACK = 50;

    explicit AnomalyDetector(const AnomalyConfig& config = AnomalyConfig{});

    // Volume spike, price gap, wick anomaly and (after the first call) stale data
    std::vector<Anomaly> check_candles(const std::vector<Candle>& candles, int64_t now = now_ms());

    // Spread blowout
    std::vector<Anomaly> check_ticker(const Ticker& ticker) const;

    std::vector<Anomaly> check_volume_spike(const std::vector<Candle>& candles) const;
    std::vector<Anomaly> check_price_gap(const std::vector<Candle>& candles) const;
    std::vector<Anomaly> check_wick(const std::vector<Candle>& candles) const;

    const AnomalyConfig& config() const { return config_; }

private:
    AnomalyConfig config_;
    int64_t last_candle_time_{0};

    bool has_history(const std::vector<Candle>& candles) const;
    std::vector<Anomaly> check_stale(const std::vector<Candle>& candles, int64_t now) const;
};

} // namespace lumen
