#include "market_data/anomaly_detector.hpp"
#include "risk/guards.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace lumen {

std::string anomaly_type_to_string(AnomalyType t) {
    switch (t) {
        case AnomalyType::VOLUME_SPIKE: return "volume_spike";
        case AnomalyType::SPREAD_BLOWOUT: return "spread_blowout";
        case AnomalyType::PRICE_GAP: return "price_gap";
        case AnomalyType::WICK_ANOMALY: return "wick_anomaly";
        case AnomalyType::STALE_DATA: return "stale_data";
    }
    return "unknown";
}

std::string anomaly_severity_to_string(AnomalySeverity s) {
    switch (s) {
        case AnomalySeverity::LOW: return "low";
        case AnomalySeverity::MEDIUM: return "medium";
        case AnomalySeverity::HIGH: return "high";
    }
    return "low";
}

AnomalyDetector::AnomalyDetector(const AnomalyConfig& config)
    : config_(config)
{
}

bool AnomalyDetector::has_history(const std::vector<Candle>& candles) const {
    return candles.size() >= static_cast<size_t>(std::max(config_.min_candles, 2));
}

std::vector<Anomaly> AnomalyDetector::check_candles(const std::vector<Candle>& candles, int64_t now) {
    std::vector<Anomaly> anomalies;
    if (!has_history(candles)) return anomalies;

    auto append = [&anomalies](std::vector<Anomaly> found) {
        anomalies.insert(anomalies.end(), found.begin(), found.end());
    };

    append(check_volume_spike(candles));
    append(check_price_gap(candles));
    append(check_wick(candles));

    if (last_candle_time_ > 0) {
        append(check_stale(candles, now));
    }
    last_candle_time_ = candles.back().time;

    return anomalies;
}

std::vector<Anomaly> AnomalyDetector::check_volume_spike(const std::vector<Candle>& candles) const {
    std::vector<Anomaly> out;
    if (!has_history(candles)) return out;

    const Candle& latest = candles.back();
    size_t n = std::min(candles.size(), VOLUME_LOOKBACK);
    std::vector<double> volumes;
    volumes.reserve(n);
    for (auto it = candles.end() - n; it != candles.end(); ++it) {
        volumes.push_back(it->volume);
    }
    std::sort(volumes.begin(), volumes.end());
    double median = volumes[volumes.size() / 2];

    if (median <= 0) return out;

    double ratio = latest.volume / median;
    if (ratio > config_.volume_spike_threshold) {
        out.push_back(Anomaly{
            AnomalyType::VOLUME_SPIKE,
            ratio > 5 ? AnomalySeverity::HIGH : ratio > 3 ? AnomalySeverity::MEDIUM : AnomalySeverity::LOW,
            fmt::format("Volume {:.1f}x median ({:.0f} vs median {:.0f})", ratio, latest.volume, median),
            ratio,
            config_.volume_spike_threshold,
            latest.time
        });
    }
    return out;
}

std::vector<Anomaly> AnomalyDetector::check_price_gap(const std::vector<Candle>& candles) const {
    std::vector<Anomaly> out;
    if (!has_history(candles)) return out;

    const Candle& latest = candles.back();
    const Candle& prev = candles[candles.size() - 2];
    if (prev.close <= 0) return out;

    double gap = std::abs(latest.open - prev.close) / prev.close;
    if (gap > config_.price_gap_threshold) {
        out.push_back(Anomaly{
            AnomalyType::PRICE_GAP,
            gap > 0.05 ? AnomalySeverity::HIGH : gap > 0.03 ? AnomalySeverity::MEDIUM : AnomalySeverity::LOW,
            fmt::format("Price gap {:.1f}% between candles (${:.2f} -> ${:.2f})",
                        gap * 100, prev.close, latest.open),
            gap,
            config_.price_gap_threshold,
            latest.time
        });
    }
    return out;
}

std::vector<Anomaly> AnomalyDetector::check_wick(const std::vector<Candle>& candles) const {
    std::vector<Anomaly> out;
    if (!has_history(candles)) return out;

    const Candle& c = candles.back();
    double body = std::abs(c.close - c.open);
    double upper = c.high - std::max(c.close, c.open);
    double lower = std::min(c.close, c.open) - c.low;
    double wick = upper + lower;

    // Doji candles (zero body) are not flagged
    if (body <= 0) return out;

    double ratio = wick / body;
    if (ratio > config_.wick_anomaly_ratio) {
        out.push_back(Anomaly{
            AnomalyType::WICK_ANOMALY,
            ratio > 10 ? AnomalySeverity::HIGH : AnomalySeverity::MEDIUM,
            fmt::format("Extreme wicks: wick/body ratio {:.1f}x", ratio),
            ratio,
            config_.wick_anomaly_ratio,
            c.time
        });
    }
    return out;
}

std::vector<Anomaly> AnomalyDetector::check_stale(const std::vector<Candle>& candles, int64_t now) const {
    std::vector<Anomaly> out;

    const Candle& latest = candles.back();
    int64_t expected = time_utils::interval_to_ms(latest.interval);
    if (expected <= 0) {
        expected = latest.time - candles[candles.size() - 2].time;
    }
    if (expected <= 0) return out;

    int64_t since = now - latest.time;
    double intervals = static_cast<double>(since) / expected;
    if (intervals > config_.stale_data_multiplier) {
        out.push_back(Anomaly{
            AnomalyType::STALE_DATA,
            intervals > 5 ? AnomalySeverity::HIGH : AnomalySeverity::MEDIUM,
            fmt::format("No new candle for {} (expected every {})",
                        time_utils::format_duration_ms(since),
                        time_utils::format_duration_ms(expected)),
            intervals,
            config_.stale_data_multiplier,
            now
        });
    }
    return out;
}

std::vector<Anomaly> AnomalyDetector::check_ticker(const Ticker& ticker) const {
    std::vector<Anomaly> out;

    double spread_bps = compute_spread_bps(ticker);
    if (spread_bps > config_.spread_blowout_bps) {
        std::string message = std::isfinite(spread_bps)
            ? fmt::format("Spread blowout: {:.0f} bps (bid ${:.2f}, ask ${:.2f})",
                          spread_bps, ticker.bid, ticker.ask)
            : fmt::format("Spread blowout: no valid quote (bid ${:.2f}, ask ${:.2f})",
                          ticker.bid, ticker.ask);
        out.push_back(Anomaly{
            AnomalyType::SPREAD_BLOWOUT,
            spread_bps > 100 ? AnomalySeverity::HIGH : AnomalySeverity::MEDIUM,
            message,
            spread_bps,
            config_.spread_blowout_bps,
            ticker.time
        });
    }
    return out;
}

} // namespace lumen
