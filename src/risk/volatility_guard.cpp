#include "risk/volatility_guard.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace lumen {

VolatilityGuard::VolatilityGuard()
    : VolatilityGuard(Config{})
{
}

VolatilityGuard::VolatilityGuard(const Config& config)
    : config_(config)
{
}

std::vector<double> VolatilityGuard::compute_atr(const std::vector<Candle>& candles, int period) {
    std::vector<double> atr;
    if (period <= 0 || candles.size() < static_cast<size_t>(period) + 1) {
        return atr;
    }

    // True range needs the previous close, so it starts at index 1
    std::vector<double> tr;
    tr.reserve(candles.size() - 1);
    for (size_t i = 1; i < candles.size(); ++i) {
        const auto& c = candles[i];
        double prev_close = candles[i - 1].close;
        tr.push_back(std::max({c.high - c.low,
                               std::abs(c.high - prev_close),
                               std::abs(c.low - prev_close)}));
    }

    double seed = 0.0;
    for (int i = 0; i < period; ++i) seed += tr[i];
    double value = seed / period;
    atr.push_back(value);

    for (size_t i = period; i < tr.size(); ++i) {
        value = (value * (period - 1) + tr[i]) / period;
        atr.push_back(value);
    }

    return atr;
}

VolatilityGuard::Result VolatilityGuard::check(const std::vector<Candle>& candles) const {
    Result result;

    if (candles.size() < static_cast<size_t>(config_.atr_period + config_.baseline_window)) {
        result.reason = "Insufficient data for volatility check";
        return result;
    }

    auto atr = compute_atr(candles, config_.atr_period);
    if (atr.size() < 2) {
        result.reason = "Not enough ATR values";
        return result;
    }

    double current = atr.back();
    size_t n = std::min(atr.size(), static_cast<size_t>(config_.baseline_window));
    std::vector<double> baseline(atr.end() - n, atr.end());
    std::sort(baseline.begin(), baseline.end());
    double median = baseline[baseline.size() / 2];

    result.current_atr = current;
    result.median_atr = median;

    if (median <= 0) {
        result.reason = "Median ATR is zero";
        return result;
    }

    double ratio = current / median;
    if (ratio > config_.atr_multiplier_threshold) {
        result.blocked = true;
        result.reason = fmt::format("Volatility spike: ATR {:.2f} is {:.1f}x median (threshold: {}x)",
                                    current, ratio, config_.atr_multiplier_threshold);
        return result;
    }

    result.reason = "Volatility within normal range";
    return result;
}

} // namespace lumen
