#pragma once

#include <optional>
#include <string>
#include <vector>
#include "common/types.hpp"

namespace lumen {

/**
 * Blocks trading when the current ATR spikes past a multiple of its
 * trailing median.
 */
class VolatilityGuard {
public:
    struct Config {
        double atr_multiplier_threshold{2.5};
        int atr_period{14};
        int baseline_window{100};   // ATR values in the median baseline
    };

    struct Result {
        bool blocked{false};
        std::string reason;
        std::optional<double> current_atr;
        std::optional<double> median_atr;
    };

    VolatilityGuard();
    explicit VolatilityGuard(const Config& config);

    Result check(const std::vector<Candle>& candles) const;

    // Wilder-smoothed ATR series; empty when fewer than period + 1 candles
    static std::vector<double> compute_atr(const std::vector<Candle>& candles, int period);

private:
    Config config_;
};

} // namespace lumen
