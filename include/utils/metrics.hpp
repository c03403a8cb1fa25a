#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <atomic>
#include "common/types.hpp"

namespace lumen {

/**
 * Metrics sink consumed by the trading core.
 */
class Metrics {
public:
    virtual ~Metrics() = default;

    virtual void increment(const std::string& name, int64_t delta = 1) = 0;
    virtual void gauge(const std::string& name, double value) = 0;
    virtual void observe(const std::string& name, double value) = 0;
};

/**
 * Bounded-sample summary (sum, count and quantiles over the retained window).
 */
class Summary {
public:
    explicit Summary(const std::string& name, size_t max_samples = 10000);

    void observe(double value);

    double quantile(double q) const;
    double sum() const;
    int64_t count() const { return count_.load(); }
    void reset();

    const std::string& name() const { return name_; }

private:
    std::string name_;
    size_t max_samples_;
    std::atomic<int64_t> count_{0};

    mutable std::mutex mutex_;
    std::vector<double> samples_;
    double sum_{0.0};
};

/**
 * Counter metric.
 */
class Counter {
public:
    explicit Counter(const std::string& name);

    void increment(int64_t delta = 1);
    int64_t value() const { return value_.load(); }
    void reset();

    const std::string& name() const { return name_; }

private:
    std::string name_;
    std::atomic<int64_t> value_{0};
};

/**
 * Gauge metric (can go up or down).
 */
class Gauge {
public:
    explicit Gauge(const std::string& name);

    void set(double value);
    double value() const { return value_.load(); }

    const std::string& name() const { return name_; }

private:
    std::string name_;
    std::atomic<double> value_{0.0};
};

/**
 * Registry of counters, gauges and summaries, exported in Prometheus text
 * format or JSON.
 */
class MetricsRegistry : public Metrics {
public:
    explicit MetricsRegistry(std::string prefix = "lumen");

    void increment(const std::string& name, int64_t delta = 1) override;
    void gauge(const std::string& name, double value) override;
    void observe(const std::string& name, double value) override;

    // Get or create metrics
    Counter& counter(const std::string& name);
    Gauge& gauge_ref(const std::string& name);
    Summary& summary(const std::string& name);

    // 0 when the counter was never touched
    int64_t counter_value(const std::string& name) const;

    // Prometheus exposition format, names sanitized to [A-Za-z0-9_]
    std::string to_prometheus() const;

    // Export all metrics as JSON
    std::string to_json() const;

    // Reset all metrics
    void reset_all();

    static std::string sanitize(const std::string& name);

private:
    std::string prefix_;

    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<Counter>> counters_;
    std::map<std::string, std::unique_ptr<Gauge>> gauges_;
    std::map<std::string, std::unique_ptr<Summary>> summaries_;

    std::string full_name(const std::string& name) const;
};

/**
 * Scoped latency measurement, observed in milliseconds on destruction.
 */
class ScopedLatency {
public:
    ScopedLatency(Metrics& metrics, std::string name);
    ~ScopedLatency();

    void stop();  // Early stop
    double elapsed_ms() const;

private:
    Metrics& metrics_;
    std::string name_;
    Timestamp start_;
    bool stopped_{false};
};

} // namespace lumen
