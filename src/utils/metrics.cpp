#include "utils/metrics.hpp"
#include <nlohmann/json.hpp>
#include <sstream>
#include <algorithm>
#include <cctype>

namespace lumen {

// Summary implementation

Summary::Summary(const std::string& name, size_t max_samples)
    : name_(name)
    , max_samples_(max_samples)
{
    samples_.reserve(std::min<size_t>(max_samples, 1024));
}

void Summary::observe(double value) {
    std::lock_guard<std::mutex> lock(mutex_);

    samples_.push_back(value);
    sum_ += value;
    count_++;

    // Trim if over capacity
    if (samples_.size() > max_samples_) {
        samples_.erase(samples_.begin());
    }
}

double Summary::quantile(double q) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (samples_.empty()) return 0.0;

    std::vector<double> sorted = samples_;
    std::sort(sorted.begin(), sorted.end());

    q = std::clamp(q, 0.0, 1.0);
    size_t idx = static_cast<size_t>(q * (sorted.size() - 1));
    return sorted[idx];
}

double Summary::sum() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sum_;
}

void Summary::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    samples_.clear();
    sum_ = 0.0;
    count_ = 0;
}

// Counter implementation

Counter::Counter(const std::string& name)
    : name_(name)
{
}

void Counter::increment(int64_t delta) {
    value_ += delta;
}

void Counter::reset() {
    value_ = 0;
}

// Gauge implementation

Gauge::Gauge(const std::string& name)
    : name_(name)
{
}

void Gauge::set(double value) {
    value_ = value;
}

// MetricsRegistry implementation

MetricsRegistry::MetricsRegistry(std::string prefix)
    : prefix_(std::move(prefix))
{
}

void MetricsRegistry::increment(const std::string& name, int64_t delta) {
    counter(name).increment(delta);
}

void MetricsRegistry::gauge(const std::string& name, double value) {
    gauge_ref(name).set(value);
}

void MetricsRegistry::observe(const std::string& name, double value) {
    summary(name).observe(value);
}

Counter& MetricsRegistry::counter(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(name);
    if (it == counters_.end()) {
        it = counters_.emplace(name, std::make_unique<Counter>(name)).first;
    }
    return *it->second;
}

Gauge& MetricsRegistry::gauge_ref(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = gauges_.find(name);
    if (it == gauges_.end()) {
        it = gauges_.emplace(name, std::make_unique<Gauge>(name)).first;
    }
    return *it->second;
}

Summary& MetricsRegistry::summary(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = summaries_.find(name);
    if (it == summaries_.end()) {
        it = summaries_.emplace(name, std::make_unique<Summary>(name)).first;
    }
    return *it->second;
}

int64_t MetricsRegistry::counter_value(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(name);
    return it == counters_.end() ? 0 : it->second->value();
}

std::string MetricsRegistry::sanitize(const std::string& name) {
    std::string out = name;
    for (auto& c : out) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            c = '_';
        }
    }
    return out;
}

std::string MetricsRegistry::full_name(const std::string& name) const {
    if (prefix_.empty()) return sanitize(name);
    return sanitize(prefix_ + "_" + name);
}

std::string MetricsRegistry::to_prometheus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream ss;

    for (const auto& [name, counter] : counters_) {
        std::string n = full_name(name);
        ss << "# TYPE " << n << " counter\n";
        ss << n << " " << counter->value() << "\n";
    }

    for (const auto& [name, gauge] : gauges_) {
        std::string n = full_name(name);
        ss << "# TYPE " << n << " gauge\n";
        ss << n << " " << gauge->value() << "\n";
    }

    for (const auto& [name, summary] : summaries_) {
        std::string n = full_name(name);
        ss << "# TYPE " << n << " summary\n";
        for (double q : {0.5, 0.95, 0.99}) {
            ss << n << "{quantile=\"" << q << "\"} " << summary->quantile(q) << "\n";
        }
        ss << n << "_sum " << summary->sum() << "\n";
        ss << n << "_count " << summary->count() << "\n";
    }

    return ss.str();
}

std::string MetricsRegistry::to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);

    nlohmann::json j;

    nlohmann::json counters_json = nlohmann::json::object();
    for (const auto& [name, counter] : counters_) {
        counters_json[name] = counter->value();
    }
    j["counters"] = counters_json;

    nlohmann::json gauges_json = nlohmann::json::object();
    for (const auto& [name, gauge] : gauges_) {
        gauges_json[name] = gauge->value();
    }
    j["gauges"] = gauges_json;

    nlohmann::json summaries_json = nlohmann::json::object();
    for (const auto& [name, summary] : summaries_) {
        nlohmann::json s;
        s["count"] = summary->count();
        s["sum"] = summary->sum();
        s["p50"] = summary->quantile(0.5);
        s["p95"] = summary->quantile(0.95);
        s["p99"] = summary->quantile(0.99);
        summaries_json[name] = s;
    }
    j["summaries"] = summaries_json;

    return j.dump(2);
}

void MetricsRegistry::reset_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [name, counter] : counters_) {
        counter->reset();
    }
    for (auto& [name, gauge] : gauges_) {
        gauge->set(0.0);
    }
    for (auto& [name, summary] : summaries_) {
        summary->reset();
    }
}

// ScopedLatency implementation

ScopedLatency::ScopedLatency(Metrics& metrics, std::string name)
    : metrics_(metrics)
    , name_(std::move(name))
    , start_(now())
{
}

ScopedLatency::~ScopedLatency() {
    if (!stopped_) {
        stop();
    }
}

void ScopedLatency::stop() {
    if (!stopped_) {
        metrics_.observe(name_, elapsed_ms());
        stopped_ = true;
    }
}

double ScopedLatency::elapsed_ms() const {
    return std::chrono::duration<double, std::milli>(now() - start_).count();
}

} // namespace lumen
