#include "utils/alerter.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace lumen {

// Alert implementation
std::string Alert::to_string() const {
    std::ostringstream ss;
    auto time = std::chrono::system_clock::to_time_t(timestamp);
    ss << std::put_time(std::gmtime(&time), "%Y-%m-%d %H:%M:%S");
    ss << " [" << severity_to_string(severity) << "]";
    ss << " " << title << ": " << message;
    return ss.str();
}

std::string Alert::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["timestamp"] = std::chrono::duration_cast<std::chrono::milliseconds>(
        timestamp.time_since_epoch()).count();
    j["severity"] = severity_to_string(severity);
    j["title"] = title;
    j["message"] = message;
    j["metadata"] = metadata;
    return j.dump();
}

// LogChannel implementation
bool LogChannel::send(const Alert& alert) {
    switch (alert.severity) {
        case AlertSeverity::INFO:
            spdlog::info("[ALERT] {}: {}", alert.title, alert.message);
            break;
        case AlertSeverity::WARNING:
            spdlog::warn("[ALERT] {}: {}", alert.title, alert.message);
            break;
        case AlertSeverity::ERROR:
            spdlog::error("[ALERT] {}: {}", alert.title, alert.message);
            break;
        case AlertSeverity::CRITICAL:
            spdlog::critical("[ALERT] {}: {}", alert.title, alert.message);
            break;
    }
    return true;
}

// LogFileChannel implementation
LogFileChannel::LogFileChannel(const std::string& path)
    : path_(path)
{
    file_.open(path, std::ios::app);
    if (!file_) {
        spdlog::error("Failed to open alert log file: {}", path);
    }
}

LogFileChannel::~LogFileChannel() {
    if (file_.is_open()) {
        file_.close();
    }
}

bool LogFileChannel::send(const Alert& alert) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!file_.is_open()) {
        return false;
    }

    std::string line = alert.to_json() + "\n";
    file_ << line;
    file_.flush();

    bytes_written_ += line.size();
    if (bytes_written_ >= MAX_FILE_SIZE) {
        rotate();
    }

    return static_cast<bool>(file_);
}

void LogFileChannel::rotate() {
    file_.close();

    std::string backup = path_ + ".1";
    if (std::rename(path_.c_str(), backup.c_str()) != 0) {
        spdlog::warn("Failed to rotate alert log {}", path_);
    }

    file_.open(path_, std::ios::app);
    bytes_written_ = 0;
}

// Alerter implementation
Alerter::Alerter()
    : Alerter(Config{})
{
}

Alerter::Alerter(const Config& config)
    : config_(config)
{
}

void Alerter::add_channel(std::shared_ptr<AlertChannel> channel) {
    add_channel(std::move(channel), AlertSeverity::INFO);
}

void Alerter::add_channel(std::shared_ptr<AlertChannel> channel, AlertSeverity min_severity) {
    std::lock_guard<std::mutex> lock(channels_mutex_);
    spdlog::debug("Added alert channel: {} (min_severity={})",
                  channel->name(), severity_to_string(min_severity));
    channels_.push_back({std::move(channel), min_severity});
}

void Alerter::send(const Alert& alert) {
    if (alert.severity < config_.min_severity) {
        return;
    }

    if (config_.deduplicate && should_dedupe(alert)) {
        alerts_dropped_++;
        return;
    }

    Alert alert_copy = alert;
    if (alert_copy.id.empty()) {
        alert_copy.id = generate_alert_id();
    }
    if (alert_copy.timestamp.time_since_epoch().count() == 0) {
        alert_copy.timestamp = wall_now();
    }

    send_to_channels(alert_copy);
}

void Alerter::notify(AlertSeverity severity,
                     const std::string& title,
                     const std::string& message,
                     const std::map<std::string, std::string>& metadata) {
    Alert alert;
    alert.severity = severity;
    alert.title = title;
    alert.message = message;
    alert.metadata = metadata;
    send(alert);
}

std::string Alerter::generate_alert_id() {
    static std::atomic<int> counter{0};
    return fmt::format("ALT-{}-{}", now_ms(), counter++);
}

bool Alerter::should_dedupe(const Alert& alert) {
    std::lock_guard<std::mutex> lock(dedup_mutex_);

    std::string key = fmt::format("{}:{}", severity_to_string(alert.severity), alert.title);

    auto now_time = wall_now();
    auto it = recent_alerts_.find(key);

    if (it != recent_alerts_.end()) {
        if (now_time - it->second < config_.dedup_window) {
            return true;  // Duplicate
        }
    }

    recent_alerts_[key] = now_time;

    // Cleanup old entries
    auto cutoff = now_time - config_.dedup_window;
    for (auto iter = recent_alerts_.begin(); iter != recent_alerts_.end(); ) {
        if (iter->second < cutoff) {
            iter = recent_alerts_.erase(iter);
        } else {
            ++iter;
        }
    }

    return false;
}

void Alerter::send_to_channels(const Alert& alert) {
    std::lock_guard<std::mutex> lock(channels_mutex_);

    for (const auto& cc : channels_) {
        if (alert.severity < cc.min_severity) continue;
        if (!cc.channel->is_available()) continue;

        try {
            if (cc.channel->send(alert)) {
                alerts_sent_++;
            }
        } catch (const std::exception& e) {
            spdlog::error("Alert channel {} error: {}", cc.channel->name(), e.what());
        }
    }
}

} // namespace lumen
