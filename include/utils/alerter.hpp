#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <atomic>
#include <chrono>
#include <fstream>
#include "common/types.hpp"

namespace lumen {

/**
 * Alert severity levels.
 */
enum class AlertSeverity {
    INFO,       // Informational
    WARNING,    // Warning - potential issue
    ERROR,      // Error - something went wrong
    CRITICAL    // Critical - immediate attention needed
};

inline std::string severity_to_string(AlertSeverity s) {
    switch (s) {
        case AlertSeverity::INFO: return "INFO";
        case AlertSeverity::WARNING: return "WARNING";
        case AlertSeverity::ERROR: return "ERROR";
        case AlertSeverity::CRITICAL: return "CRITICAL";
    }
    return "UNKNOWN";
}

/**
 * Alert message structure.
 */
struct Alert {
    std::string id;
    WallClock timestamp;
    AlertSeverity severity{AlertSeverity::INFO};
    std::string title;
    std::string message;
    std::map<std::string, std::string> metadata;

    std::string to_string() const;
    std::string to_json() const;
};

/**
 * Alerting collaborator used by the trading loop and the kill switch.
 */
class AlertService {
public:
    virtual ~AlertService() = default;

    virtual void notify(AlertSeverity severity,
                        const std::string& title,
                        const std::string& message,
                        const std::map<std::string, std::string>& metadata = {}) = 0;
};

/**
 * Alert channel interface.
 */
class AlertChannel {
public:
    virtual ~AlertChannel() = default;
    virtual bool send(const Alert& alert) = 0;
    virtual std::string name() const = 0;
    virtual bool is_available() const = 0;
};

/**
 * Routes alerts into the spdlog default logger at a matching level.
 */
class LogChannel : public AlertChannel {
public:
    bool send(const Alert& alert) override;
    std::string name() const override { return "log"; }
    bool is_available() const override { return true; }
};

/**
 * Appends alerts as JSON lines.
 */
class LogFileChannel : public AlertChannel {
public:
    explicit LogFileChannel(const std::string& path);
    ~LogFileChannel() override;

    bool send(const Alert& alert) override;
    std::string name() const override { return "log_file"; }
    bool is_available() const override { return file_.is_open(); }

    void rotate();

private:
    std::string path_;
    std::ofstream file_;
    std::mutex mutex_;
    size_t bytes_written_{0};
    static constexpr size_t MAX_FILE_SIZE = 50 * 1024 * 1024;  // 50MB
};

/**
 * Fans alerts out to channels synchronously.
 *
 * Alerts with the same severity and title inside the dedup window are
 * dropped. A failing channel never prevents delivery to the others.
 */
class Alerter : public AlertService {
public:
    struct Config {
        AlertSeverity min_severity{AlertSeverity::INFO};
        bool deduplicate{true};
        std::chrono::seconds dedup_window{60};
    };

    Alerter();
    explicit Alerter(const Config& config);

    void add_channel(std::shared_ptr<AlertChannel> channel);
    void add_channel(std::shared_ptr<AlertChannel> channel, AlertSeverity min_severity);

    void send(const Alert& alert);

    void notify(AlertSeverity severity,
                const std::string& title,
                const std::string& message,
                const std::map<std::string, std::string>& metadata = {}) override;

    // Stats
    int64_t alerts_sent() const { return alerts_sent_.load(); }
    int64_t alerts_dropped() const { return alerts_dropped_.load(); }

private:
    Config config_;

    struct ChannelConfig {
        std::shared_ptr<AlertChannel> channel;
        AlertSeverity min_severity;
    };
    std::vector<ChannelConfig> channels_;
    std::mutex channels_mutex_;

    std::atomic<int64_t> alerts_sent_{0};
    std::atomic<int64_t> alerts_dropped_{0};

    std::mutex dedup_mutex_;
    std::map<std::string, WallClock> recent_alerts_;

    std::string generate_alert_id();
    bool should_dedupe(const Alert& alert);
    void send_to_channels(const Alert& alert);
};

} // namespace lumen
