#include <iostream>
#include <fstream>
#include <filesystem>
#include <iomanip>
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "common/errors.hpp"
#include "common/types.hpp"
#include "config/config.hpp"
#include "core/circuit_breaker.hpp"
#include "core/kill_switch.hpp"
#include "engine/replay.hpp"
#include "engine/trading_loop.hpp"
#include "execution/broker.hpp"
#include "execution/order_manager.hpp"
#include "execution/retry_executor.hpp"
#include "market_data/anomaly_detector.hpp"
#include "persistence/kill_switch_repository.hpp"
#include "persistence/order_store.hpp"
#include "persistence/trading_database.hpp"
#include "position/account_book.hpp"
#include "risk/risk_engine.hpp"
#include "utils/alerter.hpp"
#include "utils/logging.hpp"
#include "utils/metrics.hpp"
#include "utils/time_utils.hpp"

using namespace lumen;

namespace {

Config load_config(const std::string& path) {
    if (std::filesystem::exists(path)) {
        return Config::load(path);
    }
    Config config;
    config.apply_env_overrides();
    if (!config.validate()) {
        throw ValidationError("Default configuration failed validation");
    }
    return config;
}

void print_startup_banner(const Config& config) {
    std::cout << "┌─────────────────────────────────────────────────────────────┐\n";
    std::cout << "│ LUMEN TRADER                                                │\n";
    std::cout << "├─────────────────────────────────────────────────────────────┤\n";
    std::cout << "│ Mode:        " << mode_to_string(config.mode) << "\n";
    std::cout << "│ Live armed:  " << (config.allow_live_trading ? "YES" : "no") << "\n";
    std::cout << "│ Symbols:     ";
    for (size_t i = 0; i < config.symbols.size(); i++) {
        std::cout << (i ? ", " : "") << config.symbols[i];
    }
    std::cout << "\n";
    std::cout << "│ Database:    " << config.persistence.db_path << "\n";
    std::cout << "└─────────────────────────────────────────────────────────────┘\n\n";
}

void export_metrics(const MetricsRegistry& metrics, const MetricsConfig& config) {
    if (config.export_path.empty()) return;
    std::ofstream out(config.export_path, std::ios::trunc);
    if (!out) {
        spdlog::error("Failed to write metrics to {}", config.export_path);
        return;
    }
    out << metrics.to_prometheus();
    spdlog::info("Metrics written to {}", config.export_path);
}

void print_order(const Order& o) {
    std::cout << std::left
              << std::setw(44) << o.client_order_id << " "
              << std::setw(10) << o.symbol << " "
              << std::setw(5) << side_to_string(o.side) << " "
              << std::setw(8) << order_type_to_string(o.type) << " "
              << std::setw(16) << fmt::format("{:.6f}", o.quantity) << " "
              << std::setw(10) << order_status_to_string(o.status) << " "
              << (o.avg_fill_price ? fmt::format("{:.2f}", *o.avg_fill_price) : "-") << " "
              << time_utils::to_iso8601(o.updated_at) << "\n";
}

int cmd_status(const Config& config) {
    TradingDatabase db(config.persistence.db_path);
    MetricsRegistry metrics(config.metrics.prefix);
    KillSwitch kill_switch(config.kill_switch_limits, metrics);
    kill_switch.init(db);

    const auto& s = kill_switch.state();
    print_startup_banner(config);
    std::cout << "Kill switch:         " << (s.triggered ? "TRIGGERED" : "armed") << "\n";
    if (s.triggered) {
        std::cout << "  Reason:            " << s.reason << "\n";
        if (s.triggered_at) {
            std::cout << "  Since:             " << time_utils::to_iso8601(*s.triggered_at) << "\n";
        }
    }
    std::cout << "Consecutive losses:  " << s.consecutive_losses << "/"
              << config.kill_switch_limits.max_consecutive_losses << "\n";
    std::cout << "Spread violations:   " << kill_switch.active_spread_violations() << "/"
              << config.kill_switch_limits.spread_violations_limit << " (last "
              << config.kill_switch_limits.spread_violations_window_min << "min)\n";
    std::cout << "API errors:          " << s.api_error_count << "/"
              << config.kill_switch_limits.api_error_threshold << "\n";
    std::cout << "Orders stored:       " << db.count_orders() << "\n";
    std::cout << "Open orders:         " << db.open_orders().size() << "\n";
    return s.triggered ? 2 : 0;
}

int cmd_reset_kill_switch(const Config& config, const std::string& note) {
    TradingDatabase db(config.persistence.db_path);
    MetricsRegistry metrics(config.metrics.prefix);
    KillSwitch kill_switch(config.kill_switch_limits, metrics);
    kill_switch.init(db);

    if (!kill_switch.is_triggered()) {
        std::cout << "Kill switch is not triggered; counters cleared.\n";
    }
    kill_switch.reset(note);
    kill_switch.persist(db);

    std::cout << "Kill switch reset.\n";
    return 0;
}

int cmd_orders(const Config& config, bool open_only, const std::string& symbol) {
    TradingDatabase db(config.persistence.db_path);
    std::optional<std::string> filter;
    if (!symbol.empty()) filter = symbol;

    std::vector<Order> orders;
    if (open_only) {
        orders = db.open_orders(filter);
    } else {
        for (auto& o : db.all_orders()) {
            if (!filter || o.symbol == *filter) orders.push_back(std::move(o));
        }
    }

    for (const auto& o : orders) print_order(o);
    std::cout << orders.size() << " order(s)\n";
    return 0;
}

int cmd_metrics(const Config& config) {
    TradingDatabase db(config.persistence.db_path);
    MetricsRegistry metrics(config.metrics.prefix);
    KillSwitch kill_switch(config.kill_switch_limits, metrics);
    kill_switch.init(db);

    const auto& s = kill_switch.state();
    metrics.gauge("kill_switch.active", s.triggered ? 1.0 : 0.0);
    metrics.gauge("kill_switch.consecutive_losses", s.consecutive_losses);
    metrics.gauge("kill_switch.spread_violations", kill_switch.active_spread_violations());
    metrics.gauge("kill_switch.api_errors", s.api_error_count);
    metrics.gauge("orders.stored", static_cast<double>(db.count_orders()));
    metrics.gauge("orders.open", static_cast<double>(db.open_orders().size()));

    std::cout << metrics.to_prometheus();
    export_metrics(metrics, config.metrics);
    return 0;
}

int cmd_replay(Config config, const std::string& input_path, const std::string& calendar_path,
               bool persist, bool verbose) {
    // Recorded data never reaches a venue
    config.mode = TradingMode::PAPER;
    print_startup_banner(config);

    MetricsRegistry metrics(config.metrics.prefix);

    std::unique_ptr<TradingDatabase> db;
    InMemoryOrderStore memory_orders;
    InMemoryKillSwitchRepository memory_kill_switch;
    OrderStore* orders = &memory_orders;
    KillSwitchRepository* kill_switch_repo = &memory_kill_switch;
    if (persist) {
        db = std::make_unique<TradingDatabase>(config.persistence.db_path);
        orders = db.get();
        kill_switch_repo = db.get();
    }

    Alerter alerter;
    alerter.add_channel(std::make_shared<LogChannel>(), AlertSeverity::WARNING);
    std::filesystem::create_directories(config.logging.log_dir);
    alerter.add_channel(std::make_shared<LogFileChannel>(config.logging.log_dir + "/alerts.jsonl"));

    KillSwitch kill_switch(config.kill_switch_limits, metrics);
    kill_switch.init(*kill_switch_repo);
    kill_switch.set_persist_fn([kill_switch_repo](const KillSwitchState& state) {
        kill_switch_repo->save("default", state);
    });

    RiskEngine risk(config);
    if (!calendar_path.empty()) {
        std::ifstream cal(calendar_path);
        if (!cal) {
            throw ValidationError("Cannot open event calendar: " + calendar_path);
        }
        try {
            risk.event_lockout().load_calendar(nlohmann::json::parse(cal));
        } catch (const nlohmann::json::exception& e) {
            throw ValidationError(fmt::format("Malformed event calendar: {}", e.what()));
        }
    }

    auto broker = make_broker(config.mode, config.guards.max_slippage_bps, nullptr);
    OrderManager order_manager(config, *orders, *broker, metrics);

    CircuitBreaker breaker(config.circuit_breaker);
    RetryExecutor retry(config.retry, breaker, metrics);

    AnomalyDetector anomalies(config.anomaly);
    AccountBook book(config.starting_cash_usd);

    TradingLoop loop(config, risk, kill_switch, order_manager, retry, anomalies, book, metrics, &alerter);
    Replayer replayer(loop, book, verbose);

    std::ifstream input(input_path);
    if (!input) {
        throw ValidationError("Cannot open replay input: " + input_path);
    }

    spdlog::info("Starting replay from: {}", input_path);
    ReplayStats stats = replayer.run(input);

    print_replay_results(stats, std::cout);
    std::cout << "\nMetrics:\n" << metrics.to_prometheus();
    export_metrics(metrics, config.metrics);

    return kill_switch.is_triggered() ? 2 : 0;
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"Lumen - guarded spot trading core"};
    app.require_subcommand(1);

    std::string config_path = "configs/lumen.json";
    app.add_option("-c,--config", config_path, "Path to configuration file");

    auto* status = app.add_subcommand("status", "Show kill switch state and order counts");

    std::string reset_note;
    auto* reset = app.add_subcommand("reset-kill-switch", "Re-arm the kill switch");
    reset->add_option("-n,--note", reset_note, "Operator note recorded with the reset")->required();

    bool open_only = false;
    std::string order_symbol;
    auto* orders = app.add_subcommand("orders", "List stored orders (newest first)");
    orders->add_flag("--open", open_only, "Only orders that are still open");
    orders->add_option("-s,--symbol", order_symbol, "Filter by symbol");

    std::string input_path;
    std::string calendar_path;
    bool persist = false;
    bool verbose = false;
    auto* replay = app.add_subcommand("replay", "Run recorded ticks through the paper pipeline");
    replay->add_option("-i,--input", input_path, "JSON-lines file with recorded ticks")
        ->required()
        ->check(CLI::ExistingFile);
    replay->add_option("--calendar", calendar_path, "Scheduled events JSON for the lockout guard")
        ->check(CLI::ExistingFile);
    replay->add_flag("--persist", persist, "Write orders and kill switch state to the database");
    replay->add_flag("-v,--verbose", verbose, "Log every order");

    auto* metrics = app.add_subcommand("metrics", "Print persisted state as Prometheus text");

    std::string init_output;
    auto* init = app.add_subcommand("init-config", "Write the default configuration");
    init->add_option("-o,--output", init_output, "Destination path")->required();

    CLI11_PARSE(app, argc, argv);

    if (*init) {
        Config defaults;
        defaults.save(init_output);
        std::cout << "Wrote default configuration to " << init_output << "\n";
        return 0;
    }

    Config config;
    try {
        config = load_config(config_path);
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << "\n";
        return 1;
    }

    setup_logging(config.logging);

    try {
        if (*status) return cmd_status(config);
        if (*reset) return cmd_reset_kill_switch(config, reset_note);
        if (*orders) return cmd_orders(config, open_only, order_symbol);
        if (*metrics) return cmd_metrics(config);
        if (*replay) return cmd_replay(config, input_path, calendar_path, persist, verbose);
    } catch (const PersistenceError& e) {
        spdlog::critical("Persistence failure: {}", e.what());
        return 3;
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }

    return 0;
}
