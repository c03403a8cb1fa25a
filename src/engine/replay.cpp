#include "engine/replay.hpp"
#include "common/errors.hpp"
#include "utils/time_utils.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <iomanip>
#include <istream>
#include <ostream>

namespace lumen {

namespace {

int64_t read_time(const nlohmann::json& j, const char* key) {
    if (!j.contains(key)) return 0;
    const auto& v = j.at(key);
    if (v.is_string()) return time_utils::parse_iso8601_ms(v.get<std::string>());
    return v.get<int64_t>();
}

Candle read_candle(const nlohmann::json& j, const std::string& symbol) {
    Candle c;
    c.symbol = symbol;
    c.interval = j.value("interval", std::string{});
    c.time = read_time(j, "time");
    c.open = j.at("open").get<double>();
    c.high = j.at("high").get<double>();
    c.low = j.at("low").get<double>();
    c.close = j.at("close").get<double>();
    c.volume = j.value("volume", 0.0);
    return c;
}

} // namespace

ReplayEvent parse_replay_event(const std::string& line) {
    try {
        auto j = nlohmann::json::parse(line);

        ReplayEvent ev;
        ev.symbol = j.at("symbol").get<std::string>();

        const auto& t = j.at("ticker");
        ev.ticker.symbol = ev.symbol;
        ev.ticker.bid = t.at("bid").get<double>();
        ev.ticker.ask = t.at("ask").get<double>();
        ev.ticker.last = t.value("last", (ev.ticker.bid + ev.ticker.ask) / 2.0);
        if (t.contains("volume_24h") && !t["volume_24h"].is_null()) {
            ev.ticker.volume_24h = t["volume_24h"].get<double>();
        }
        ev.ticker.time = read_time(t, "time");

        if (j.contains("signal")) {
            const auto& s = j["signal"];
            ev.signal.action = action_from_string(s.value("action", std::string{"HOLD"}));
            ev.signal.confidence = s.value("confidence", 0.0);
            ev.signal.reason = s.value("reason", std::string{});
        }

        if (j.contains("candles")) {
            for (const auto& c : j["candles"]) {
                ev.candles.push_back(read_candle(c, ev.symbol));
            }
        }
        return ev;
    } catch (const nlohmann::json::exception& e) {
        throw ValidationError(fmt::format("Malformed replay line: {}", e.what()));
    }
}

Replayer::Replayer(TradingLoop& loop, AccountBook& book, bool verbose)
    : loop_(loop)
    , book_(book)
    , verbose_(verbose)
{
    stats_.peak_equity = book_.equity();
}

void Replayer::append_candles(const std::string& symbol, const std::vector<Candle>& candles) {
    auto& h = history_[symbol];
    for (const auto& c : candles) {
        if (!h.empty() && c.time <= h.back().time) continue;
        h.push_back(c);
    }
    if (h.size() > MAX_CANDLES) {
        h.erase(h.begin(), h.begin() + (h.size() - MAX_CANDLES));
    }
}

void Replayer::process(const ReplayEvent& event) {
    append_candles(event.symbol, event.candles);

    int64_t now = event.ticker.time > 0 ? event.ticker.time : now_ms();
    CycleResult r = loop_.run_cycle(event.symbol, event.ticker, history_[event.symbol], event.signal, now);

    stats_.lines_processed++;
    stats_.anomalies += static_cast<int>(r.anomalies.size());
    if (event.signal.action != SignalAction::HOLD) stats_.signals++;

    if (r.decision.blocked_by) {
        stats_.blocked++;
        stats_.blocks_by_code[blocked_by_to_string(*r.decision.blocked_by)]++;
    }
    if (r.halted_by_kill_switch) stats_.halted++;
    if (!r.error.empty()) stats_.submit_errors++;

    if (r.order) {
        if (r.order->status == OrderStatus::FILLED) {
            stats_.orders_filled++;
        } else if (r.order->is_open()) {
            stats_.orders_pending++;
        }
        if (verbose_) {
            spdlog::info("[ORDER] {} {} {:.6f} {} status={}", r.order->client_order_id,
                         side_to_string(r.order->side), r.order->quantity, r.order->symbol,
                         order_status_to_string(r.order->status));
        }
    }

    if (r.closed_trade) {
        stats_.trades_closed++;
        if (r.closed_trade->won()) stats_.wins++;
        stats_.realized_pnl += r.closed_trade->realized_pnl;
    }

    double equity = book_.equity();
    stats_.final_equity = equity;
    stats_.peak_equity = std::max(stats_.peak_equity, equity);
    if (stats_.peak_equity > 0) {
        double dd = (stats_.peak_equity - equity) / stats_.peak_equity * 100.0;
        stats_.max_drawdown_pct = std::max(stats_.max_drawdown_pct, dd);
    }
}

ReplayStats Replayer::run(std::istream& input) {
    std::string line;
    while (std::getline(input, line)) {
        if (line.empty() || line[0] == '#') continue;

        ReplayEvent event;
        try {
            event = parse_replay_event(line);
        } catch (const ValidationError& e) {
            stats_.lines_rejected++;
            spdlog::warn("Skipping replay line: {}", e.what());
            continue;
        }

        process(event);

        if (stats_.lines_processed % 10000 == 0) {
            spdlog::info("Processed {} ticks, {} fills, equity ${:.2f}",
                         stats_.lines_processed, stats_.orders_filled, book_.equity());
        }
    }

    stats_.final_equity = book_.equity();
    return stats_;
}

void print_replay_results(const ReplayStats& stats, std::ostream& out) {
    out << "\n";
    out << "════════════════════════════════════════════════════════\n";
    out << "                    REPLAY RESULTS                       \n";
    out << "════════════════════════════════════════════════════════\n";
    out << "Ticks processed:    " << stats.lines_processed << "\n";
    out << "Lines rejected:     " << stats.lines_rejected << "\n";
    out << "Signals:            " << stats.signals << "\n";
    out << "Orders filled:      " << stats.orders_filled << "\n";
    out << "Orders pending:     " << stats.orders_pending << "\n";
    out << "Blocked by guards:  " << stats.blocked << "\n";
    for (const auto& [code, n] : stats.blocks_by_code) {
        out << "  " << std::left << std::setw(18) << code << n << "\n";
    }
    out << "Halted (kill sw.):  " << stats.halted << "\n";
    out << "Submit errors:      " << stats.submit_errors << "\n";
    out << "Anomalies:          " << stats.anomalies << "\n";
    out << "────────────────────────────────────────────────────────\n";
    out << std::fixed << std::setprecision(2);
    out << "Trades closed:      " << stats.trades_closed << " (" << stats.wins << " won)\n";
    out << "Realized PnL:       $" << stats.realized_pnl << "\n";
    out << "Final equity:       $" << stats.final_equity << "\n";
    out << "Peak equity:        $" << stats.peak_equity << "\n";
    out << "Max drawdown:       " << stats.max_drawdown_pct << "%\n";
    out << "════════════════════════════════════════════════════════\n";
}

} // namespace lumen
