#pragma once

#include "../src/entry_state_machine.hpp"
#include "../src/position_manager.hpp"
#include "../src/strategy_config.hpp"
#include "../src/types.hpp"
#include "../src/util.hpp"
#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

// 2024-03-04 10:00:00 UTC, inside the default 09:45-15:00 entry window
constexpr int64_t kSessionOpenMs = 1709546400000;
const std::string kSessionDate = "2024-03-04";

inline int64_t bar_time(int i, int interval_sec = 5) {
    return kSessionOpenMs + static_cast<int64_t>(i) * interval_sec * 1000;
}

inline Bar make_bar(int64_t t, double open, double close, double volume) {
    return Bar{t, open, std::max(open, close) + 0.02, std::min(open, close) - 0.02, close, volume};
}

inline PivotSetup long_setup(const std::string& symbol = "AAPL", double pivot = 100.0) {
    return PivotSetup{symbol, pivot, Side::Long, 80.0, 2.5, SetupType::Momentum, std::nullopt};
}

// Positions 0-19 sit under a 100.00 pivot, 20 crosses it on a large candle with
// 3x volume, 21-32 keep rising on 2.5x volume. With 5s bars the confirmation
// candle closes at 32 with momentum.
inline std::vector<Bar> strong_breakout_bars(int interval_sec = 5) {
    std::vector<Bar> bars;
    for (int i = 0; i < 20; i++) {
        bars.push_back(make_bar(bar_time(i, interval_sec), 99.5, 99.5, 1000));
    }
    bars.push_back(make_bar(bar_time(20, interval_sec), 99.8, 100.5, 3000));
    for (int i = 21; i <= 32; i++) {
        double open = 100.5 + 0.05 * (i - 21);
        bars.push_back(make_bar(bar_time(i, interval_sec), open, open + 0.05, 2500));
    }
    return bars;
}

inline EntryDecision feed_bar(const EntryStateMachine& machine, SymbolWatch& watch, const Bar& bar,
                              const EntryGate& gate = EntryGate{}) {
    auto pos = watch.bars.append(bar);
    return machine.on_bar(watch, pos, gate);
}

inline OrderFlowSample flow(int64_t t, double imbalance, std::optional<double> price = std::nullopt) {
    return OrderFlowSample{t, imbalance, price};
}

// Filled position as it would be persisted mid-session
inline Position held_position(const std::string& symbol, Side side, int64_t shares) {
    Position p;
    p.symbol = symbol;
    p.side = side;
    p.setup_type = SetupType::Momentum;
    p.pivot_price = 100.0;
    p.entry_price = 100.5;
    p.shares = shares;
    p.remaining_shares = shares;
    p.remaining_fraction = 1.0;
    p.stop_price = side == Side::Long ? 99.5 : 101.5;
    p.best_price = 100.5;
    p.entry_logical_position = 32;
    p.entry_time_ms = kSessionOpenMs;
    p.entry_filled = true;
    p.entry_order_id = "SIM-1";
    p.stop_order_id = "SIM-2";
    return p;
}

struct TempDir {
    std::filesystem::path path;

    TempDir() {
        path = std::filesystem::temp_directory_path() /
               ("pivotbreak_test_" + std::to_string(util::current_timestamp_ms()) + "_" +
                std::to_string(util::random_jitter(0, 1000000)));
        std::filesystem::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
};
