#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/errors.hpp"
#include "../src/strategy_config.hpp"

using Catch::Approx;

TEST_CASE("Default strategy config", "[config]") {
    auto cfg = StrategyConfig::defaults();
    REQUIRE_NOTHROW(cfg.validate());

    SECTION("twelve 5s bars per 60s candle") {
        REQUIRE(cfg.bars_per_confirmation_interval() == 12);
    }

    SECTION("setup types differ only where tuned") {
        const auto& momentum = cfg.thresholds(SetupType::Momentum);
        const auto& pullback = cfg.thresholds(SetupType::Pullback);
        const auto& bounce = cfg.thresholds(SetupType::Bounce);
        REQUIRE(pullback.min_clearance_pct > momentum.min_clearance_pct);
        REQUIRE(pullback.sustained_count_threshold == 4);
        REQUIRE(bounce.stall_window_end_sec < momentum.stall_window_end_sec);
    }

    SECTION("serialized form parses back to the same values") {
        auto parsed = StrategyConfig::from_json(cfg.to_json());
        REQUIRE(parsed.to_json() == cfg.to_json());
        REQUIRE(parsed.session.min_entry_sec == cfg.session.min_entry_sec);
        REQUIRE(parsed.thresholds(SetupType::Momentum).partial_levels.size() == 2);
    }
}

TEST_CASE("Strategy config parsing is strict", "[config]") {
    auto j = StrategyConfig::defaults().to_json();

    SECTION("unknown key") {
        j["account"]["leverage"] = 4;
        REQUIRE_THROWS_AS(StrategyConfig::from_json(j), ConfigError);
    }

    SECTION("missing key") {
        j["setups"]["PULLBACK"].erase("trail_pct");
        REQUIRE_THROWS_AS(StrategyConfig::from_json(j), ConfigError);
    }

    SECTION("wrong type") {
        j["account"]["max_shares"] = "1000";
        REQUIRE_THROWS_AS(StrategyConfig::from_json(j), ConfigError);
    }

    SECTION("bad time of day") {
        j["session"]["flatten_time"] = "25:99";
        REQUIRE_THROWS_AS(StrategyConfig::from_json(j), ConfigError);
    }

    SECTION("partial fractions above one") {
        j["setups"]["MOMENTUM"]["partial_levels"] = {{{"gain_pct", 0.01}, {"fraction", 0.75}},
                                                     {{"gain_pct", 0.02}, {"fraction", 0.5}}};
        REQUIRE_THROWS_AS(StrategyConfig::from_json(j), ConfigError);
    }

    SECTION("missing file") {
        REQUIRE_THROWS_AS(StrategyConfig::load_file("/nonexistent/strategy.json"), ConfigError);
    }
}

TEST_CASE("Bar interval changes re-derive the candle size", "[config]") {
    auto cfg = StrategyConfig::defaults();

    cfg.set_bar_interval(60);
    REQUIRE(cfg.bars_per_confirmation_interval() == 1);

    cfg.set_bar_interval(10);
    REQUIRE(cfg.bars_per_confirmation_interval() == 6);

    REQUIRE_THROWS_AS(cfg.set_bar_interval(7), ConfigError);
}

TEST_CASE("Second-based windows scale with the bar interval", "[config]") {
    auto cfg = StrategyConfig::defaults();
    REQUIRE(cfg.volume_lookback_bars(SetupType::Momentum) == 240);
    REQUIRE(cfg.max_breakout_age_bars(SetupType::Momentum) == 600);

    cfg.set_bar_interval(60);
    REQUIRE(cfg.volume_lookback_bars(SetupType::Momentum) == 20);
    REQUIRE(cfg.max_breakout_age_bars(SetupType::Momentum) == 50);

    SECTION("a breakout may not go stale before its confirmation candle closes") {
        cfg.setups[SetupType::Pullback].max_breakout_age_sec = 30;
        REQUIRE_THROWS_AS(cfg.validate(), ConfigError);
    }

    SECTION("the buffer must hold the lookback at the finest granularity") {
        cfg.buffer_capacity = 300;
        REQUIRE_NOTHROW(cfg.validate());
        REQUIRE_THROWS_AS(cfg.set_bar_interval(5), ConfigError);
    }
}
