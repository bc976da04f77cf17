#include "watchlist.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <map>
#include <spdlog/spdlog.h>

PivotSetup pivot_setup_from_json(const nlohmann::json& j) {
    try {
        PivotSetup s;
        s.symbol = j.at("symbol").get<std::string>();
        s.pivot_price = j.at("pivot_price").get<double>();
        s.side_bias = side_from_string(j.at("side_bias").get<std::string>());
        s.score = j.at("score").get<double>();
        s.risk_reward = j.at("risk_reward").get<double>();
        if (j.contains("setup_type")) {
            s.setup_type = setup_type_from_string(j.at("setup_type").get<std::string>());
        }
        if (j.contains("target_price") && !j.at("target_price").is_null()) {
            s.target_price = j.at("target_price").get<double>();
        }

        if (s.symbol.empty()) {
            throw DataError("empty symbol");
        }
        if (!std::isfinite(s.pivot_price) || s.pivot_price <= 0) {
            throw DataError(s.symbol + ": pivot_price must be positive");
        }
        return s;
    } catch (const nlohmann::json::exception& e) {
        throw DataError(std::string("Malformed scanner candidate: ") + e.what());
    }
}

nlohmann::json pivot_setup_to_json(const PivotSetup& setup) {
    nlohmann::json j = {
        {"symbol", setup.symbol},
        {"pivot_price", setup.pivot_price},
        {"side_bias", to_string(setup.side_bias)},
        {"score", setup.score},
        {"risk_reward", setup.risk_reward},
        {"setup_type", to_string(setup.setup_type)}
    };
    j["target_price"] = setup.target_price ? nlohmann::json(*setup.target_price) : nlohmann::json(nullptr);
    return j;
}

std::vector<PivotSetup> filter_watchlist(const std::vector<nlohmann::json>& entries,
                                         const ScannerFilters& filters) {
    std::map<std::string, PivotSetup> best;
    int skipped = 0;

    for (const auto& entry : entries) {
        PivotSetup s;
        try {
            s = pivot_setup_from_json(entry);
        } catch (const DataError& e) {
            spdlog::warn("Skipping watchlist entry: {}", e.what());
            skipped++;
            continue;
        }

        const auto& avoid = filters.avoid_symbols;
        if (std::find(avoid.begin(), avoid.end(), s.symbol) != avoid.end()) {
            spdlog::info("{}: on avoid list", s.symbol);
            skipped++;
            continue;
        }
        if (s.score < filters.min_score || s.risk_reward < filters.min_risk_reward) {
            spdlog::debug("{}: filtered (score {:.1f}, R/R {:.2f})", s.symbol, s.score, s.risk_reward);
            skipped++;
            continue;
        }

        auto it = best.find(s.symbol);
        if (it == best.end() || s.score > it->second.score) {
            best[s.symbol] = s;
        }
    }

    std::vector<PivotSetup> out;
    for (const auto& [_, s] : best) {
        out.push_back(s);
    }
    spdlog::info("Watchlist: {} symbols, {} candidates skipped", out.size(), skipped);
    return out;
}

std::vector<PivotSetup> load_watchlist(const std::string& path, const ScannerFilters& filters) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Cannot open watchlist " + path);
    }

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Malformed watchlist " + path + ": " + e.what());
    }
    if (!doc.is_array()) {
        throw ConfigError("Watchlist " + path + " must be a JSON array");
    }

    std::vector<nlohmann::json> entries(doc.begin(), doc.end());
    return filter_watchlist(entries, filters);
}
