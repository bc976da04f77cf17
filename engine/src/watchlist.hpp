#pragma once

#include "strategy_config.hpp"
#include "types.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

PivotSetup pivot_setup_from_json(const nlohmann::json& j);
nlohmann::json pivot_setup_to_json(const PivotSetup& setup);

// Scanner candidates that pass the filters, one per symbol (highest score wins).
// Malformed entries are logged and skipped.
std::vector<PivotSetup> filter_watchlist(const std::vector<nlohmann::json>& entries,
                                         const ScannerFilters& filters);

// Reads a JSON array of candidates; throws ConfigError if the file is unreadable
std::vector<PivotSetup> load_watchlist(const std::string& path, const ScannerFilters& filters);
