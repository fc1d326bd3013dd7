#pragma once

#include "types.hpp"
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Pure helpers behind CoinGeckoClient; no I/O.

// /ohlc granularity is chosen by CoinGecko from the day count.
int cg_days_for_timeframe(const std::string& timeframe);

// [[ts, o, h, l, c], ...] oldest first. A row whose timestamp does not advance
// replaces the previous one; malformed rows are dropped; keeps the newest `limit`.
std::vector<Candle> parse_cg_ohlc(const nlohmann::json& rows, int limit);

std::map<std::string, std::string> default_cg_symbol_map();

// Accepts {"mappings": {...}} or a flat object of symbol -> coin id.
// Throws ConfigError when there are no mappings or an id is not a string.
std::map<std::string, std::string> parse_cg_symbol_mapping(const nlohmann::json& doc,
                                                           const std::string& source);
