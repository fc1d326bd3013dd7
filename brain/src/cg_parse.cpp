#include "cg_parse.hpp"
#include "errors.hpp"

int cg_days_for_timeframe(const std::string& timeframe) {
    if (timeframe == "1h") return 1;
    if (timeframe == "4h") return 30;
    if (timeframe == "1d") return 365;
    return 30;
}

std::vector<Candle> parse_cg_ohlc(const nlohmann::json& rows, int limit) {
    std::vector<Candle> candles;
    if (!rows.is_array()) {
        return candles;
    }

    for (const auto& row : rows) {
        if (!row.is_array() || row.size() < 5) {
            continue;
        }
        bool numeric = true;
        for (size_t i = 0; i < 5; ++i) {
            numeric = numeric && row[i].is_number();
        }
        if (!numeric) {
            continue;
        }

        Candle c;
        c.ts_ms = row[0].get<int64_t>();
        c.open = row[1].get<double>();
        c.high = row[2].get<double>();
        c.low = row[3].get<double>();
        c.close = row[4].get<double>();

        // The still-forming bucket can repeat the previous timestamp; keep the newer row
        if (!candles.empty() && c.ts_ms <= candles.back().ts_ms) {
            candles.back() = c;
            continue;
        }
        candles.push_back(c);
    }

    if (limit > 0 && candles.size() > static_cast<size_t>(limit)) {
        candles.erase(candles.begin(), candles.end() - limit);
    }
    return candles;
}

std::map<std::string, std::string> default_cg_symbol_map() {
    return {
        {"BTCUSDT", "bitcoin"},
        {"ETHUSDT", "ethereum"},
        {"SOLUSDT", "solana"},
        {"BNBUSDT", "binancecoin"},
        {"XRPUSDT", "ripple"},
        {"ADAUSDT", "cardano"},
        {"AVAXUSDT", "avalanche-2"},
        {"DOGEUSDT", "dogecoin"},
        {"DOTUSDT", "polkadot"},
        {"MATICUSDT", "matic-network"}
    };
}

std::map<std::string, std::string> parse_cg_symbol_mapping(const nlohmann::json& doc,
                                                           const std::string& source) {
    const auto& mappings = doc.contains("mappings") ? doc.at("mappings") : doc;
    if (!mappings.is_object() || mappings.empty()) {
        throw ConfigError("Symbol mapping file contains no mappings: " + source);
    }

    std::map<std::string, std::string> out;
    for (const auto& [symbol, id] : mappings.items()) {
        if (!id.is_string() || id.get<std::string>().empty()) {
            throw ConfigError("Symbol mapping for " + symbol + " in " + source + " is not a coin id");
        }
        out[symbol] = id.get<std::string>();
    }
    return out;
}
