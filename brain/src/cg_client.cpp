#include "cg_client.hpp"
#include "cg_parse.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <chrono>
#include <fstream>
#include <stdexcept>
#include <thread>

CoinGeckoClient::CoinGeckoClient(const CoinGeckoOptions& options)
    : options_(options)
    , symbol_map_(default_cg_symbol_map())
{
    // Mapping errors are thrown before any curl handle exists
    if (!options_.symbol_mapping_file.empty()) {
        load_symbol_mapping(options_.symbol_mapping_file);
    }

    curl_ = curl_easy_init();
    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL for CoinGecko");
    }

    headers_ = curl_slist_append(headers_, "Accept: application/json");
    if (!options_.api_key.empty()) {
        std::string key_header = "x-cg-demo-api-key: " + options_.api_key;
        headers_ = curl_slist_append(headers_, key_header.c_str());
    }

    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(options_.timeout_ms));
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers_);
    curl_easy_setopt(curl_, CURLOPT_USERAGENT, "yagati-brain/2.0");
    curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);

    spdlog::info("CoinGeckoClient ready: {} ({} symbol mappings, {} calls/cycle)",
                 options_.base_url, symbol_map_.size(), options_.max_calls_per_cycle);
}

CoinGeckoClient::~CoinGeckoClient() {
    if (headers_) {
        curl_slist_free_all(headers_);
    }
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
}

void CoinGeckoClient::load_symbol_mapping(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Symbol mapping file not found: " + path);
    }

    nlohmann::json doc;
    try {
        in >> doc;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Invalid JSON in symbol mapping file " + path + ": " + e.what());
    }

    auto mappings = parse_cg_symbol_mapping(doc, path);
    for (const auto& [symbol, id] : mappings) {
        symbol_map_[symbol] = id;
    }
    spdlog::info("Loaded {} symbol mappings from {}", mappings.size(), path);
}

std::string CoinGeckoClient::coin_id(const std::string& symbol) const {
    auto it = symbol_map_.find(symbol);
    if (it == symbol_map_.end()) {
        throw std::runtime_error("Symbol " + symbol + " has no CoinGecko mapping");
    }
    return it->second;
}

size_t CoinGeckoClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

bool CoinGeckoClient::is_retryable_status(long status) {
    return status == 429 || status >= 500;
}

void CoinGeckoClient::begin_cycle() {
    if (calls_this_cycle_ > 0) {
        spdlog::debug("CoinGecko calls last cycle: {}", calls_this_cycle_);
    }
    calls_this_cycle_ = 0;
}

nlohmann::json CoinGeckoClient::make_request(const std::string& endpoint) {
    std::string url = options_.base_url + endpoint;
    std::string last_error;

    for (int attempt = 0; attempt <= options_.max_retries; ++attempt) {
        if (calls_this_cycle_ >= options_.max_calls_per_cycle) {
            throw std::runtime_error(fmt::format("API call budget of {} per cycle exhausted",
                                                 options_.max_calls_per_cycle));
        }

        if (attempt > 0) {
            int delay_ms = options_.backoff_base_ms * (1 << (attempt - 1)) +
                           util::random_jitter(0, options_.backoff_base_ms / 4);
            spdlog::warn("Retrying {} in {} ms (attempt {}/{}): {}",
                         endpoint, delay_ms, attempt, options_.max_retries, last_error);
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        }

        std::string response_string;
        curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_string);

        calls_this_cycle_++;
        CURLcode res = curl_easy_perform(curl_);

        if (res != CURLE_OK) {
            last_error = curl_easy_strerror(res);
            continue;
        }

        long status = 0;
        curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &status);

        if (status >= 400) {
            last_error = fmt::format("HTTP {}", status);
            if (is_retryable_status(status)) {
                continue;
            }
            throw std::runtime_error(fmt::format("CoinGecko {} returned HTTP {}", endpoint, status));
        }

        try {
            return nlohmann::json::parse(response_string);
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error(std::string("Failed to parse CoinGecko response: ") + e.what());
        }
    }

    throw std::runtime_error(fmt::format("CoinGecko {} failed after {} retries: {}",
                                         endpoint, options_.max_retries, last_error));
}

std::vector<Candle> CoinGeckoClient::fetch_candles(const std::string& symbol,
                                                   const std::string& timeframe,
                                                   int limit) {
    std::string id = coin_id(symbol);
    int days = cg_days_for_timeframe(timeframe);

    auto response = make_request(fmt::format("/coins/{}/ohlc?vs_currency=usd&days={}", id, days));
    auto candles = parse_cg_ohlc(response, limit);

    spdlog::debug("Fetched {} candles for {} {} ({} days)", candles.size(), symbol, timeframe, days);
    return candles;
}

std::optional<double> CoinGeckoClient::latest_price(const std::string& symbol) {
    std::string id = coin_id(symbol);

    auto response = make_request("/simple/price?ids=" + id + "&vs_currencies=usd");
    if (response.empty() || !response.contains(id)) {
        return std::nullopt;
    }
    if (response[id].contains("usd")) {
        return response[id]["usd"].get<double>();
    }
    return std::nullopt;
}
