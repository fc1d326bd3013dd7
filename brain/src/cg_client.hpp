#pragma once

#include "collaborators.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <curl/curl.h>

struct CoinGeckoOptions {
    std::string base_url = "https://api.coingecko.com/api/v3";
    std::string api_key;
    std::string symbol_mapping_file;
    int timeout_ms = 10000;
    int max_retries = 3;
    int max_calls_per_cycle = 100;
    int backoff_base_ms = 1000;
};

// Native OHLC from the /ohlc endpoint. Volume is not provided there and is left at 0.
class CoinGeckoClient : public CandleSource {
public:
    explicit CoinGeckoClient(const CoinGeckoOptions& options);
    ~CoinGeckoClient();

    CoinGeckoClient(const CoinGeckoClient&) = delete;
    CoinGeckoClient& operator=(const CoinGeckoClient&) = delete;

    std::vector<Candle> fetch_candles(const std::string& symbol,
                                      const std::string& timeframe,
                                      int limit) override;
    std::optional<double> latest_price(const std::string& symbol) override;
    void begin_cycle() override;

private:
    CoinGeckoOptions options_;
    CURL* curl_ = nullptr;
    struct curl_slist* headers_ = nullptr;
    std::map<std::string, std::string> symbol_map_;
    int calls_this_cycle_ = 0;

    std::string coin_id(const std::string& symbol) const;
    void load_symbol_mapping(const std::string& path);

    // Throws std::runtime_error once retries or the cycle budget run out.
    nlohmann::json make_request(const std::string& endpoint);

    static bool is_retryable_status(long status);
    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
