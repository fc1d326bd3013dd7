#pragma once

#include <string>
#include <vector>
#include <cstdlib>

struct Config {
    // Redis
    std::string redis_url;
    std::string stream_alerts;

    // Postgres
    std::string pg_dsn;

    // Market data
    std::string coingecko_base_url;
    std::string coingecko_api_key;
    std::string symbol_mapping_file;
    std::vector<std::string> symbols;
    std::vector<std::string> timeframes;
    int ohlc_limit;
    int http_timeout_ms;
    int http_max_retries;
    int max_api_calls_per_cycle;

    // Loop; 0 runs a single cycle and exits
    int cycle_interval_sec;

    // Paper trading
    bool paper_trading_enabled;
    double paper_initial_capital;
    double paper_risk_fraction;
    double paper_reward_multiple;

    // HTTP
    std::string listen_addr;
    int listen_port;

    // Service
    std::string service_name;
    std::string log_level;

    static Config from_env();
    void validate() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static double get_env_double(const char* name, double default_val);
    static bool get_env_bool(const char* name, bool default_val);
};
