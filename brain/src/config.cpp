#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/ranges.h>
#include <algorithm>
#include <cctype>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

double Config::get_env_double(const char* name, double default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stod(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid number for {}, using default {}", name, default_val);
        return default_val;
    }
}

bool Config::get_env_bool(const char* name, bool default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    std::string s(val);
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    if (s == "true" || s == "1" || s == "yes") return true;
    if (s == "false" || s == "0" || s == "no" || s.empty()) return false;
    spdlog::warn("Invalid boolean for {}, using default {}", name, default_val);
    return default_val;
}

Config Config::from_env() {
    Config cfg;

    cfg.redis_url = get_env("REDIS_URL", "redis://localhost:6379");
    cfg.stream_alerts = get_env("STREAM_ALERTS", "yagati.alerts");

    cfg.pg_dsn = get_env("PG_DSN");

    cfg.coingecko_base_url = get_env("COINGECKO_BASE_URL", "https://api.coingecko.com/api/v3");
    cfg.coingecko_api_key = get_env("COINGECKO_API_KEY");
    cfg.symbol_mapping_file = get_env("SYMBOL_MAPPING_FILE");
    cfg.symbols = util::split(get_env("SYMBOLS", "BTCUSDT,ETHUSDT,SOLUSDT,BNBUSDT,XRPUSDT"), ',');
    cfg.timeframes = util::split(get_env("TIMEFRAMES", "4h,1d"), ',');
    cfg.ohlc_limit = get_env_int("OHLC_LIMIT", 260);
    cfg.http_timeout_ms = get_env_int("HTTP_TIMEOUT_MS", 10000);
    cfg.http_max_retries = get_env_int("HTTP_MAX_RETRIES", 3);
    cfg.max_api_calls_per_cycle = get_env_int("MAX_API_CALLS_PER_CYCLE", 100);

    cfg.cycle_interval_sec = get_env_int("CYCLE_INTERVAL_SEC", 900);

    cfg.paper_trading_enabled = get_env_bool("PAPER_TRADING_ENABLED", false);
    cfg.paper_initial_capital = get_env_double("PAPER_INITIAL_CAPITAL", 100000.0);
    cfg.paper_risk_fraction = get_env_double("PAPER_RISK_FRACTION", 0.01);
    cfg.paper_reward_multiple = get_env_double("PAPER_REWARD_MULTIPLE", 2.0);

    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8085);

    cfg.service_name = get_env("SERVICE_NAME", "brain");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::validate() const {
    if (pg_dsn.empty()) {
        throw ConfigError("PG_DSN is required");
    }
    if (symbols.empty()) {
        throw ConfigError("SYMBOLS must name at least one symbol");
    }
    if (timeframes.empty()) {
        throw ConfigError("TIMEFRAMES must name at least one timeframe");
    }
    if (ohlc_limit <= 0) {
        throw ConfigError("OHLC_LIMIT must be positive");
    }
    if (cycle_interval_sec < 0) {
        throw ConfigError("CYCLE_INTERVAL_SEC cannot be negative");
    }
    if (!(paper_risk_fraction > 0.0 && paper_risk_fraction < 1.0)) {
        throw ConfigError("PAPER_RISK_FRACTION must be in (0, 1)");
    }
    if (!(paper_reward_multiple > 0.0)) {
        throw ConfigError("PAPER_REWARD_MULTIPLE must be positive");
    }
    if (!(paper_initial_capital > 0.0)) {
        throw ConfigError("PAPER_INITIAL_CAPITAL must be positive");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Postgres: {}", util::redact_dsn(pg_dsn));
    spdlog::info("  Universe: {} x {}", fmt::join(symbols, ","), fmt::join(timeframes, ","));
    spdlog::info("  Cycle interval: {}s{}", cycle_interval_sec,
                 cycle_interval_sec == 0 ? " (single run)" : "");
    spdlog::info("  Paper trading: {}", paper_trading_enabled ? "enabled" : "disabled");
}
