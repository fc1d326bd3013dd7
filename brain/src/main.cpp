#include "config.hpp"
#include "errors.hpp"
#include "brain_cycle.hpp"
#include "cg_client.hpp"
#include "pg_store.hpp"
#include "redis_bus.hpp"
#include "health.hpp"
#include "util.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <atomic>
#include <thread>
#include <chrono>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int) {
    shutdown_requested = true;
}

void setup_logging(const std::string& service_name, const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(service_name, console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    spdlog::info("Logging initialized at level: {}", log_level);
}

// Sleeps in short slices so a signal ends the wait promptly.
void wait_for_next_cycle(int interval_sec) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(interval_sec);
    while (!shutdown_requested && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(250));
    }
}

int main() {
    Config config;
    try {
        config = Config::from_env();
        setup_logging(config.service_name, config.log_level);
        config.validate();
    } catch (const ConfigError& e) {
        spdlog::critical("Configuration error: {}", e.what());
        return 1;
    }

    try {
        spdlog::info("==============================================");
        spdlog::info("YAGATI brain: setup detection + paper trading");
        spdlog::info("==============================================");

        auto pg = std::make_shared<PostgresStore>(config.pg_dsn);
        try {
            pg->init_schema();
        } catch (const PersistenceError& e) {
            spdlog::error("Schema not initialized, cycles will retry their writes: {}", e.what());
        }

        auto redis = std::make_shared<RedisBus>(config.redis_url, config.stream_alerts);

        CoinGeckoOptions cg_options;
        cg_options.base_url = config.coingecko_base_url;
        cg_options.api_key = config.coingecko_api_key;
        cg_options.symbol_mapping_file = config.symbol_mapping_file;
        cg_options.timeout_ms = config.http_timeout_ms;
        cg_options.max_retries = config.http_max_retries;
        cg_options.max_calls_per_cycle = config.max_api_calls_per_cycle;
        auto source = std::make_shared<CoinGeckoClient>(cg_options);

        std::map<std::string, Confidence> seed;
        try {
            seed = pg->load_setup_confidences();
            spdlog::info("Seeded setup recorder with {} known setups", seed.size());
        } catch (const PersistenceError& e) {
            spdlog::warn("Starting with an empty setup cache: {}", e.what());
        }

        CycleOptions options;
        options.symbols = config.symbols;
        options.timeframes = config.timeframes;
        options.ohlc_limit = config.ohlc_limit;
        options.paper_trading_enabled = config.paper_trading_enabled;
        options.paper_initial_capital = config.paper_initial_capital;

        PaperTradingEngine paper(PositionSizer(config.paper_risk_fraction, config.paper_reward_multiple));
        BrainCycle cycle(options, source, pg, redis, SetupRecorder(std::move(seed)),
                         FeatureEngine(), SetupDetector(), DecisionEngine(), paper);

        HealthMonitor health;
        health.set_postgres(pg->ping());
        health.set_redis(redis->ping());
        health.set_loop_status("idle");
        health.set_paper_status(config.paper_trading_enabled ? "enabled" : "disabled");

        signal(SIGTERM, signal_handler);
        signal(SIGINT, signal_handler);

        bool run_once = config.cycle_interval_sec == 0;

        httplib::Server http_server;
        std::thread http_thread;
        if (!run_once) {
            http_server.Get("/health", [&health](const httplib::Request&, httplib::Response& res) {
                res.set_content(health.to_json().dump(), "application/json");
                res.status = health.is_ok() ? 200 : 503;
            });

            // Bound here so stop() below always has a running server to stop
            if (http_server.bind_to_port(config.listen_addr.c_str(), config.listen_port)) {
                http_thread = std::thread([&]() {
                    spdlog::info("HTTP server listening on {}:{}", config.listen_addr, config.listen_port);
                    if (!http_server.listen_after_bind()) {
                        spdlog::error("HTTP server stopped unexpectedly");
                    }
                });
                http_server.wait_until_ready();
            } else {
                spdlog::error("HTTP server failed to bind {}:{}, /health unavailable",
                              config.listen_addr, config.listen_port);
            }
        }

        int cycle_num = 0;
        while (!shutdown_requested) {
            cycle_num++;
            health.set_loop_status("running");

            try {
                auto stats = cycle.run(cycle_num, util::current_timestamp_ms());
                health.record_cycle(cycle_num, stats.started_ms);
                if (config.paper_trading_enabled) {
                    health.set_paper_status(stats.paper_status);
                }
                health.set_loop_status("idle");
            } catch (const std::exception& e) {
                spdlog::error("Cycle {} aborted: {}", cycle_num, e.what());
                health.set_loop_status("error");
            }

            health.set_postgres(pg->ping());
            health.set_redis(redis->ping());

            if (run_once) {
                break;
            }
            wait_for_next_cycle(config.cycle_interval_sec);
        }

        spdlog::info("Shutting down after {} cycles", cycle_num);
        health.set_loop_status("shutdown");
        if (http_thread.joinable()) {
            http_server.stop();
            http_thread.join();
        }

        spdlog::info("Shutdown complete");
        return 0;

    } catch (const ConfigError& e) {
        spdlog::critical("Configuration error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::critical("Startup failed: {}", e.what());
        return 1;
    }
}
