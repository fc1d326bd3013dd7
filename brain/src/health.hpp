#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <mutex>
#include <string>

// Shared between the cycle loop and the /health listener thread.
class HealthMonitor {
public:
    void set_postgres(bool ok);
    void set_redis(bool ok);
    void set_loop_status(const std::string& status);
    void set_paper_status(const std::string& status);
    void record_cycle(int cycle_num, int64_t ts_ms);

    nlohmann::json to_json() const;
    bool is_ok() const;

private:
    mutable std::mutex mutex_;
    bool postgres_ok_ = false;
    bool redis_ok_ = false;
    std::string loop_status_ = "starting";
    std::string paper_status_ = "disabled";
    int last_cycle_ = 0;
    int64_t last_cycle_ts_ms_ = 0;
};
