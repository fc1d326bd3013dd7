#include "health.hpp"
#include "util.hpp"

void HealthMonitor::set_postgres(bool ok) {
    std::lock_guard<std::mutex> lock(mutex_);
    postgres_ok_ = ok;
}

void HealthMonitor::set_redis(bool ok) {
    std::lock_guard<std::mutex> lock(mutex_);
    redis_ok_ = ok;
}

void HealthMonitor::set_loop_status(const std::string& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    loop_status_ = status;
}

void HealthMonitor::set_paper_status(const std::string& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    paper_status_ = status;
}

void HealthMonitor::record_cycle(int cycle_num, int64_t ts_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_cycle_ = cycle_num;
    last_cycle_ts_ms_ = ts_ms;
}

bool HealthMonitor::is_ok() const {
    std::lock_guard<std::mutex> lock(mutex_);
    // Redis only carries alerts; losing it degrades but does not fail the service
    return postgres_ok_ && loop_status_ != "error";
}

nlohmann::json HealthMonitor::to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {
        {"ok", postgres_ok_ && loop_status_ != "error"},
        {"postgres", postgres_ok_},
        {"redis", redis_ok_},
        {"loop", loop_status_},
        {"last_cycle", last_cycle_},
        {"last_cycle_ts", last_cycle_ts_ms_ > 0 ? util::to_iso8601(last_cycle_ts_ms_) : ""},
        {"paper_trading", paper_status_}
    };
}
