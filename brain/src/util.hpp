#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>

namespace util {
    std::string to_iso8601(int64_t ts_ms);
    int64_t current_timestamp_ms();
    std::vector<std::string> split(const std::string& str, char delim);
    std::string redact_dsn(const std::string& dsn);
    int random_jitter(int min_ms, int max_ms);
}
