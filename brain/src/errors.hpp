#pragma once

#include <stdexcept>
#include <string>

// Root of every failure the brain raises on purpose.
class BrainError : public std::runtime_error {
public:
    explicit BrainError(const std::string& msg) : std::runtime_error(msg) {}
};

// Candle window unusable for the (symbol, timeframe); skipped for the cycle.
class DataError : public BrainError {
public:
    explicit DataError(const std::string& msg) : BrainError(msg) {}
};

class InsufficientDataError : public DataError {
public:
    InsufficientDataError(const std::string& msg, size_t have, size_t need)
        : DataError(msg), have_(have), need_(need) {}

    size_t have() const { return have_; }
    size_t need() const { return need_; }

private:
    size_t have_;
    size_t need_;
};

// Numeric failure while sizing or scoring; rejects a single candidate.
class ComputationError : public BrainError {
public:
    explicit ComputationError(const std::string& msg) : BrainError(msg) {}
};

class InvalidStopError : public ComputationError {
public:
    explicit InvalidStopError(const std::string& msg) : ComputationError(msg) {}
};

class PersistenceError : public BrainError {
public:
    explicit PersistenceError(const std::string& msg) : BrainError(msg) {}
};

class SimulationError : public BrainError {
public:
    explicit SimulationError(const std::string& msg) : BrainError(msg) {}
};

// Only error that stops the service.
class ConfigError : public BrainError {
public:
    explicit ConfigError(const std::string& msg) : BrainError(msg) {}
};
