#include "pg_store.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

PostgresStore::PostgresStore(const std::string& dsn) : dsn_(dsn) {
    spdlog::info("PostgresStore initialized: {}", util::redact_dsn(dsn));
}

pqxx::connection PostgresStore::make_connection() {
    return pqxx::connection(dsn_);
}

void PostgresStore::init_schema() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS setups_forming (
                id BIGSERIAL PRIMARY KEY,
                symbol TEXT NOT NULL,
                timeframe TEXT NOT NULL,
                setup_type TEXT NOT NULL,
                direction TEXT NOT NULL,
                confidence TEXT NOT NULL,
                context TEXT,
                entry_price DOUBLE PRECISION,
                stop_price DOUBLE PRECISION,
                detected_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                UNIQUE (symbol, timeframe, setup_type)
            )
        )");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS brain_logs (
                id BIGSERIAL PRIMARY KEY,
                ts TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                log_type TEXT NOT NULL,
                symbol TEXT,
                timeframe TEXT,
                message TEXT,
                details JSONB
            )
        )");

        txn.exec(R"(
            CREATE INDEX IF NOT EXISTS idx_brain_logs_type_ts ON brain_logs (log_type, ts DESC)
        )");

        // Single-row account
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS paper_account (
                id INT PRIMARY KEY DEFAULT 1 CHECK (id = 1),
                equity DOUBLE PRECISION NOT NULL,
                initial_capital DOUBLE PRECISION NOT NULL,
                total_trades INT NOT NULL DEFAULT 0,
                winning_trades INT NOT NULL DEFAULT 0,
                losing_trades INT NOT NULL DEFAULT 0,
                updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
            )
        )");

        // One slot: at most one open trade system-wide
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS paper_open_trades (
                slot INT PRIMARY KEY DEFAULT 1 CHECK (slot = 1),
                symbol TEXT NOT NULL,
                timeframe TEXT NOT NULL,
                direction TEXT NOT NULL,
                entry_price DOUBLE PRECISION NOT NULL,
                position_size DOUBLE PRECISION NOT NULL,
                stop_loss DOUBLE PRECISION NOT NULL,
                take_profit DOUBLE PRECISION NOT NULL,
                risk_amount DOUBLE PRECISION NOT NULL,
                equity_at_open DOUBLE PRECISION NOT NULL,
                opened_at TIMESTAMPTZ NOT NULL,
                setup_id TEXT NOT NULL,
                high_water_mark DOUBLE PRECISION NOT NULL,
                low_water_mark DOUBLE PRECISION NOT NULL
            )
        )");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS paper_closed_trades (
                id BIGSERIAL PRIMARY KEY,
                symbol TEXT NOT NULL,
                timeframe TEXT NOT NULL,
                direction TEXT NOT NULL,
                entry_price DOUBLE PRECISION NOT NULL,
                position_size DOUBLE PRECISION NOT NULL,
                stop_loss DOUBLE PRECISION NOT NULL,
                take_profit DOUBLE PRECISION NOT NULL,
                risk_amount DOUBLE PRECISION NOT NULL,
                equity_at_open DOUBLE PRECISION NOT NULL,
                opened_at TIMESTAMPTZ NOT NULL,
                setup_id TEXT NOT NULL,
                high_water_mark DOUBLE PRECISION,
                low_water_mark DOUBLE PRECISION,
                exit_price DOUBLE PRECISION NOT NULL,
                closed_at TIMESTAMPTZ NOT NULL,
                pnl DOUBLE PRECISION NOT NULL,
                pnl_percent DOUBLE PRECISION NOT NULL,
                exit_reason TEXT NOT NULL,
                duration_minutes BIGINT,
                mfe_percent DOUBLE PRECISION,
                mae_percent DOUBLE PRECISION
            )
        )");

        txn.commit();
        spdlog::info("Database schema initialized");

    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize schema: {}", e.what());
        throw PersistenceError(std::string("schema init failed: ") + e.what());
    }
}

std::map<std::string, Confidence> PostgresStore::load_setup_confidences() {
    std::map<std::string, Confidence> known;

    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        auto result = txn.exec("SELECT symbol, timeframe, setup_type, confidence FROM setups_forming");
        for (const auto& row : result) {
            auto confidence = parse_confidence(row[3].as<std::string>());
            if (!confidence) {
                continue;
            }
            std::string key = row[0].as<std::string>() + ":" + row[1].as<std::string>() + ":" +
                              row[2].as<std::string>();
            known[key] = *confidence;
        }

        txn.commit();

    } catch (const std::exception& e) {
        spdlog::error("Failed to load recorded setups: {}", e.what());
        throw PersistenceError(std::string("load setups failed: ") + e.what());
    }

    return known;
}

void PostgresStore::upsert_setup(const SetupCandidate& c, int64_t now_ms) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        txn.exec_params(
            "INSERT INTO setups_forming "
            "(symbol, timeframe, setup_type, direction, confidence, context, "
            " entry_price, stop_price, detected_at, updated_at) "
            "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, to_timestamp($9::bigint / 1000.0), to_timestamp($9::bigint / 1000.0)) "
            "ON CONFLICT (symbol, timeframe, setup_type) DO UPDATE SET "
            "direction = $4, confidence = $5, context = $6, "
            "entry_price = $7, stop_price = $8, updated_at = to_timestamp($9::bigint / 1000.0)",
            c.symbol, c.timeframe, c.setup_type, to_string(c.direction),
            to_string(c.confidence), c.context, c.entry_price, c.stop_price, now_ms
        );

        txn.commit();

    } catch (const std::exception& e) {
        spdlog::error("Failed to upsert setup {}: {}", c.setup_id(), e.what());
        throw PersistenceError(std::string("upsert setup failed: ") + e.what());
    }
}

void PostgresStore::write_log(const LogEntry& entry) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        txn.exec_params(
            "INSERT INTO brain_logs (ts, log_type, symbol, timeframe, message, details) "
            "VALUES (to_timestamp($1::bigint / 1000.0), $2, NULLIF($3, ''), NULLIF($4, ''), $5, $6::jsonb)",
            entry.ts_ms, entry.log_type, entry.symbol, entry.timeframe,
            entry.message, entry.details.dump()
        );

        txn.commit();

    } catch (const std::exception& e) {
        throw PersistenceError(std::string("brain_logs insert failed: ") + e.what());
    }
}

std::optional<Account> PostgresStore::load_account() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        auto result = txn.exec(
            "SELECT equity, initial_capital, total_trades, winning_trades, losing_trades, "
            "(EXTRACT(EPOCH FROM updated_at) * 1000)::BIGINT "
            "FROM paper_account WHERE id = 1"
        );
        txn.commit();

        if (result.empty()) {
            return std::nullopt;
        }

        const auto& row = result[0];
        Account account;
        account.equity = row[0].as<double>();
        account.initial_capital = row[1].as<double>();
        account.total_trades = row[2].as<int>();
        account.winning_trades = row[3].as<int>();
        account.losing_trades = row[4].as<int>();
        account.updated_at_ms = row[5].as<int64_t>();
        return account;

    } catch (const std::exception& e) {
        spdlog::error("Failed to load paper account: {}", e.what());
        throw PersistenceError(std::string("load account failed: ") + e.what());
    }
}

void PostgresStore::create_account(const Account& a) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        txn.exec_params(
            "INSERT INTO paper_account "
            "(id, equity, initial_capital, total_trades, winning_trades, losing_trades, updated_at) "
            "VALUES (1, $1, $2, $3, $4, $5, to_timestamp($6::bigint / 1000.0)) "
            "ON CONFLICT (id) DO NOTHING",
            a.equity, a.initial_capital, a.total_trades, a.winning_trades,
            a.losing_trades, a.updated_at_ms
        );

        txn.commit();
        spdlog::info("Paper account row created");

    } catch (const std::exception& e) {
        spdlog::error("Failed to create paper account: {}", e.what());
        throw PersistenceError(std::string("create account failed: ") + e.what());
    }
}

std::optional<Position> PostgresStore::load_open_trade() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        auto result = txn.exec(
            "SELECT symbol, timeframe, direction, entry_price, position_size, stop_loss, "
            "take_profit, risk_amount, equity_at_open, "
            "(EXTRACT(EPOCH FROM opened_at) * 1000)::BIGINT, setup_id, "
            "high_water_mark, low_water_mark "
            "FROM paper_open_trades WHERE slot = 1"
        );
        txn.commit();

        if (result.empty()) {
            return std::nullopt;
        }

        const auto& row = result[0];
        auto direction = parse_direction(row[2].as<std::string>());
        if (!direction) {
            throw PersistenceError("open trade has unknown direction " + row[2].as<std::string>());
        }

        Position p;
        p.symbol = row[0].as<std::string>();
        p.timeframe = row[1].as<std::string>();
        p.direction = *direction;
        p.entry_price = row[3].as<double>();
        p.size = row[4].as<double>();
        p.stop_price = row[5].as<double>();
        p.target_price = row[6].as<double>();
        p.risk_amount = row[7].as<double>();
        p.equity_at_open = row[8].as<double>();
        p.opened_at_ms = row[9].as<int64_t>();
        p.setup_id = row[10].as<std::string>();
        p.high_water_mark = row[11].as<double>();
        p.low_water_mark = row[12].as<double>();
        return p;

    } catch (const PersistenceError&) {
        throw;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load open paper trade: {}", e.what());
        throw PersistenceError(std::string("load open trade failed: ") + e.what());
    }
}

void PostgresStore::save_open_trade(const Position& p) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        // Plain INSERT: the slot key rejects a second open trade
        txn.exec_params(
            "INSERT INTO paper_open_trades "
            "(slot, symbol, timeframe, direction, entry_price, position_size, stop_loss, take_profit, "
            " risk_amount, equity_at_open, opened_at, setup_id, high_water_mark, low_water_mark) "
            "VALUES (1, $1, $2, $3, $4, $5, $6, $7, $8, $9, to_timestamp($10::bigint / 1000.0), $11, $12, $13)",
            p.symbol, p.timeframe, to_string(p.direction), p.entry_price, p.size,
            p.stop_price, p.target_price, p.risk_amount, p.equity_at_open,
            p.opened_at_ms, p.setup_id, p.high_water_mark, p.low_water_mark
        );

        txn.commit();
        spdlog::info("Saved open paper trade {}", p.setup_id);

    } catch (const std::exception& e) {
        spdlog::error("Failed to save open paper trade {}: {}", p.setup_id, e.what());
        throw PersistenceError(std::string("save open trade failed: ") + e.what());
    }
}

void PostgresStore::update_water_marks(const Position& p) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        txn.exec_params(
            "UPDATE paper_open_trades SET high_water_mark = $1, low_water_mark = $2 "
            "WHERE slot = 1 AND setup_id = $3",
            p.high_water_mark, p.low_water_mark, p.setup_id
        );

        txn.commit();

    } catch (const std::exception& e) {
        spdlog::error("Failed to update water marks for {}: {}", p.setup_id, e.what());
        throw PersistenceError(std::string("update water marks failed: ") + e.what());
    }
}

void PostgresStore::record_close(const ClosedTrade& t, const Account& a) {
    const auto& p = t.position;

    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        txn.exec_params(
            "INSERT INTO paper_closed_trades "
            "(symbol, timeframe, direction, entry_price, position_size, stop_loss, take_profit, "
            " risk_amount, equity_at_open, opened_at, setup_id, high_water_mark, low_water_mark, "
            " exit_price, closed_at, pnl, pnl_percent, exit_reason, duration_minutes, "
            " mfe_percent, mae_percent) "
            "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, to_timestamp($10::bigint / 1000.0), $11, $12, $13, "
            " $14, to_timestamp($15::bigint / 1000.0), $16, $17, $18, $19, $20, $21)",
            p.symbol, p.timeframe, to_string(p.direction), p.entry_price, p.size,
            p.stop_price, p.target_price, p.risk_amount, p.equity_at_open,
            p.opened_at_ms, p.setup_id, p.high_water_mark, p.low_water_mark,
            t.exit_price, t.closed_at_ms, t.pnl, t.pnl_percent, to_string(t.exit_reason),
            t.duration_minutes, t.mfe_percent, t.mae_percent
        );

        txn.exec("DELETE FROM paper_open_trades WHERE slot = 1");

        txn.exec_params(
            "UPDATE paper_account SET equity = $1, total_trades = $2, winning_trades = $3, "
            "losing_trades = $4, updated_at = to_timestamp($5::bigint / 1000.0) WHERE id = 1",
            a.equity, a.total_trades, a.winning_trades, a.losing_trades, a.updated_at_ms
        );

        txn.commit();
        spdlog::info("Recorded close of {} ({})", p.setup_id, to_string(t.exit_reason));

    } catch (const std::exception& e) {
        spdlog::error("Failed to record close of {}: {}", p.setup_id, e.what());
        throw PersistenceError(std::string("record close failed: ") + e.what());
    }
}

bool PostgresStore::ping() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        txn.exec("SELECT 1");
        txn.commit();
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Postgres ping failed: {}", e.what());
        return false;
    }
}
