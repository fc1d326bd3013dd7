#pragma once
#include "collaborators.hpp"
#include <string>
#include <pqxx/pqxx>

class PostgresStore : public RecordStore {
public:
    explicit PostgresStore(const std::string& dsn);
    void init_schema();

    std::map<std::string, Confidence> load_setup_confidences() override;
    void upsert_setup(const SetupCandidate& candidate, int64_t now_ms) override;

    void write_log(const LogEntry& entry) override;

    std::optional<Account> load_account() override;
    void create_account(const Account& account) override;

    std::optional<Position> load_open_trade() override;
    void save_open_trade(const Position& position) override;
    void update_water_marks(const Position& position) override;

    void record_close(const ClosedTrade& trade, const Account& account) override;

    bool ping() override;

private:
    std::string dsn_;
    pqxx::connection make_connection();
};
