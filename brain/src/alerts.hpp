#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>

// Payloads published on the alerts stream. Field names follow what the
// notifier formatter reads: severity, symbol, price, confidence, lines, plan, ts.
nlohmann::json build_setup_alert(const Decision& decision, int64_t now_ms);
nlohmann::json build_trade_opened_alert(const Position& position, int64_t now_ms);
nlohmann::json build_trade_closed_alert(const ClosedTrade& trade, const Account& account, int64_t now_ms);

// Details column of a decision log entry
nlohmann::json decision_details(const Decision& decision);
nlohmann::json position_json(const Position& position);
nlohmann::json account_json(const Account& account);
