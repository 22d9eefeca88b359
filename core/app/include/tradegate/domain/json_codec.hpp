#pragma once

#include "tradegate/domain/account_info.hpp"
#include "tradegate/domain/position.hpp"
#include "tradegate/domain/trade_result.hpp"

#include <nlohmann/json.hpp>

namespace tradegate {
namespace domain {

// Report-side JSON views of the domain snapshots. Optional fields serialize
// as null; timestamps as ISO-8601 UTC strings.
nlohmann::json toJson(const AccountInfo& info);
nlohmann::json toJson(const Position& position);
nlohmann::json toJson(const TradeResult& result);

}  // namespace domain
}  // namespace tradegate
