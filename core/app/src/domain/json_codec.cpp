#include "tradegate/domain/json_codec.hpp"
#include "tradegate/time/time_utils.hpp"

namespace tradegate {
namespace domain {

nlohmann::json toJson(const AccountInfo& info) {
  return {
      {"account_id", info.account_id},
      {"total_assets", info.total_assets},
      {"cash", info.cash},
      {"market_value", info.market_value},
      {"unrealized_pnl", info.unrealized_pnl},
      {"realized_pnl", info.realized_pnl},
      {"buying_power", info.buying_power},
      {"currency", info.currency},
  };
}

nlohmann::json toJson(const Position& p) {
  return {
      {"symbol", p.symbol},
      {"quantity", p.quantity},
      {"avg_cost", p.avg_cost},
      {"market_value", p.market_value},
      {"unrealized_pnl", p.unrealized_pnl},
      {"market_price", p.market_price},
  };
}

nlohmann::json toJson(const TradeResult& r) {
  nlohmann::json j;
  j["order_id"] = r.order_id;
  j["symbol"] = r.symbol;
  j["side"] = sideToString(r.side);
  j["quantity"] = r.quantity;
  j["filled_quantity"] = r.filled_quantity;
  j["avg_price"] = r.avg_price ? nlohmann::json(*r.avg_price)
                               : nlohmann::json(nullptr);
  j["status"] = orderStatusToString(r.status);
  j["submit_time"] = format_iso8601(r.submit_time_ms);
  j["update_time"] = r.update_time_ms
                         ? nlohmann::json(format_iso8601(*r.update_time_ms))
                         : nlohmann::json(nullptr);
  j["error_msg"] = r.error_msg ? nlohmann::json(*r.error_msg)
                               : nlohmann::json(nullptr);
  j["commission"] = r.commission;
  return j;
}

}  // namespace domain
}  // namespace tradegate
