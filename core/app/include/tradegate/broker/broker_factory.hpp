#pragma once

#include "tradegate/broker/i_broker.hpp"
#include "tradegate/config/trade_config.hpp"
#include "tradegate/time/i_time_provider.hpp"

#include <functional>
#include <memory>

namespace tradegate {

// Builds the IBroker a TradeConfig asks for:
//   dry_run = true  → SimulatedBroker quoting through an owned GatewayBroker
//   dry_run = false → GatewayBroker
// The returned broker is not connected yet.
std::unique_ptr<IBroker> makeBroker(const TradeConfig& config,
                                    const ITimeProvider& clock);

// Injection point for components that create their own brokers
// (SystemValidator). Tests substitute a factory returning fakes.
using BrokerFactory = std::function<std::unique_ptr<IBroker>(
    const TradeConfig&, const ITimeProvider&)>;

}  // namespace tradegate
