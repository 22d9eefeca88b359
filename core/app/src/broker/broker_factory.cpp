#include "tradegate/broker/broker_factory.hpp"
#include "tradegate/broker/gateway_broker.hpp"
#include "tradegate/broker/simulated_broker.hpp"

#include <iostream>

namespace tradegate {

std::unique_ptr<IBroker> makeBroker(const TradeConfig& config,
                                    const ITimeProvider& clock) {
  if (config.dry_run) {
    std::cout << "[BrokerFactory] dry run: simulated fills, quotes from "
              << config.gatewayEndpoint() << "\n";
    return std::make_unique<SimulatedBroker>(
        config, clock, std::make_unique<GatewayBroker>(config, clock));
  }
  std::cout << "[BrokerFactory] LIVE: orders routed to "
            << config.gatewayEndpoint() << "\n";
  return std::make_unique<GatewayBroker>(config, clock);
}

}  // namespace tradegate
