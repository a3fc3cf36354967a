#ifndef SYSTEM_MODULES_HPP
#define SYSTEM_MODULES_HPP

#include <memory>
#include "api/general/broker_interface.hpp"
#include "api/general/data_grabber_interface.hpp"
#include "trader/coordinators/data_sync_coordinator.hpp"
#include "trader/coordinators/trading_loop_controller.hpp"
#include "trader/orders/order_lifecycle_manager.hpp"
#include "trader/strategy_analysis/strategy_interface.hpp"

/**
 * @brief Runtime module container
 *
 * Holds active system modules as smart pointers for centralized ownership.
 * Declaration order is construction order; members are destroyed in reverse.
 */
struct SystemModules {
    // =========================================================================
    // EXTERNAL ADAPTERS
    // =========================================================================
    std::shared_ptr<IntradayTrader::API::DataGrabberInterface> data_grabber;  // Market data provider
    std::shared_ptr<IntradayTrader::API::BrokerInterface> broker;             // Paper or REST broker

    // =========================================================================
    // CORE TRADING COMPONENTS
    // =========================================================================
    std::unique_ptr<IntradayTrader::Core::OrderLifecycleManager> order_manager;
    std::unique_ptr<IntradayTrader::Core::DataSyncCoordinator> data_sync_coordinator;
    std::shared_ptr<IntradayTrader::Core::StrategyInterface> strategy;
    std::unique_ptr<IntradayTrader::Core::TradingLoopController> trading_loop;
};

#endif // SYSTEM_MODULES_HPP
