#ifndef TRADING_LOOP_CONTROLLER_HPP
#define TRADING_LOOP_CONTROLLER_HPP

#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include "api/general/broker_interface.hpp"
#include "configs/timing_config.hpp"
#include "logging/logger/async_logger.hpp"
#include "trader/coordinators/data_sync_coordinator.hpp"
#include "trader/orders/order_lifecycle_manager.hpp"
#include "trader/strategy_analysis/strategy_interface.hpp"
#include "utils/clock_source.hpp"

namespace IntradayTrader {
namespace Core {

enum class LoopState {
    IDLE,
    AWAITING_WINDOW,
    SYNCING,
    DECIDING,
    SUBMITTING,
    END_OF_DAY_LIQUIDATION,
    STOPPED
};

std::string to_string(LoopState loop_state);

/**
 * @brief Drives one trading day: wait for the action window, sync feeds, decide, submit.
 *
 * The end-of-day minute liquidates every tracked symbol, stops the broker and ends the loop.
 * Ticks run on the calling thread and never overlap.
 */
class TradingLoopController {
public:
    TradingLoopController(std::shared_ptr<API::BrokerInterface> broker_param,
                          std::shared_ptr<StrategyInterface> strategy_param,
                          DataSyncCoordinator& data_sync_coordinator_ref,
                          OrderLifecycleManager& order_manager_ref,
                          ClockSource& clock_source_ref,
                          const TimingConfig& timing_config_param,
                          std::vector<std::string> tracked_symbols_param,
                          Logging::LoggingContext& logging_context_ref);

    // Throws SetupError when a collaborator is missing, ConnectionError when the broker never connects
    void start();

    // One iteration; sleeps the poll interval unless the loop has stopped
    void tick();

    // start() then tick until STOPPED or until running_flag clears
    void run(std::atomic<bool>& running_flag);

    LoopState get_state() const;
    unsigned long get_tick_count() const;

private:
    std::shared_ptr<API::BrokerInterface> broker;
    std::shared_ptr<StrategyInterface> strategy;
    DataSyncCoordinator& data_sync_coordinator;
    OrderLifecycleManager& order_manager;
    ClockSource& clock_source;
    const TimingConfig& timing_config;
    std::vector<std::string> tracked_symbols;
    Logging::LoggingContext& logging_context;
    LoopState loop_state;
    unsigned long tick_count;

    void transition_to(LoopState next_state);
    void connect_broker();
    bool is_end_of_day(TimePoint now) const;
    bool is_in_action_window(TimePoint now) const;
    void run_end_of_day_liquidation(TimePoint now);
    void run_action_window(TimePoint now);
    void submit_instructions(const std::vector<OrderInstruction>& order_instructions);
};

} // namespace Core
} // namespace IntradayTrader

#endif // TRADING_LOOP_CONTROLLER_HPP
