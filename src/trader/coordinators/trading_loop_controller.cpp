#include "trading_loop_controller.hpp"
#include "logging/logs/trading_loop_logs.hpp"
#include "trader/errors/trading_errors.hpp"
#include "utils/time_utils.hpp"
#include <set>

namespace IntradayTrader {
namespace Core {

using IntradayTrader::Logging::TradingLoopLogs;

std::string to_string(LoopState loop_state) {
    switch (loop_state) {
        case LoopState::IDLE: return "IDLE";
        case LoopState::AWAITING_WINDOW: return "AWAITING_WINDOW";
        case LoopState::SYNCING: return "SYNCING";
        case LoopState::DECIDING: return "DECIDING";
        case LoopState::SUBMITTING: return "SUBMITTING";
        case LoopState::END_OF_DAY_LIQUIDATION: return "END_OF_DAY_LIQUIDATION";
        case LoopState::STOPPED: return "STOPPED";
    }
    return "UNKNOWN";
}

TradingLoopController::TradingLoopController(std::shared_ptr<API::BrokerInterface> broker_param,
                                             std::shared_ptr<StrategyInterface> strategy_param,
                                             DataSyncCoordinator& data_sync_coordinator_ref,
                                             OrderLifecycleManager& order_manager_ref,
                                             ClockSource& clock_source_ref,
                                             const TimingConfig& timing_config_param,
                                             std::vector<std::string> tracked_symbols_param,
                                             Logging::LoggingContext& logging_context_ref)
    : broker(std::move(broker_param)), strategy(std::move(strategy_param)),
      data_sync_coordinator(data_sync_coordinator_ref), order_manager(order_manager_ref),
      clock_source(clock_source_ref), timing_config(timing_config_param),
      tracked_symbols(std::move(tracked_symbols_param)), logging_context(logging_context_ref),
      loop_state(LoopState::IDLE), tick_count(0) {}

void TradingLoopController::start() {
    if (!broker) {
        throw SetupError("no broker configured for the trading loop");
    }
    if (!strategy) {
        throw SetupError("no strategy configured for the trading loop");
    }
    if (data_sync_coordinator.feed_count() == 0) {
        throw SetupError("no data feeds configured for the trading loop");
    }

    TradingLoopLogs::log_loop_starting(logging_context, broker->get_broker_name(), strategy->get_strategy_name(),
                                       data_sync_coordinator.feed_count());
    connect_broker();
    data_sync_coordinator.initial_load(clock_source.now());
    transition_to(LoopState::IDLE);
}

void TradingLoopController::connect_broker() {
    const int max_attempts = timing_config.broker_connection_max_attempts;
    for (int attempt_number = 1; attempt_number <= max_attempts; ++attempt_number) {
        TradingLoopLogs::log_broker_connect_attempt(logging_context, attempt_number, max_attempts);
        try {
            broker->start();
            TradingLoopLogs::log_broker_connected(logging_context, broker->get_broker_name());
            return;
        } catch (const ConnectionError& connection_error) {
            TradingLoopLogs::log_broker_connect_failed(logging_context, attempt_number, connection_error.what());
            if (attempt_number == max_attempts) {
                throw;
            }
            clock_source.sleep_for(std::chrono::seconds(timing_config.broker_connection_retry_delay_seconds));
        }
    }
    throw ConnectionError("broker connection attempts exhausted");
}

void TradingLoopController::tick() {
    if (loop_state == LoopState::STOPPED) {
        return;
    }

    TimePoint now = clock_source.now();
    ++tick_count;

    if (is_end_of_day(now)) {
        run_end_of_day_liquidation(now);
        return;
    }

    if (is_in_action_window(now)) {
        TradingLoopLogs::log_tick_header(logging_context, tick_count, TimeUtils::format_utc_time(now));
        run_action_window(now);
    } else {
        transition_to(LoopState::AWAITING_WINDOW);
    }

    clock_source.sleep_for(std::chrono::milliseconds(timing_config.loop_poll_interval_milliseconds));
}

void TradingLoopController::run(std::atomic<bool>& running_flag) {
    start();
    while (running_flag.load() && loop_state != LoopState::STOPPED) {
        tick();
    }

    if (loop_state != LoopState::STOPPED) {
        TradingLoopLogs::log_external_stop(logging_context);
        broker->stop();
        transition_to(LoopState::STOPPED);
    }
    TradingLoopLogs::log_loop_stopped(logging_context, tick_count);
}

LoopState TradingLoopController::get_state() const {
    return loop_state;
}

unsigned long TradingLoopController::get_tick_count() const {
    return tick_count;
}

void TradingLoopController::transition_to(LoopState next_state) {
    if (next_state != loop_state) {
        TradingLoopLogs::log_state_change(logging_context, to_string(loop_state), to_string(next_state));
        loop_state = next_state;
    }
}

bool TradingLoopController::is_end_of_day(TimePoint now) const {
    std::tm utc_time = TimeUtils::to_utc_tm(now);
    return utc_time.tm_hour == timing_config.end_of_day_hour_utc && utc_time.tm_min == timing_config.end_of_day_minute_utc;
}

bool TradingLoopController::is_in_action_window(TimePoint now) const {
    std::tm utc_time = TimeUtils::to_utc_tm(now);
    return utc_time.tm_sec > 0 && utc_time.tm_sec <= timing_config.action_window_buffer_seconds;
}

void TradingLoopController::run_end_of_day_liquidation(TimePoint now) {
    transition_to(LoopState::END_OF_DAY_LIQUIDATION);
    TradingLoopLogs::log_end_of_day(logging_context, TimeUtils::format_utc_time(now), tracked_symbols.size());

    std::set<std::string> symbols_to_close(tracked_symbols.begin(), tracked_symbols.end());
    try {
        std::vector<std::string> liquidation_order_ids = order_manager.close_position(symbols_to_close);
        TradingLoopLogs::log_liquidation_orders(logging_context, liquidation_order_ids);
    } catch (const std::exception& exception_error) {
        TradingLoopLogs::log_liquidation_failed(logging_context, exception_error.what());
    }

    // The day ends here whether or not liquidation went through
    try {
        broker->stop();
    } catch (const std::exception& exception_error) {
        TradingLoopLogs::log_broker_stop_failed(logging_context, exception_error.what());
    }
    transition_to(LoopState::STOPPED);
}

void TradingLoopController::run_action_window(TimePoint now) {
    transition_to(LoopState::SYNCING);
    SyncOutcome sync_outcome = data_sync_coordinator.sync_tick(now);

    switch (sync_outcome.kind) {
        case SyncOutcomeKind::ALL_FRESH:
        case SyncOutcomeKind::ALL_UP_TO_DATE: {
            transition_to(LoopState::DECIDING);
            std::vector<OrderInstruction> order_instructions;
            try {
                order_instructions = strategy->decide(data_sync_coordinator.get_feed_data());
            } catch (const std::exception& exception_error) {
                TradingLoopLogs::log_strategy_failed(logging_context, strategy->get_strategy_name(), exception_error.what());
                break;
            }
            TradingLoopLogs::log_strategy_decision(logging_context, strategy->get_strategy_name(), order_instructions);

            transition_to(LoopState::SUBMITTING);
            submit_instructions(order_instructions);
            break;
        }
        case SyncOutcomeKind::ABORT:
            TradingLoopLogs::log_stale_abort(logging_context, sync_outcome.stale_feeds, sync_outcome.recommended_delay.count());
            clock_source.sleep_for(sync_outcome.recommended_delay);
            break;
        case SyncOutcomeKind::NEEDS_RETRY:
            TradingLoopLogs::log_sync_incomplete(logging_context);
            break;
    }
}

void TradingLoopController::submit_instructions(const std::vector<OrderInstruction>& order_instructions) {
    for (const OrderInstruction& order_instruction : order_instructions) {
        try {
            std::string order_id = order_manager.submit(order_instruction);
            TradingLoopLogs::log_instruction_submitted(logging_context, order_instruction.instrument, order_id);
        } catch (const std::exception& exception_error) {
            TradingLoopLogs::log_submission_failed(logging_context, order_instruction.instrument, exception_error.what());
        }
    }
}

} // namespace Core
} // namespace IntradayTrader
