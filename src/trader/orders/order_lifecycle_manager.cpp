#include "order_lifecycle_manager.hpp"
#include "logging/logs/order_logs.hpp"
#include "trader/errors/trading_errors.hpp"
#include "utils/instrument_utils.hpp"
#include <cstdlib>

namespace IntradayTrader {
namespace Core {

using IntradayTrader::Logging::OrderLogs;

OrderLifecycleManager::OrderLifecycleManager(API::BrokerInterface& broker_ref, OrderStatusMapping status_mapping_param,
                                             ClockSource& clock_source_ref, const TimingConfig& timing_config_param,
                                             Logging::LoggingContext& logging_context_ref)
    : broker(broker_ref), status_mapping(std::move(status_mapping_param)), clock_source(clock_source_ref),
      timing_config(timing_config_param), logging_context(logging_context_ref) {}

std::string OrderLifecycleManager::submit(const OrderInstruction& order_instruction) {
    if (order_instruction.quantity == 0) {
        throw InvalidOrder("quantity is zero for " + order_instruction.instrument);
    }

    Instrument instrument = parse_instrument(order_instruction.instrument);
    validate_prices(order_instruction);

    OrderLogs::log_order_instruction(logging_context, order_instruction);

    OrderRequest order_request = build_order_request(order_instruction, instrument);
    OrderPlacementResult placement_result = broker.place_order(order_request);

    if (placement_result.order_id.empty()) {
        throw InvalidOrder("broker returned no order id for " + order_instruction.instrument +
                           (placement_result.error_message.empty() ? std::string() : " (" + placement_result.error_message + ")"));
    }

    OrderRecord order_record;
    order_record.order_id = placement_result.order_id;
    order_record.instruction = order_instruction;
    order_record.instrument = instrument;
    order_record.last_known_state = placement_result.status.empty()
        ? OrderState::PENDING
        : status_mapping.map_status(placement_result.status);
    order_record.last_broker_status = placement_result.status;
    order_record.filled_price = placement_result.filled_price;
    order_record.submitted_at = clock_source.now();
    order_journal[placement_result.order_id] = order_record;

    OrderLogs::log_order_submitted(logging_context, placement_result.order_id, order_request, order_record.last_known_state);
    if (placement_result.error_code != 0) {
        OrderLogs::log_broker_error_code(logging_context, placement_result.order_id,
                                         placement_result.error_code, placement_result.error_message);
    }
    if (order_record.last_known_state == OrderState::FILLED || placement_result.filled_price > 0.0) {
        OrderLogs::log_order_filled(logging_context, placement_result.order_id, placement_result.filled_price);
    }

    return placement_result.order_id;
}

OrderState OrderLifecycleManager::status(const std::string& order_id) {
    std::optional<std::string> broker_status = broker.get_order_status(order_id);
    if (!broker_status) {
        throw OrderNotFound(order_id);
    }

    OrderState mapped_state = status_mapping.map_status(*broker_status);
    if (mapped_state == OrderState::UNKNOWN) {
        OrderLogs::log_unmapped_status(logging_context, order_id, *broker_status);
    }

    auto journal_iterator = order_journal.find(order_id);
    if (journal_iterator == order_journal.end()) {
        return mapped_state;
    }

    OrderRecord& order_record = journal_iterator->second;
    bool state_is_final = is_terminal_state(order_record.last_known_state) &&
                          !status_mapping.is_provisional_status(order_record.last_broker_status);
    if (state_is_final && mapped_state != order_record.last_known_state) {
        OrderLogs::log_terminal_state_kept(logging_context, order_id, order_record.last_known_state, *broker_status);
        return order_record.last_known_state;
    }

    order_record.last_known_state = mapped_state;
    order_record.last_broker_status = *broker_status;
    return mapped_state;
}

std::vector<std::string> OrderLifecycleManager::cancel(const std::set<std::string>& order_ids) {
    std::vector<std::string> cancelled_order_ids;
    std::vector<OpenOrder> open_orders = broker.get_open_orders();

    std::vector<std::string> orders_to_cancel;
    for (const OpenOrder& open_order : open_orders) {
        if (order_ids.empty() || order_ids.count(open_order.order_id) > 0) {
            orders_to_cancel.push_back(open_order.order_id);
        }
    }

    if (orders_to_cancel.empty()) {
        OrderLogs::log_no_open_orders(logging_context);
        return cancelled_order_ids;
    }

    for (size_t cancel_index = 0; cancel_index < orders_to_cancel.size(); ++cancel_index) {
        const std::string& order_id = orders_to_cancel[cancel_index];
        if (cancel_index > 0) {
            clock_source.sleep_for(std::chrono::milliseconds(timing_config.order_cancellation_processing_delay_milliseconds));
        }
        try {
            broker.cancel_order(order_id);
            cancelled_order_ids.push_back(order_id);
            OrderLogs::log_order_cancelled(logging_context, order_id);
        } catch (const std::exception& exception_error) {
            OrderLogs::log_cancel_failed(logging_context, order_id, exception_error.what());
        }
    }

    return cancelled_order_ids;
}

bool OrderLifecycleManager::is_pending(const std::string& order_id) {
    return state_matches(order_id, OrderState::PENDING, "is_pending");
}

bool OrderLifecycleManager::is_submitted(const std::string& order_id) {
    return state_matches(order_id, OrderState::SUBMITTED, "is_submitted");
}

bool OrderLifecycleManager::is_filled(const std::string& order_id) {
    return state_matches(order_id, OrderState::FILLED, "is_filled");
}

bool OrderLifecycleManager::is_cancelled(const std::string& order_id) {
    return state_matches(order_id, OrderState::CANCELLED, "is_cancelled");
}

double OrderLifecycleManager::get_filled_price(const std::string& order_id) const {
    return broker.get_filled_price(order_id);
}

std::vector<std::string> OrderLifecycleManager::close_position(const std::set<std::string>& symbols) {
    std::vector<std::string> requested_symbols(symbols.begin(), symbols.end());
    std::vector<std::string> closing_order_ids;

    PositionMap current_positions;
    try {
        current_positions = broker.get_positions(requested_symbols);
    } catch (const std::exception& exception_error) {
        OrderLogs::log_positions_unavailable(logging_context, requested_symbols, exception_error.what());
        return closing_order_ids;
    }

    std::vector<std::string> symbols_to_close = requested_symbols;
    if (symbols_to_close.empty()) {
        for (const auto& position_entry : current_positions) {
            symbols_to_close.push_back(position_entry.first);
        }
    }

    for (const std::string& symbol : symbols_to_close) {
        auto position_iterator = current_positions.find(symbol);
        if (position_iterator == current_positions.end()) {
            OrderLogs::log_position_skipped(logging_context, symbol, "no holding reported");
            continue;
        }

        const Position& position = position_iterator->second;
        if (position.quantity == 0) {
            OrderLogs::log_position_skipped(logging_context, symbol, "flat");
            continue;
        }

        OrderLogs::log_closing_position(logging_context, symbol, position.quantity);
        try {
            Instrument instrument(position.symbol, position.currency, position.trade_type);
            OrderInstruction closing_instruction(format_instrument(instrument), -position.quantity, OrderType::MARKET);
            closing_order_ids.push_back(submit(closing_instruction));
        } catch (const std::exception& exception_error) {
            OrderLogs::log_close_failed(logging_context, symbol, exception_error.what());
        }
    }

    return closing_order_ids;
}

const std::map<std::string, OrderRecord>& OrderLifecycleManager::get_order_journal() const {
    return order_journal;
}

OrderRequest OrderLifecycleManager::build_order_request(const OrderInstruction& order_instruction, const Instrument& instrument) const {
    OrderRequest order_request;
    order_request.instrument = instrument;
    order_request.side = order_instruction.quantity > 0 ? OrderSide::BUY : OrderSide::SELL;
    order_request.quantity = std::abs(order_instruction.quantity);
    order_request.order_type = order_instruction.order_type;
    order_request.time_in_force = order_instruction.time_in_force;
    order_request.limit_price = order_instruction.limit_price;
    order_request.stop_price = order_instruction.stop_price;
    return order_request;
}

void OrderLifecycleManager::validate_prices(const OrderInstruction& order_instruction) const {
    switch (order_instruction.order_type) {
        case OrderType::LIMIT:
        case OrderType::LIMIT_ON_CLOSE:
        case OrderType::TRAILING_LIMIT:
            if (!order_instruction.limit_price) {
                throw InvalidOrder(to_string(order_instruction.order_type) + " order for " +
                                   order_instruction.instrument + " requires a limit price");
            }
            break;
        case OrderType::STOP:
        case OrderType::TRAILING:
            if (!order_instruction.stop_price) {
                throw InvalidOrder(to_string(order_instruction.order_type) + " order for " +
                                   order_instruction.instrument + " requires a stop price");
            }
            break;
        case OrderType::STOP_LIMIT:
            if (!order_instruction.limit_price || !order_instruction.stop_price) {
                throw InvalidOrder("STOP_LIMIT order for " + order_instruction.instrument +
                                   " requires both a limit and a stop price");
            }
            break;
        case OrderType::MARKET:
        case OrderType::MARKET_ON_CLOSE:
            break;
    }
}

bool OrderLifecycleManager::state_matches(const std::string& order_id, OrderState expected_state, const std::string& operation_name) {
    try {
        return status(order_id) == expected_state;
    } catch (const OrderNotFound&) {
        OrderLogs::log_order_not_found(logging_context, order_id, operation_name);
        return false;
    }
}

} // namespace Core
} // namespace IntradayTrader
