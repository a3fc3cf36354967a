#include "momentum_williams_strategy.hpp"
#include "logging/logs/strategy_logs.hpp"
#include "trader/strategy_analysis/indicators.hpp"
#include "utils/instrument_utils.hpp"
#include <algorithm>
#include <cmath>

namespace IntradayTrader {
namespace Core {

using IntradayTrader::Logging::StrategyLogs;

MomentumWilliamsStrategy::MomentumWilliamsStrategy(API::BrokerInterface& broker_ref, const StrategyConfig& strategy_config_param,
                                                   Logging::LoggingContext& logging_context_ref)
    : broker(broker_ref), strategy_config(strategy_config_param), logging_context(logging_context_ref),
      quote_instrument(parse_instrument(strategy_config_param.quote_instrument)),
      time_in_force(parse_time_in_force(strategy_config_param.time_in_force)) {
    if (!strategy_config.hedge_feed_name.empty()) {
        hedge_instrument = parse_instrument(strategy_config.hedge_instrument);
    }
}

std::string MomentumWilliamsStrategy::get_strategy_name() const {
    return "MomentumWilliamsR";
}

std::vector<OrderInstruction> MomentumWilliamsStrategy::decide(const FeedDataMap& feed_data) {
    if (!initial_cash) {
        initial_cash = broker.get_cash();
    }

    std::optional<SignalSnapshot> signal_snapshot = compute_signals(feed_data);
    if (!signal_snapshot) {
        return {};
    }

    if (!hedge_instrument) {
        return decide_single(*signal_snapshot);
    }

    auto hedge_iterator = feed_data.find(strategy_config.hedge_feed_name);
    if (hedge_iterator == feed_data.end() || hedge_iterator->second.empty()) {
        StrategyLogs::log_insufficient_data(logging_context, strategy_config.hedge_feed_name, 0, 1);
        return {};
    }
    double hedge_close = hedge_iterator->second.back().close_price;
    if (hedge_close <= 0.0) {
        return {};
    }
    return decide_pair(*signal_snapshot, hedge_close);
}

size_t MomentumWilliamsStrategy::required_bar_count() const {
    size_t momentum_bars = static_cast<size_t>(strategy_config.momentum_period + strategy_config.momentum_ma_period + 1);
    return std::max(momentum_bars, static_cast<size_t>(strategy_config.williams_period));
}

std::optional<MomentumWilliamsStrategy::SignalSnapshot> MomentumWilliamsStrategy::compute_signals(const FeedDataMap& feed_data) {
    auto quote_iterator = feed_data.find(strategy_config.quote_feed_name);
    size_t available_bars = quote_iterator == feed_data.end() ? 0 : quote_iterator->second.size();
    if (available_bars < required_bar_count()) {
        StrategyLogs::log_insufficient_data(logging_context, strategy_config.quote_feed_name, available_bars, required_bar_count());
        return std::nullopt;
    }

    const BarTable& quote_bars = quote_iterator->second;
    std::vector<double> close_values = extract_closes(quote_bars);
    std::vector<double> momentum_values = calculate_momentum_series(close_values, strategy_config.momentum_period);
    std::vector<double> momentum_averages = calculate_sma_series(momentum_values, strategy_config.momentum_ma_period);

    SignalSnapshot signal_snapshot;
    signal_snapshot.quote_close = close_values.back();
    signal_snapshot.crossover_direction = detect_crossover(momentum_values, momentum_averages);
    signal_snapshot.williams_r_value = calculate_williams_r(quote_bars, strategy_config.williams_period);

    StrategyLogs::log_indicator_snapshot(logging_context, signal_snapshot.quote_close, momentum_values.back(),
                                         momentum_averages.back(), signal_snapshot.crossover_direction,
                                         signal_snapshot.williams_r_value);

    if (signal_snapshot.quote_close <= 0.0) {
        return std::nullopt;
    }
    return signal_snapshot;
}

std::vector<OrderInstruction> MomentumWilliamsStrategy::decide_single(const SignalSnapshot& signal_snapshot) {
    PositionMap positions = broker.get_positions({quote_instrument.symbol});
    Position quote_position = find_position(positions, quote_instrument);
    double close_price = signal_snapshot.quote_close;

    int held_quantity = quote_position.quantity;
    double expected_cash = broker.get_cash() + held_quantity * close_price;
    int new_size = size_for_cash(expected_cash, close_price);

    if (held_quantity != 0 && quote_position.average_cost > 0.0) {
        double price_ratio = close_price / quote_position.average_cost;
        bool is_long = held_quantity > 0;
        bool stop_loss_hit = is_long ? price_ratio < 1.0 - strategy_config.stop_loss
                                     : price_ratio > 1.0 + strategy_config.stop_loss;
        bool take_profit_hit = is_long ? price_ratio > 1.0 + strategy_config.take_profit
                                       : price_ratio < 1.0 - strategy_config.take_profit;
        if (stop_loss_hit || take_profit_hit) {
            StrategyLogs::log_exit_signal(logging_context, quote_instrument.symbol, stop_loss_hit ? "Stop loss" : "Take profit",
                                          close_price, quote_position.average_cost);
            return {make_instruction(quote_instrument, -held_quantity)};
        }
    }

    bool buy_signal = signal_snapshot.crossover_direction == 1 && signal_snapshot.williams_r_value <= strategy_config.williams_lower;
    bool sell_signal = signal_snapshot.crossover_direction == -1 && signal_snapshot.williams_r_value >= strategy_config.williams_upper;

    if (buy_signal && held_quantity <= 0) {
        int order_quantity = std::abs(held_quantity) + new_size;
        if (order_quantity > 0) {
            StrategyLogs::log_entry_signal(logging_context, quote_instrument.symbol, order_quantity, "Momentum up cross");
            return {make_instruction(quote_instrument, order_quantity)};
        }
    } else if (sell_signal && held_quantity >= 0) {
        int order_quantity = std::abs(held_quantity) + new_size;
        if (order_quantity > 0) {
            StrategyLogs::log_entry_signal(logging_context, quote_instrument.symbol, -order_quantity, "Momentum down cross");
            return {make_instruction(quote_instrument, -order_quantity)};
        }
    }
    return {};
}

std::vector<OrderInstruction> MomentumWilliamsStrategy::decide_pair(const SignalSnapshot& signal_snapshot, double hedge_close) {
    const Instrument& hedge = *hedge_instrument;
    PositionMap positions = broker.get_positions({quote_instrument.symbol, hedge.symbol});
    Position quote_position = find_position(positions, quote_instrument);
    Position hedge_position = find_position(positions, hedge);
    double quote_close = signal_snapshot.quote_close;
    double available_cash = broker.get_cash();

    std::vector<OrderInstruction> order_instructions;

    // Exits on whichever leg is currently held
    if (quote_position.quantity > 0 && quote_position.average_cost > 0.0) {
        double price_ratio = quote_close / quote_position.average_cost;
        if (price_ratio < 1.0 - strategy_config.stop_loss) {
            StrategyLogs::log_exit_signal(logging_context, quote_instrument.symbol, "Stop loss", quote_close, quote_position.average_cost);
            double rotation_cash = std::min(*initial_cash, quote_position.quantity * quote_close + available_cash);
            order_instructions.push_back(make_instruction(quote_instrument, -quote_position.quantity));
            int hedge_size = size_for_cash(rotation_cash, hedge_close);
            if (hedge_size > 0) {
                order_instructions.push_back(make_instruction(hedge, hedge_size));
            }
            return order_instructions;
        }
        if (price_ratio > 1.0 + strategy_config.take_profit) {
            StrategyLogs::log_exit_signal(logging_context, quote_instrument.symbol, "Take profit", quote_close, quote_position.average_cost);
            order_instructions.push_back(make_instruction(quote_instrument, -quote_position.quantity));
            return order_instructions;
        }
    } else if (hedge_position.quantity > 0 && hedge_position.average_cost > 0.0) {
        double price_ratio = hedge_close / hedge_position.average_cost;
        if (price_ratio < 1.0 - strategy_config.stop_loss) {
            StrategyLogs::log_exit_signal(logging_context, hedge.symbol, "Stop loss", hedge_close, hedge_position.average_cost);
            double rotation_cash = std::min(*initial_cash, hedge_position.quantity * hedge_close + available_cash);
            order_instructions.push_back(make_instruction(hedge, -hedge_position.quantity));
            int quote_size = size_for_cash(rotation_cash, quote_close);
            if (quote_size > 0) {
                order_instructions.push_back(make_instruction(quote_instrument, quote_size));
            }
            return order_instructions;
        }
        if (price_ratio > 1.0 + strategy_config.take_profit) {
            StrategyLogs::log_exit_signal(logging_context, hedge.symbol, "Take profit", hedge_close, hedge_position.average_cost);
            order_instructions.push_back(make_instruction(hedge, -hedge_position.quantity));
            return order_instructions;
        }
    }

    bool buy_signal = signal_snapshot.crossover_direction == 1 && signal_snapshot.williams_r_value <= strategy_config.williams_lower;
    bool sell_signal = signal_snapshot.crossover_direction == -1 && signal_snapshot.williams_r_value >= strategy_config.williams_upper;
    bool is_flat = quote_position.quantity == 0 && hedge_position.quantity == 0;

    if (buy_signal && (hedge_position.quantity > 0 || is_flat)) {
        double rotation_cash = std::min(*initial_cash, std::max(hedge_position.quantity, 0) * hedge_close + available_cash);
        int quote_size = size_for_cash(rotation_cash, quote_close);
        if (hedge_position.quantity > 0) {
            order_instructions.push_back(make_instruction(hedge, -hedge_position.quantity));
        }
        if (quote_size > 0) {
            StrategyLogs::log_entry_signal(logging_context, quote_instrument.symbol, quote_size, "Momentum up cross");
            order_instructions.push_back(make_instruction(quote_instrument, quote_size));
        }
    } else if (sell_signal && (quote_position.quantity > 0 || is_flat)) {
        double rotation_cash = std::min(*initial_cash, std::max(quote_position.quantity, 0) * quote_close + available_cash);
        int hedge_size = size_for_cash(rotation_cash, hedge_close);
        if (quote_position.quantity > 0) {
            order_instructions.push_back(make_instruction(quote_instrument, -quote_position.quantity));
        }
        if (hedge_size > 0) {
            StrategyLogs::log_entry_signal(logging_context, hedge.symbol, hedge_size, "Momentum down cross");
            order_instructions.push_back(make_instruction(hedge, hedge_size));
        }
    }
    return order_instructions;
}

int MomentumWilliamsStrategy::size_for_cash(double available_cash, double price) const {
    if (price <= 0.0 || available_cash <= 0.0) {
        return 0;
    }
    return static_cast<int>(std::floor(available_cash / price * strategy_config.cash_utilization));
}

Position MomentumWilliamsStrategy::find_position(const PositionMap& positions, const Instrument& instrument) const {
    auto position_iterator = positions.find(instrument.symbol);
    if (position_iterator == positions.end()) {
        Position empty_position;
        empty_position.symbol = instrument.symbol;
        empty_position.currency = instrument.currency;
        empty_position.trade_type = instrument.trade_type;
        return empty_position;
    }
    return position_iterator->second;
}

OrderInstruction MomentumWilliamsStrategy::make_instruction(const Instrument& instrument, int signed_quantity) const {
    OrderInstruction order_instruction(format_instrument(instrument), signed_quantity, OrderType::MARKET);
    order_instruction.time_in_force = time_in_force;
    return order_instruction;
}

} // namespace Core
} // namespace IntradayTrader
