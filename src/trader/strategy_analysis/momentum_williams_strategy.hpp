#ifndef MOMENTUM_WILLIAMS_STRATEGY_HPP
#define MOMENTUM_WILLIAMS_STRATEGY_HPP

#include <optional>
#include <string>
#include <vector>
#include "api/general/broker_interface.hpp"
#include "configs/strategy_config.hpp"
#include "logging/logger/async_logger.hpp"
#include "trader/strategy_analysis/strategy_interface.hpp"

namespace IntradayTrader {
namespace Core {

/**
 * @brief Momentum crossover confirmed by Williams %R, with stop-loss and take-profit exits.
 *
 * Signals are computed on the quote feed. Without a hedge feed the strategy trades the quote
 * instrument long and short. With a hedge feed it rotates between the quote instrument and
 * its inverse (hedge) instrument and never holds a short.
 */
class MomentumWilliamsStrategy : public StrategyInterface {
public:
    // Throws InvalidInstrumentFormat or InvalidOrder when the configuration is malformed
    MomentumWilliamsStrategy(API::BrokerInterface& broker_ref, const StrategyConfig& strategy_config_param,
                             Logging::LoggingContext& logging_context_ref);

    std::vector<OrderInstruction> decide(const FeedDataMap& feed_data) override;
    std::string get_strategy_name() const override;

private:
    struct SignalSnapshot {
        double quote_close;
        int crossover_direction;
        double williams_r_value;
    };

    API::BrokerInterface& broker;
    StrategyConfig strategy_config;
    Logging::LoggingContext& logging_context;
    Instrument quote_instrument;
    std::optional<Instrument> hedge_instrument;
    TimeInForce time_in_force;
    std::optional<double> initial_cash;

    size_t required_bar_count() const;
    std::optional<SignalSnapshot> compute_signals(const FeedDataMap& feed_data);
    std::vector<OrderInstruction> decide_single(const SignalSnapshot& signal_snapshot);
    std::vector<OrderInstruction> decide_pair(const SignalSnapshot& signal_snapshot, double hedge_close);

    int size_for_cash(double available_cash, double price) const;
    Position find_position(const PositionMap& positions, const Instrument& instrument) const;
    OrderInstruction make_instruction(const Instrument& instrument, int signed_quantity) const;
};

} // namespace Core
} // namespace IntradayTrader

#endif // MOMENTUM_WILLIAMS_STRATEGY_HPP
