#ifndef STRATEGY_CONFIG_HPP
#define STRATEGY_CONFIG_HPP

#include <string>

struct StrategyConfig {
    // ========================================================================
    // TARGET CONFIGURATION
    // ========================================================================

    std::string quote_feed_name;                     // Feed the signals are computed on
    std::string quote_instrument;                    // Instrument bought on an up cross
    std::string hedge_feed_name;                     // Inverse feed; empty runs single-instrument mode
    std::string hedge_instrument;                    // Instrument bought on a down cross in pair mode

    // ========================================================================
    // MOMENTUM / WILLIAMS %R PARAMETERS
    // ========================================================================

    int momentum_period = 10;                        // Bars for the momentum oscillator
    int momentum_ma_period = 10;                     // SMA length over the momentum series
    int williams_period = 14;                        // Lookback for Williams %R
    double williams_upper = -40.0;                   // Sell band
    double williams_lower = -60.0;                   // Buy band

    // ========================================================================
    // RISK PARAMETERS
    // ========================================================================

    double stop_loss = 0.1;                          // Fractional adverse move closing a position
    double take_profit = 0.3;                        // Fractional favourable move closing a position
    double cash_utilization = 0.95;                  // Share of cash used for new positions
    std::string time_in_force = "DAY";               // DAY, AM, PM, EXTENDED, GOOD_TILL_CANCEL, GTC_EXT, FILL_OR_KILL
};

#endif // STRATEGY_CONFIG_HPP
