#include "startup_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logger/logging_macros.hpp"
#include <iomanip>
#include <sstream>

using IntradayTrader::Logging::log_message;

namespace {

std::string format_decimal(double value, int precision) {
    std::ostringstream value_stream;
    value_stream << std::fixed << std::setprecision(precision) << value;
    return value_stream.str();
}

std::string pad_label(const std::string& label) {
    std::string padded_label = label;
    if (padded_label.size() < 26) {
        padded_label.append(26 - padded_label.size(), ' ');
    }
    return padded_label;
}

} // namespace

void StartupLogs::log_application_header() {
    log_message("", "");
    log_message("================================================================================", "");
    log_message("                                INTRADAY TRADER", "");
    log_message("                      Bar-Synchronized Intraday Trading Loop", "");
    log_message("================================================================================", "");
    log_message("", "");
}

void StartupLogs::log_broker_configuration(const IntradayTrader::Config::SystemConfig& config) {
    LOG_STARTUP_SECTION_HEADER("BROKER");
    LOG_STARTUP_CONTENT(pad_label("Mode") + config.broker.mode);
    LOG_STARTUP_CONTENT(pad_label("Currency") + config.broker.currency);
    if (config.broker.mode == "paper") {
        LOG_STARTUP_CONTENT(pad_label("Starting cash") + format_decimal(config.broker.paper_starting_cash, 2));
        LOG_STARTUP_CONTENT(pad_label("Fill price bars") + config.broker.paper_price_interval + " / " +
                            config.broker.paper_price_period);
    } else {
        LOG_STARTUP_CONTENT(pad_label("Base URL") + config.broker.base_url);
        LOG_STARTUP_CONTENT(pad_label("Orders endpoint") + config.broker.endpoints.orders);
    }
    LOG_STARTUP_SEPARATOR();
}

void StartupLogs::log_feed_configuration(const IntradayTrader::Config::SystemConfig& config) {
    LOG_STARTUP_SECTION_HEADER("DATA FEEDS");
    LOG_STARTUP_CONTENT(pad_label("Provider") + config.data.provider_base_url);
    for (const FeedConfig& feed_config : config.data.feeds) {
        LOG_STARTUP_CONTENT(pad_label(feed_config.name) + feed_config.symbol + " " + feed_config.interval + " " +
                            feed_config.period);
    }
    LOG_STARTUP_SEPARATOR();
}

void StartupLogs::log_runtime_configuration(const IntradayTrader::Config::SystemConfig& config) {
    LOG_STARTUP_SECTION_HEADER("RUNTIME");
    LOG_STARTUP_CONTENT(pad_label("Poll interval (ms)") + std::to_string(config.timing.loop_poll_interval_milliseconds));
    LOG_STARTUP_CONTENT(pad_label("Action window (s)") + std::to_string(config.timing.action_window_buffer_seconds));
    LOG_STARTUP_CONTENT(pad_label("End of day (UTC)") + std::to_string(config.timing.end_of_day_hour_utc) + ":" +
                        std::to_string(config.timing.end_of_day_minute_utc));
    LOG_STARTUP_CONTENT(pad_label("Sync retry rounds") + std::to_string(config.timing.data_sync_max_retry_rounds));
    std::string tracked_text;
    for (const std::string& tracked_instrument : config.orders.tracked_instruments) {
        tracked_text += (tracked_text.empty() ? "" : ", ") + tracked_instrument;
    }
    LOG_STARTUP_CONTENT(pad_label("Tracked instruments") + tracked_text);
    LOG_STARTUP_SEPARATOR();
}

void StartupLogs::log_strategy_configuration(const IntradayTrader::Config::SystemConfig& config) {
    const StrategyConfig& strategy = config.strategy;
    LOG_STARTUP_SECTION_HEADER("STRATEGY");
    LOG_STARTUP_CONTENT(pad_label("Quote") + strategy.quote_feed_name + " -> " + strategy.quote_instrument);
    if (strategy.hedge_feed_name.empty()) {
        LOG_STARTUP_CONTENT(pad_label("Hedge") + "none (single instrument)");
    } else {
        LOG_STARTUP_CONTENT(pad_label("Hedge") + strategy.hedge_feed_name + " -> " + strategy.hedge_instrument);
    }
    LOG_STARTUP_CONTENT(pad_label("Momentum / MA") + std::to_string(strategy.momentum_period) + " / " +
                        std::to_string(strategy.momentum_ma_period));
    LOG_STARTUP_CONTENT(pad_label("Williams %R") + std::to_string(strategy.williams_period) + " [" +
                        format_decimal(strategy.williams_lower, 1) + ", " + format_decimal(strategy.williams_upper, 1) + "]");
    LOG_STARTUP_CONTENT(pad_label("Stop loss / take profit") + format_decimal(strategy.stop_loss, 3) + " / " +
                        format_decimal(strategy.take_profit, 3));
    LOG_STARTUP_CONTENT(pad_label("Cash utilization") + format_decimal(strategy.cash_utilization, 2));
    LOG_STARTUP_SECTION_HEADER("");
}
