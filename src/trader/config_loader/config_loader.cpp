#include "config_loader.hpp"
#include "logging/logger/logging_macros.hpp"
#include "trader/market_data/feed.hpp"
#include "utils/instrument_utils.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

using IntradayTrader::Logging::log_message;

namespace {
    inline std::string trim(const std::string& input_string) {
        const char* whitespace_chars = " \t\r\n";
        auto begin_position = input_string.find_first_not_of(whitespace_chars);
        auto end_position = input_string.find_last_not_of(whitespace_chars);
        if (begin_position == std::string::npos) return "";
        return input_string.substr(begin_position, end_position - begin_position + 1);
    }

    inline bool to_bool(const std::string& input_value) {
        std::string normalized_value = input_value;
        std::transform(normalized_value.begin(), normalized_value.end(), normalized_value.begin(), ::tolower);
        return normalized_value == "1" || normalized_value == "true" || normalized_value == "yes";
    }

    std::vector<std::string> split_list(const std::string& list_value) {
        std::vector<std::string> list_items;
        std::stringstream list_stream(list_value);
        std::string list_item;
        while (std::getline(list_stream, list_item, ';')) {
            list_item = trim(list_item);
            if (!list_item.empty()) {
                list_items.push_back(list_item);
            }
        }
        return list_items;
    }

    // <prefix>.connectivity.<field>
    bool apply_connectivity_key(ConnectivityPolicy& policy, const std::string& field_name, const std::string& config_value) {
        if (field_name == "degraded_after_failures") policy.degraded_after_failures = std::stoi(config_value);
        else if (field_name == "disconnected_after_failures") policy.disconnected_after_failures = std::stoi(config_value);
        else if (field_name == "initial_backoff_seconds") policy.initial_backoff_seconds = std::stoi(config_value);
        else if (field_name == "max_backoff_seconds") policy.max_backoff_seconds = std::stoi(config_value);
        else if (field_name == "backoff_multiplier") policy.backoff_multiplier = std::stod(config_value);
        else return false;
        return true;
    }

    bool validate_connectivity_policy(const std::string& channel_name, const ConnectivityPolicy& policy, std::string& error_message) {
        if (policy.degraded_after_failures <= 0 || policy.disconnected_after_failures <= policy.degraded_after_failures) {
            error_message = channel_name + ".connectivity thresholds must satisfy 0 < degraded_after_failures < disconnected_after_failures";
            return false;
        }
        if (policy.initial_backoff_seconds <= 0 || policy.max_backoff_seconds < policy.initial_backoff_seconds) {
            error_message = channel_name + ".connectivity backoff must satisfy 0 < initial_backoff_seconds <= max_backoff_seconds";
            return false;
        }
        if (policy.backoff_multiplier < 1.0) {
            error_message = channel_name + ".connectivity.backoff_multiplier must be >= 1.0";
            return false;
        }
        return true;
    }

    FeedConfig& find_or_add_feed(DataConfig& data_config, const std::string& feed_name) {
        for (FeedConfig& feed_config : data_config.feeds) {
            if (feed_config.name == feed_name) {
                return feed_config;
            }
        }
        FeedConfig new_feed;
        new_feed.name = feed_name;
        data_config.feeds.push_back(new_feed);
        return data_config.feeds.back();
    }

    // feed.<name>.<field>
    bool apply_feed_key(IntradayTrader::Config::SystemConfig& cfg, const std::string& config_key, const std::string& config_value) {
        const std::string feed_prefix = "feed.";
        if (config_key.compare(0, feed_prefix.size(), feed_prefix) != 0) {
            return false;
        }
        size_t field_separator = config_key.rfind('.');
        if (field_separator <= feed_prefix.size()) {
            throw std::runtime_error("Feed key must be feed.<name>.<field>: " + config_key);
        }

        std::string feed_name = config_key.substr(feed_prefix.size(), field_separator - feed_prefix.size());
        std::string feed_field = config_key.substr(field_separator + 1);
        FeedConfig& feed_config = find_or_add_feed(cfg.data, feed_name);

        if (feed_field == "symbol") feed_config.symbol = config_value;
        else if (feed_field == "interval") feed_config.interval = config_value;
        else if (feed_field == "period") feed_config.period = config_value;
        else throw std::runtime_error("Unknown feed field '" + feed_field + "' in " + config_key);
        return true;
    }

    bool apply_config_key(IntradayTrader::Config::SystemConfig& cfg, const std::string& config_key, const std::string& config_value) {
        // Timing
        if (config_key == "timing.loop_poll_interval_milliseconds") cfg.timing.loop_poll_interval_milliseconds = std::stoi(config_value);
        else if (config_key == "timing.action_window_buffer_seconds") cfg.timing.action_window_buffer_seconds = std::stoi(config_value);
        else if (config_key == "timing.end_of_day_hour_utc") cfg.timing.end_of_day_hour_utc = std::stoi(config_value);
        else if (config_key == "timing.end_of_day_minute_utc") cfg.timing.end_of_day_minute_utc = std::stoi(config_value);
        else if (config_key == "timing.data_sync_retry_backoff_milliseconds") cfg.timing.data_sync_retry_backoff_milliseconds = std::stoi(config_value);
        else if (config_key == "timing.data_sync_max_retry_rounds") cfg.timing.data_sync_max_retry_rounds = std::stoi(config_value);
        else if (config_key == "timing.stale_data_backoff_seconds") cfg.timing.stale_data_backoff_seconds = std::stoi(config_value);
        else if (config_key == "timing.order_cancellation_processing_delay_milliseconds") cfg.timing.order_cancellation_processing_delay_milliseconds = std::stoi(config_value);
        else if (config_key == "timing.broker_connection_max_attempts") cfg.timing.broker_connection_max_attempts = std::stoi(config_value);
        else if (config_key == "timing.broker_connection_retry_delay_seconds") cfg.timing.broker_connection_retry_delay_seconds = std::stoi(config_value);

        // Broker
        else if (config_key == "broker.mode") cfg.broker.mode = config_value;
        else if (config_key == "broker.currency") cfg.broker.currency = config_value;
        else if (config_key == "broker.base_url") cfg.broker.base_url = config_value;
        else if (config_key == "broker.api_key") cfg.broker.api_key = config_value;
        else if (config_key == "broker.api_secret") cfg.broker.api_secret = config_value;
        else if (config_key == "broker.endpoints.account") cfg.broker.endpoints.account = config_value;
        else if (config_key == "broker.endpoints.positions") cfg.broker.endpoints.positions = config_value;
        else if (config_key == "broker.endpoints.orders") cfg.broker.endpoints.orders = config_value;
        else if (config_key == "broker.endpoints.clock") cfg.broker.endpoints.clock = config_value;
        else if (config_key == "broker.retry_count") cfg.broker.retry_count = std::stoi(config_value);
        else if (config_key == "broker.timeout_seconds") cfg.broker.timeout_seconds = std::stoi(config_value);
        else if (config_key == "broker.enable_ssl_verification") cfg.broker.enable_ssl_verification = to_bool(config_value);
        else if (config_key == "broker.rate_limit_delay_ms") cfg.broker.rate_limit_delay_ms = std::stoi(config_value);
        else if (config_key == "broker.paper_starting_cash") cfg.broker.paper_starting_cash = std::stod(config_value);
        else if (config_key == "broker.paper_price_interval") cfg.broker.paper_price_interval = config_value;
        else if (config_key == "broker.paper_price_period") cfg.broker.paper_price_period = config_value;

        // Market data provider
        else if (config_key == "data.provider_base_url") cfg.data.provider_base_url = config_value;
        else if (config_key == "data.chart_endpoint") cfg.data.chart_endpoint = config_value;
        else if (config_key == "data.retry_count") cfg.data.retry_count = std::stoi(config_value);
        else if (config_key == "data.timeout_seconds") cfg.data.timeout_seconds = std::stoi(config_value);
        else if (config_key == "data.enable_ssl_verification") cfg.data.enable_ssl_verification = to_bool(config_value);
        else if (config_key == "data.rate_limit_delay_ms") cfg.data.rate_limit_delay_ms = std::stoi(config_value);

        // Orders
        else if (config_key == "orders.tracked_instruments") cfg.orders.tracked_instruments = split_list(config_value);

        // Strategy
        else if (config_key == "strategy.quote_feed_name") cfg.strategy.quote_feed_name = config_value;
        else if (config_key == "strategy.quote_instrument") cfg.strategy.quote_instrument = config_value;
        else if (config_key == "strategy.hedge_feed_name") cfg.strategy.hedge_feed_name = config_value;
        else if (config_key == "strategy.hedge_instrument") cfg.strategy.hedge_instrument = config_value;
        else if (config_key == "strategy.momentum_period") cfg.strategy.momentum_period = std::stoi(config_value);
        else if (config_key == "strategy.momentum_ma_period") cfg.strategy.momentum_ma_period = std::stoi(config_value);
        else if (config_key == "strategy.williams_period") cfg.strategy.williams_period = std::stoi(config_value);
        else if (config_key == "strategy.williams_upper") cfg.strategy.williams_upper = std::stod(config_value);
        else if (config_key == "strategy.williams_lower") cfg.strategy.williams_lower = std::stod(config_value);
        else if (config_key == "strategy.stop_loss") cfg.strategy.stop_loss = std::stod(config_value);
        else if (config_key == "strategy.take_profit") cfg.strategy.take_profit = std::stod(config_value);
        else if (config_key == "strategy.cash_utilization") cfg.strategy.cash_utilization = std::stod(config_value);
        else if (config_key == "strategy.time_in_force") cfg.strategy.time_in_force = config_value;

        // Logging
        else if (config_key == "logging.log_file") cfg.logging.log_file = config_value;
        else if (config_key == "logging.log_directory") cfg.logging.log_directory = config_value;
        else if (config_key == "logging.console_output_enabled") cfg.logging.console_output_enabled = to_bool(config_value);
        else if (config_key == "logging.logging_poll_interval_milliseconds") cfg.logging.logging_poll_interval_milliseconds = std::stoi(config_value);

        else if (config_key.compare(0, 18, "data.connectivity.") == 0) return apply_connectivity_key(cfg.data.connectivity, config_key.substr(18), config_value);
        else if (config_key.compare(0, 20, "broker.connectivity.") == 0) return apply_connectivity_key(cfg.broker.connectivity, config_key.substr(20), config_value);
        else return apply_feed_key(cfg, config_key, config_value);
        return true;
    }

    std::string read_environment(const char* variable_name) {
        const char* variable_value = std::getenv(variable_name);
        return variable_value ? std::string(variable_value) : std::string();
    }
}

bool load_config_from_csv(IntradayTrader::Config::SystemConfig& cfg, const std::string& csv_path) {
    std::ifstream config_file_stream(csv_path);
    if (!config_file_stream.is_open()) {
        return false;
    }

    std::string config_line_string;
    int line_number = 0;
    while (std::getline(config_file_stream, config_line_string)) {
        ++line_number;
        config_line_string = trim(config_line_string);
        if (config_line_string.empty() || config_line_string[0] == '#') continue;

        std::stringstream config_line_stream(config_line_string);
        std::string config_key_string, config_value_string;
        if (!std::getline(config_line_stream, config_key_string, ',')) continue;
        if (!std::getline(config_line_stream, config_value_string)) config_value_string.clear();
        config_key_string = trim(config_key_string);
        config_value_string = trim(config_value_string);

        try {
            if (!apply_config_key(cfg, config_key_string, config_value_string)) {
                log_message("WARNING: Unknown config key '" + config_key_string + "' in " + csv_path +
                            " line " + std::to_string(line_number), "");
            }
        } catch (const std::exception& parse_exception_error) {
            log_message("ERROR: Failed to parse '" + config_key_string + "' from value '" + config_value_string + "' in " +
                        csv_path + " line " + std::to_string(line_number) + ": " + std::string(parse_exception_error.what()), "");
            return false;
        }
    }
    return true;
}

void apply_environment_overrides(IntradayTrader::Config::SystemConfig& cfg) {
    std::string environment_api_key = read_environment("INTRADAY_BROKER_API_KEY");
    if (!environment_api_key.empty()) {
        cfg.broker.api_key = environment_api_key;
    }
    std::string environment_api_secret = read_environment("INTRADAY_BROKER_API_SECRET");
    if (!environment_api_secret.empty()) {
        cfg.broker.api_secret = environment_api_secret;
    }
}

int load_system_config(IntradayTrader::Config::SystemConfig& config, const std::string& config_directory) {
    // Load configuration from separate logical files
    std::vector<std::string> config_files = {
        config_directory + "/timing_config.csv",
        config_directory + "/broker_config.csv",
        config_directory + "/data_config.csv",
        config_directory + "/strategy_config.csv",
        config_directory + "/logging_config.csv"
    };

    for (const auto& config_path : config_files) {
        if (!load_config_from_csv(config, config_path)) {
            log_message("ERROR: Failed to load config CSV from " + config_path, "");
            return 1;
        }
    }

    apply_environment_overrides(config);

    // Validate configuration completeness
    std::string validation_error;
    if (!validate_config(config, validation_error)) {
        log_message("ERROR: Configuration validation failed: " + validation_error, "");
        return 1;
    }

    return 0;
}

bool validate_config(const IntradayTrader::Config::SystemConfig& config, std::string& error_message) {
    // Timing
    if (config.timing.loop_poll_interval_milliseconds <= 0) {
        error_message = "timing.loop_poll_interval_milliseconds must be > 0";
        return false;
    }
    if (config.timing.action_window_buffer_seconds <= 0 || config.timing.action_window_buffer_seconds > 59) {
        error_message = "timing.action_window_buffer_seconds must be within 1..59";
        return false;
    }
    if (config.timing.end_of_day_hour_utc < 0 || config.timing.end_of_day_hour_utc > 23) {
        error_message = "timing.end_of_day_hour_utc must be within 0..23";
        return false;
    }
    if (config.timing.end_of_day_minute_utc < 0 || config.timing.end_of_day_minute_utc > 59) {
        error_message = "timing.end_of_day_minute_utc must be within 0..59";
        return false;
    }
    if (config.timing.data_sync_retry_backoff_milliseconds <= 0) {
        error_message = "timing.data_sync_retry_backoff_milliseconds must be > 0";
        return false;
    }
    if (config.timing.data_sync_max_retry_rounds <= 0) {
        error_message = "timing.data_sync_max_retry_rounds must be > 0";
        return false;
    }
    if (config.timing.stale_data_backoff_seconds <= 0) {
        error_message = "timing.stale_data_backoff_seconds must be > 0";
        return false;
    }
    if (config.timing.order_cancellation_processing_delay_milliseconds < 0) {
        error_message = "timing.order_cancellation_processing_delay_milliseconds must be >= 0";
        return false;
    }
    if (config.timing.broker_connection_max_attempts <= 0) {
        error_message = "timing.broker_connection_max_attempts must be > 0";
        return false;
    }
    if (config.timing.broker_connection_retry_delay_seconds < 0) {
        error_message = "timing.broker_connection_retry_delay_seconds must be >= 0";
        return false;
    }

    // Feeds
    if (config.data.feeds.empty()) {
        error_message = "No data feeds configured (provide feed.<name>.* via data_config.csv)";
        return false;
    }
    for (const FeedConfig& feed_config : config.data.feeds) {
        if (feed_config.symbol.empty()) {
            error_message = "Feed " + feed_config.name + " has no symbol";
            return false;
        }
        try {
            IntradayTrader::Core::interval_to_seconds(feed_config.interval);
        } catch (const std::exception& interval_exception_error) {
            error_message = "Feed " + feed_config.name + ": " + std::string(interval_exception_error.what());
            return false;
        }
    }

    // Tracked instruments
    if (config.orders.tracked_instruments.empty()) {
        error_message = "No tracked instruments configured (provide orders.tracked_instruments via strategy_config.csv)";
        return false;
    }
    for (const std::string& instrument_text : config.orders.tracked_instruments) {
        try {
            IntradayTrader::Core::parse_instrument(instrument_text);
        } catch (const std::exception& instrument_exception_error) {
            error_message = std::string(instrument_exception_error.what());
            return false;
        }
    }

    // Connectivity
    if (!validate_connectivity_policy("data", config.data.connectivity, error_message) ||
        !validate_connectivity_policy("broker", config.broker.connectivity, error_message)) {
        return false;
    }

    // Broker
    if (config.broker.mode != "paper" && config.broker.mode != "alpaca") {
        error_message = "broker.mode must be paper or alpaca, got '" + config.broker.mode + "'";
        return false;
    }

    // Strategy
    if (config.strategy.quote_feed_name.empty() || config.strategy.quote_instrument.empty()) {
        error_message = "strategy.quote_feed_name and strategy.quote_instrument are required";
        return false;
    }
    if (!config.strategy.hedge_feed_name.empty() && config.strategy.hedge_instrument.empty()) {
        error_message = "strategy.hedge_instrument is required when strategy.hedge_feed_name is set";
        return false;
    }
    if (config.strategy.momentum_period <= 0 || config.strategy.momentum_ma_period <= 0 || config.strategy.williams_period <= 0) {
        error_message = "strategy periods must be > 0";
        return false;
    }
    if (config.strategy.cash_utilization <= 0.0 || config.strategy.cash_utilization > 1.0) {
        error_message = "strategy.cash_utilization must be within (0, 1]";
        return false;
    }

    // Logging
    if (config.logging.log_file.empty() || config.logging.log_directory.empty()) {
        error_message = "logging.log_file and logging.log_directory are required";
        return false;
    }

    return true;
}
