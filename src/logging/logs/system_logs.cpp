#include "system_logs.hpp"
#include "logging/logger/async_logger.hpp"

using IntradayTrader::Logging::log_message;

void SystemLogs::log_system_startup_error(const std::string& error_message) {
    log_message(std::string("ERROR: System startup error: ") + error_message, "system_logs");
}

void SystemLogs::log_system_shutdown_error(const std::string& error_message) {
    log_message(std::string("ERROR: System shutdown error: ") + error_message, "system_logs");
}

void SystemLogs::log_fatal_error(const std::string& error_message) {
    log_message(std::string("FATAL: ") + error_message, "system_logs");
}

void SystemLogs::log_configuration_validated(bool valid, const std::string& error_message) {
    if (valid) {
        log_message("CONFIG_VALIDATION: Configuration validated successfully", "system_logs");
    } else {
        log_message("CONFIG_VALIDATION: Configuration validation FAILED: " + error_message, "system_logs");
    }
}

void SystemLogs::log_modules_created(const std::string& broker_name, const std::string& data_provider_name,
                                     const std::string& strategy_name, size_t feed_count) {
    log_message("SYSTEM_STARTUP: Broker=" + broker_name + " Data=" + data_provider_name + " Strategy=" + strategy_name +
                " Feeds=" + std::to_string(feed_count), "system_logs");
}

void SystemLogs::log_startup_complete() {
    log_message("SYSTEM_STARTUP: System startup completed successfully", "system_logs");
}

void SystemLogs::log_shutdown_requested(int signal_number) {
    log_message("SHUTDOWN: Signal " + std::to_string(signal_number) + " received, stopping after the current tick", "system_logs");
}

void SystemLogs::log_shutdown_complete(unsigned long tick_count) {
    log_message("SHUTDOWN: Trading loop finished after " + std::to_string(tick_count) + " ticks", "system_logs");
}
