#ifndef SYSTEM_LOGS_HPP
#define SYSTEM_LOGS_HPP

#include <string>

/**
 * Specialized logging for system management operations.
 * Uses the context registered for the calling thread, so it works before the file logger exists.
 */
class SystemLogs {
public:
    // System startup and shutdown
    static void log_system_startup_error(const std::string& error_message);
    static void log_system_shutdown_error(const std::string& error_message);
    static void log_fatal_error(const std::string& error_message);

    static void log_configuration_validated(bool valid, const std::string& error_message);
    static void log_modules_created(const std::string& broker_name, const std::string& data_provider_name,
                                    const std::string& strategy_name, size_t feed_count);
    static void log_startup_complete();
    static void log_shutdown_requested(int signal_number);
    static void log_shutdown_complete(unsigned long tick_count);
};

#endif // SYSTEM_LOGS_HPP
