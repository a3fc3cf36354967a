// LoggingConfig.hpp
#ifndef LOGGING_CONFIG_HPP
#define LOGGING_CONFIG_HPP

#include <string>

struct LoggingConfig {
    std::string log_file = "trading_system.log";     // File name inside the run folder
    std::string log_directory = "runtime_logs";      // Parent folder for per-run log folders
    bool console_output_enabled = true;              // Mirror every line to stdout
    int logging_poll_interval_milliseconds = 500;    // Writer thread wake-up interval
};

#endif // LOGGING_CONFIG_HPP
