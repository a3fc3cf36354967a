#ifndef LOGGING_MACROS_HPP
#define LOGGING_MACROS_HPP

#include "async_logger.hpp"

// Section headers and footers
#define LOG_SECTION_HEADER(context, title) log_message(context, "+-- " + std::string(title))
#define LOG_SECTION_FOOTER(context) log_message(context, "+-- ")

// Content logging macros
#define LOG_CONTENT(context, msg) log_message(context, "|   " + std::string(msg))

// Severity prefixes
#define LOG_ERROR(context, msg) log_message(context, "ERROR: " + std::string(msg))
#define LOG_WARNING(context, msg) log_message(context, "WARNING: " + std::string(msg))

// Trading loop banner
#define LOG_TRADING_TICK_HEADER(context, tick_num, time_text) \
    log_message(context, "================================================================================"); \
    log_message(context, "                        TRADING TICK #" + std::to_string(tick_num) + " - " + std::string(time_text)); \
    log_message(context, "================================================================================")

// Startup-specific macros (thread-local context)
#define LOG_STARTUP_SECTION_HEADER(title) log_message("+-- " + std::string(title), "")
#define LOG_STARTUP_CONTENT(msg) log_message("|   " + std::string(msg), "")
#define LOG_STARTUP_SEPARATOR() log_message("|", "")

#endif // LOGGING_MACROS_HPP
