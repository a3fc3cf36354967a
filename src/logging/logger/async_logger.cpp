#include "async_logger.hpp"
#include "utils/time_utils.hpp"
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <fstream>
#include <ctime>
#include <filesystem>

namespace IntradayTrader {
namespace Logging {

thread_local LoggingContext* thread_local_logging_context_pointer = nullptr;

namespace {

void log_message_to_stderr(const std::string& error_message) {
    std::cerr << error_message << std::endl;
}

std::string extract_base_filename(const std::string& full_path) {
    size_t last_slash = full_path.find_last_of('/');
    if (last_slash != std::string::npos) {
        return full_path.substr(last_slash + 1);
    }
    return full_path;
}

} // anonymous namespace

LoggingContext* get_logging_context() {
    LoggingContext* thread_logging_context_ptr = thread_local_logging_context_pointer;
    if (!thread_logging_context_ptr) {
        throw std::runtime_error("Logging context not initialized for current thread - system must fail without context");
    }
    return thread_logging_context_ptr;
}

void set_logging_context(LoggingContext& context) {
    thread_local_logging_context_pointer = &context;
}

void set_log_thread_tag(const std::string& thread_tag_value) {
    LoggingContext* thread_logging_context_ptr = get_logging_context();
    thread_logging_context_ptr->set_thread_tag(thread_tag_value);
}

std::string format_log_line(const LoggingContext& logging_context, const std::string& message) {
    std::stringstream log_stream;
    log_stream << TimeUtils::get_current_human_readable_time() << " [" << logging_context.get_thread_tag() << "]   " << message << "\n";
    return log_stream.str();
}

void log_message(LoggingContext& logging_context, const std::string& message) {
    std::string log_formatted_string = format_log_line(logging_context, message);

    std::shared_ptr<AsyncLogger> async_logger_instance = logging_context.async_logger;
    if (async_logger_instance && async_logger_instance->running.load()) {
        async_logger_instance->enqueue(log_formatted_string);
        return;
    }

    std::lock_guard<std::mutex> console_guard(logging_context.console_mutex);
    std::cout << log_formatted_string << std::flush;
}

void log_message(const std::string& message, const std::string& log_file_path) {
    LoggingContext* thread_logging_context_ptr = thread_local_logging_context_pointer;
    if (!thread_logging_context_ptr) {
        log_message_to_stderr(message);
        return;
    }

    log_message(*thread_logging_context_ptr, message);

    if (!log_file_path.empty() && !thread_logging_context_ptr->async_logger) {
        std::ofstream log_file_stream(log_file_path, std::ios::app);
        if (log_file_stream.is_open()) {
            log_file_stream << format_log_line(*thread_logging_context_ptr, message);
        } else {
            log_message_to_stderr("ERROR: Failed to open log file: " + log_file_path);
        }
    }
}

std::string create_unique_run_folder(const std::string& log_directory) {
    std::time_t now = std::time(nullptr);
    std::tm local_tm_buf;
    localtime_r(&now, &local_tm_buf);

    // Create unique run folder: <log_directory>/run_DD-HH-MM
    std::stringstream ss;
    ss << log_directory << "/run_" << std::put_time(&local_tm_buf, TimeUtils::LOG_FILENAME);
    std::string run_folder = ss.str();

    try {
        std::filesystem::create_directories(run_folder);
    } catch (const std::exception& filesystem_exception_error) {
        log_message_to_stderr(std::string("CRITICAL ERROR: Failed to create run folder: ") + filesystem_exception_error.what());
        throw std::runtime_error("Failed to create run folder: " + run_folder);
    }

    return run_folder;
}

std::shared_ptr<AsyncLogger> initialize_application_foundation(LoggingContext& logging_context,
                                                              const IntradayTrader::Config::SystemConfig& config) {
    logging_context.run_folder = create_unique_run_folder(config.logging.log_directory);

    std::string log_file_path = logging_context.run_folder + "/" + extract_base_filename(config.logging.log_file);
    auto logger_instance = std::make_shared<AsyncLogger>(log_file_path, config.logging.console_output_enabled,
                                                         config.logging.logging_poll_interval_milliseconds);
    logger_instance->start();

    logging_context.async_logger = logger_instance;
    logging_context.set_thread_tag("MAIN");

    return logger_instance;
}

void shutdown_global_logger(LoggingContext& logging_context) {
    if (logging_context.async_logger) {
        logging_context.async_logger->stop();
    }
}

// AsyncLogger implementation
AsyncLogger::AsyncLogger(const std::string& log_file_path, bool console_output, int poll_interval_ms)
    : file_path(log_file_path), console_output_enabled(console_output),
      poll_interval_milliseconds(poll_interval_ms > 0 ? poll_interval_ms : 500) {}

AsyncLogger::~AsyncLogger() {
    stop();
}

void AsyncLogger::start() {
    if (running.load()) {
        return;
    }
    {
        std::ofstream writability_check_stream(file_path, std::ios::app);
        if (!writability_check_stream.is_open()) {
            throw std::runtime_error("Failed to open log file: " + file_path);
        }
    }
    running.store(true);
    writer_thread = std::thread(&AsyncLogger::writer_loop, this);
}

void AsyncLogger::stop() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        running.store(false);
    }
    cv.notify_all();
    if (writer_thread.joinable()) {
        writer_thread.join();
    }
}

void AsyncLogger::enqueue(const std::string& formatted_line) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        queue.push(formatted_line);
    }
    cv.notify_one();
}

void AsyncLogger::collect_all_available_messages(std::vector<std::string>& message_buffer) {
    std::unique_lock<std::mutex> lock(mtx);
    while (!queue.empty()) {
        message_buffer.push_back(std::move(queue.front()));
        queue.pop();
    }
}

void AsyncLogger::output_log_line_internal(const std::string& log_line, std::ofstream& log_file) {
    if (console_output_enabled) {
        std::lock_guard<std::mutex> console_guard(console_mutex);
        std::cout << log_line << std::flush;
    }

    if (log_file.is_open()) {
        log_file << log_line;
        log_file.flush();
    }
}

void AsyncLogger::process_logging_queue_with_timeout(std::ofstream& log_file) {
    std::unique_lock<std::mutex> lock(mtx);

    // Wake periodically so a stop request is noticed even with an empty queue
    cv.wait_for(lock, std::chrono::milliseconds(poll_interval_milliseconds), [&]{ return !queue.empty() || !running.load(); });

    while (!queue.empty()) {
        std::string line = std::move(queue.front());
        queue.pop();
        lock.unlock();

        output_log_line_internal(line, log_file);

        lock.lock();
    }
}

void AsyncLogger::writer_loop() {
    std::ofstream log_file(file_path, std::ios::app);
    while (running.load()) {
        process_logging_queue_with_timeout(log_file);
    }

    // Flush whatever arrived between the stop request and the last wake-up
    std::vector<std::string> remaining_messages;
    collect_all_available_messages(remaining_messages);
    for (const std::string& remaining_line : remaining_messages) {
        output_log_line_internal(remaining_line, log_file);
    }
}

} // namespace Logging
} // namespace IntradayTrader
