#ifndef ASYNC_LOGGER_HPP
#define ASYNC_LOGGER_HPP

#include <string>
#include <mutex>
#include <condition_variable>
#include <queue>
#include <atomic>
#include <thread>
#include <memory>
#include <unordered_map>
#include <vector>
#include <fstream>
#include "configs/system_config.hpp"

namespace IntradayTrader {
namespace Logging {

// Named constants
constexpr int LOG_TAG_WIDTH = 6;
static_assert(LOG_TAG_WIDTH > 0, "LOG_TAG_WIDTH must be positive");

class AsyncLogger {
private:
    std::string file_path;
    bool console_output_enabled;
    int poll_interval_milliseconds;
    std::thread writer_thread;
    std::mutex console_mutex;

    void output_log_line_internal(const std::string& log_line, std::ofstream& log_file);
    void writer_loop();

public:
    std::mutex mtx;
    std::condition_variable cv;
    std::queue<std::string> queue;
    std::atomic<bool> running{false};

    AsyncLogger(const std::string& log_file_path, bool console_output, int poll_interval_ms);
    ~AsyncLogger();

    AsyncLogger(const AsyncLogger&) = delete;
    AsyncLogger& operator=(const AsyncLogger&) = delete;

    const std::string& get_file_path() const { return file_path; }

    // Starts the writer thread; throws when the log file cannot be opened
    void start();
    void enqueue(const std::string& formatted_line);
    // Drains the queue and joins the writer thread
    void stop();

    void collect_all_available_messages(std::vector<std::string>& message_buffer);
    void process_logging_queue_with_timeout(std::ofstream& log_file);
};


struct LoggingContext {
    std::shared_ptr<AsyncLogger> async_logger;
    std::mutex console_mutex;
    std::string run_folder;
    mutable std::mutex thread_tag_mutex;
    std::unordered_map<std::thread::id, std::string> thread_tags;

    std::string get_thread_tag() const {
        std::lock_guard<std::mutex> thread_tag_lock(thread_tag_mutex);
        std::unordered_map<std::thread::id, std::string>::const_iterator thread_tag_map_iterator = thread_tags.find(std::this_thread::get_id());
        if (thread_tag_map_iterator != thread_tags.end()) {
            return thread_tag_map_iterator->second;
        }
        return "MAIN  ";
    }

    void set_thread_tag(const std::string& tag_value) {
        std::lock_guard<std::mutex> lock(thread_tag_mutex);
        std::string tag_string = tag_value;
        if (tag_string.size() < LOG_TAG_WIDTH) {
            tag_string.append(LOG_TAG_WIDTH - tag_string.size(), ' ');
        }
        if (tag_string.size() > LOG_TAG_WIDTH) {
            tag_string = tag_string.substr(0, LOG_TAG_WIDTH);
        }
        thread_tags[std::this_thread::get_id()] = tag_string;
    }
};

// Logs through an explicit context (components hold the context they were built with)
void log_message(LoggingContext& logging_context, const std::string& message);

// Logs through the context registered for the calling thread
void log_message(const std::string& message, const std::string& log_file_path);

// Formats "<timestamp> [TAG   ]   <message>"
std::string format_log_line(const LoggingContext& logging_context, const std::string& message);

// Thread-local log tag (6 characters, padded/truncated) to appear in timestamp
void set_log_thread_tag(const std::string& thread_tag_value);

// Creates runtime_logs/run_DD-HH-MM under the configured directory
std::string create_unique_run_folder(const std::string& log_directory);

// Application foundation initialization: run folder, file logger, writer thread
std::shared_ptr<AsyncLogger> initialize_application_foundation(LoggingContext& logging_context,
                                                              const IntradayTrader::Config::SystemConfig& config);
void shutdown_global_logger(LoggingContext& logging_context);

// Context access (validates context exists before returning)
LoggingContext* get_logging_context();
void set_logging_context(LoggingContext& context);

} // namespace Logging
} // namespace IntradayTrader

#endif // ASYNC_LOGGER_HPP
