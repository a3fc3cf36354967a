// main.cpp
#include "system/system_manager.hpp"
#include "logging/logs/system_logs.hpp"
#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

using namespace IntradayTrader::System;

// =============================================================================
// ENCAPSULATED SHUTDOWN HANDLER - NO GLOBAL VARIABLES
// =============================================================================
class ShutdownHandler {
private:
    std::atomic<bool> shutdown_requested_flag{false};
    std::atomic<int> received_signal{0};
    SystemState* system_state_pointer = nullptr;

public:
    static ShutdownHandler& get_instance() {
        static ShutdownHandler instance;
        return instance;
    }

    void set_system_state(SystemState* state) {
        system_state_pointer = state;
    }

    bool is_shutdown_requested() const {
        return shutdown_requested_flag.load();
    }

    int get_received_signal() const {
        return received_signal.load();
    }

    // Only touches atomics; the loop notices the cleared flag at its next tick
    void signal_handler(int signal_number) {
        if (signal_number == SIGINT || signal_number == SIGTERM) {
            received_signal.store(signal_number);
            shutdown_requested_flag.store(true);
            if (system_state_pointer) {
                system_state_pointer->running.store(false);
                system_state_pointer->shutdown_requested.store(true);
            }
        }
    }

private:
    ShutdownHandler() = default;
    ShutdownHandler(const ShutdownHandler&) = delete;
    ShutdownHandler& operator=(const ShutdownHandler&) = delete;
};

// =============================================================================
// STATIC SIGNAL HANDLER FUNCTION
// =============================================================================
static void signal_handler(int signal_number) {
    ShutdownHandler::get_instance().signal_handler(signal_number);
}

// =============================================================================
// MAIN APPLICATION ENTRY POINT
// =============================================================================

int main(int argc, char* argv[]) {
    std::string config_directory = argc > 1 ? argv[1] : "config";
    SystemInitializationResult initialization_result;

    try {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        // Config loading, validation and the run log
        initialization_result = initialize(config_directory);

        ShutdownHandler::get_instance().set_system_state(initialization_result.system_state.get());

        startup(*initialization_result.system_state);

        // Blocks until end of day or a shutdown signal
        run(*initialization_result.system_state);

        if (ShutdownHandler::get_instance().is_shutdown_requested()) {
            SystemLogs::log_shutdown_requested(ShutdownHandler::get_instance().get_received_signal());
        }
        shutdown(*initialization_result.system_state, initialization_result.logger);
        return 0;
    } catch (const std::exception& exception_error) {
        std::cerr << "Fatal error: " << exception_error.what() << std::endl;
        if (initialization_result.system_state) {
            SystemLogs::log_fatal_error(exception_error.what());
            try {
                shutdown(*initialization_result.system_state, initialization_result.logger);
            } catch (const std::exception& shutdown_error) {
                std::cerr << "Shutdown after fatal error failed: " << shutdown_error.what() << std::endl;
            }
        }
        return 1;
    }
}
