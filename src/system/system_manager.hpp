#ifndef SYSTEM_MANAGER_HPP
#define SYSTEM_MANAGER_HPP

#include <memory>
#include <string>
#include "system/system_modules.hpp"
#include "system/system_state.hpp"
#include "logging/logger/async_logger.hpp"

namespace IntradayTrader {
namespace System {

struct SystemInitializationResult {
    std::unique_ptr<SystemState> system_state;
    std::shared_ptr<IntradayTrader::Logging::AsyncLogger> logger;

    SystemInitializationResult() = default;
    SystemInitializationResult(SystemInitializationResult&&) = default;
    SystemInitializationResult& operator=(SystemInitializationResult&&) = default;

    SystemInitializationResult(const SystemInitializationResult&) = delete;
    SystemInitializationResult& operator=(const SystemInitializationResult&) = delete;
};

// Loads and validates configuration, then opens the run log; throws SetupError on failure
SystemInitializationResult initialize(const std::string& config_directory = "config");

// Builds the adapters and trading components described by the configuration
std::unique_ptr<SystemModules> create_trading_modules(SystemState& system_state);

// System lifecycle management
void startup(SystemState& system_state);
void run(SystemState& system_state);
void shutdown(SystemState& system_state, std::shared_ptr<IntradayTrader::Logging::AsyncLogger> logger);

} // namespace System
} // namespace IntradayTrader

#endif // SYSTEM_MANAGER_HPP
