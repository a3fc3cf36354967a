#include "system_manager.hpp"
#include <curl/curl.h>
#include <memory>
#include <stdexcept>
#include <vector>
#include "api/alpaca/alpaca_broker.hpp"
#include "api/paper/paper_broker.hpp"
#include "api/yahoo/yahoo_finance_grabber.hpp"
#include "logging/logs/startup_logs.hpp"
#include "logging/logs/system_logs.hpp"
#include "trader/config_loader/config_loader.hpp"
#include "trader/errors/trading_errors.hpp"
#include "trader/market_data/feed.hpp"
#include "trader/orders/order_status_mapping.hpp"
#include "trader/strategy_analysis/momentum_williams_strategy.hpp"
#include "utils/instrument_utils.hpp"

using namespace IntradayTrader::Logging;
using IntradayTrader::Core::SetupError;

namespace IntradayTrader {
namespace System {

SystemInitializationResult initialize(const std::string& config_directory) {
    SystemInitializationResult initialization_result;

    // Minimal logging context first; configuration loading already logs
    auto early_logging_context = std::make_shared<LoggingContext>();
    set_logging_context(*early_logging_context);

    IntradayTrader::Config::SystemConfig initial_config;
    int config_load_result = load_system_config(initial_config, config_directory);
    if (config_load_result != 0) {
        SystemLogs::log_configuration_validated(false, "see configuration errors above");
        throw SetupError("configuration loading failed with result " + std::to_string(config_load_result));
    }

    // load_system_config has already run validate_config
    SystemLogs::log_configuration_validated(true, "");

    initialization_result.system_state = std::make_unique<SystemState>(initial_config);
    initialization_result.system_state->logging_context = early_logging_context;

    initialization_result.logger = initialize_application_foundation(*early_logging_context,
                                                                     initialization_result.system_state->config);

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        throw SetupError("curl global initialization failed");
    }

    return initialization_result;
}

std::unique_ptr<SystemModules> create_trading_modules(SystemState& state) {
    const IntradayTrader::Config::SystemConfig& config = state.config;
    LoggingContext& logging_context = *state.logging_context;
    auto modules = std::make_unique<SystemModules>();

    modules->data_grabber = std::make_shared<API::YahooFinanceGrabber>(config.data, state.market_data_connectivity);

    if (config.broker.mode == "paper") {
        modules->broker = std::make_shared<API::PaperBroker>(config.broker, modules->data_grabber, state.clock_source,
                                                             logging_context);
    } else if (config.broker.mode == "alpaca") {
        modules->broker = std::make_shared<API::AlpacaBroker>(config.broker, state.broker_connectivity, logging_context);
    } else {
        throw SetupError("unknown broker mode: " + config.broker.mode);
    }

    modules->order_manager = std::make_unique<Core::OrderLifecycleManager>(
        *modules->broker,
        Core::make_order_status_mapping(modules->broker->get_status_vocabulary()),
        state.clock_source,
        config.timing,
        logging_context
    );

    modules->data_sync_coordinator = std::make_unique<Core::DataSyncCoordinator>(state.clock_source, config.timing,
                                                                                 logging_context);
    for (const FeedConfig& feed_config : config.data.feeds) {
        modules->data_sync_coordinator->add_feed(Core::make_feed(feed_config, modules->data_grabber));
    }

    modules->strategy = std::make_shared<Core::MomentumWilliamsStrategy>(*modules->broker, config.strategy, logging_context);

    std::vector<std::string> tracked_symbols;
    for (const std::string& tracked_instrument : config.orders.tracked_instruments) {
        tracked_symbols.push_back(Core::parse_instrument(tracked_instrument).symbol);
    }

    modules->trading_loop = std::make_unique<Core::TradingLoopController>(
        modules->broker,
        modules->strategy,
        *modules->data_sync_coordinator,
        *modules->order_manager,
        state.clock_source,
        config.timing,
        tracked_symbols,
        logging_context
    );

    SystemLogs::log_modules_created(modules->broker->get_broker_name(), modules->data_grabber->get_provider_name(),
                                    modules->strategy->get_strategy_name(),
                                    modules->data_sync_coordinator->feed_count());
    return modules;
}

void startup(SystemState& system_state) {
    StartupLogs::log_application_header();
    StartupLogs::log_broker_configuration(system_state.config);
    StartupLogs::log_feed_configuration(system_state.config);
    StartupLogs::log_runtime_configuration(system_state.config);
    StartupLogs::log_strategy_configuration(system_state.config);

    try {
        system_state.trading_modules = create_trading_modules(system_state);
    } catch (const std::exception& exception_error) {
        SystemLogs::log_system_startup_error(exception_error.what());
        throw;
    }
    SystemLogs::log_startup_complete();
}

void run(SystemState& system_state) {
    if (!system_state.trading_modules || !system_state.trading_modules->trading_loop) {
        throw SetupError("run called before startup");
    }
    system_state.trading_modules->trading_loop->run(system_state.running);
}

void shutdown(SystemState& system_state, std::shared_ptr<IntradayTrader::Logging::AsyncLogger> logger) {
    if (system_state.trading_modules && system_state.trading_modules->trading_loop) {
        SystemLogs::log_shutdown_complete(system_state.trading_modules->trading_loop->get_tick_count());
    }
    system_state.running.store(false);
    system_state.trading_modules.reset();
    curl_global_cleanup();

    if (logger && system_state.logging_context) {
        shutdown_global_logger(*system_state.logging_context);
    }
}

} // namespace System
} // namespace IntradayTrader
