#include "system_manager.hpp"
#include "api/quotes/chart_quote_client.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logs/system_logs.hpp"
#include "logging/logs/technical_logs.hpp"
#include "threads/logging_thread.hpp"
#include "trader/config_loader/config_loader.hpp"
#include "trader/coordinators/trading_coordinator.hpp"
#include "trader/data_structures/trader_errors.hpp"
#include "trader/market_data/macro_data_fetcher.hpp"
#include "trader/market_data/price_series_loader.hpp"
#include "trader/trading_logic/order_builder.hpp"

using namespace HybridTrader::Logging;

namespace HybridTrader {
namespace System {

SystemInitializationResult initialize(const CommandLineOptions& options) {
    SystemInitializationResult initialization_result;
    initialization_result.system_state = std::make_unique<SystemState>();
    SystemState& system_state = *initialization_result.system_state;

    // Context first so create_run_logger can install the logger in it
    system_state.logging_context = std::make_shared<LoggingContext>();
    set_logging_context(*system_state.logging_context);

    try {
        int config_load_result = load_system_config(system_state.config, options.config_path);
        if (config_load_result != 0) {
            throw HybridTrader::Core::ConfigurationError("could not load " + options.config_path);
        }
        if (options.price_csv_path) {
            system_state.config.data.price_csv_path = *options.price_csv_path;
        }

        system_state.logger = create_run_logger(system_state.config.logging);

        // Accept lines before the thread starts so no early line bypasses the log file
        system_state.logger->start();
        system_state.logging_thread = std::thread(HybridTrader::Threads::LoggingThread(system_state.logger, system_state.config.logging));

        SystemLogs::log_startup_banner(options.config_path, system_state.logging_context->run_folder);
        SystemLogs::log_configuration_table(system_state.config);
    } catch (const std::exception& exception_error) {
        SystemLogs::log_fatal_error(std::string("System initialization failed: ") + exception_error.what());
        clear_logging_context();
        throw;
    }

    return initialization_result;
}

std::optional<nlohmann::json> run(SystemState& system_state, const CommandLineOptions& options) {
    const HybridTrader::Config::SystemConfig& config = system_state.config;

    std::vector<HybridTrader::Core::PricePoint> price_series = HybridTrader::Core::load_price_series_from_csv(config.data.price_csv_path);
    TechnicalLogs::log_price_series_loaded(config.data.price_csv_path, price_series);

    std::unique_ptr<HybridTrader::API::QuoteSourceInterface> quote_source;
    std::unique_ptr<HybridTrader::Core::MacroDataFetcher> macro_data_fetcher;
    if (!options.offline) {
        quote_source = std::make_unique<HybridTrader::API::Quotes::ChartQuoteClient>(config.quotes);
        macro_data_fetcher = std::make_unique<HybridTrader::Core::MacroDataFetcher>(*quote_source, config.quotes);
    }

    HybridTrader::Core::TradingCoordinator trading_coordinator(config, macro_data_fetcher.get());
    HybridTrader::Core::AnalysisResult analysis_result = trading_coordinator.run_analysis(price_series, options.macro_inputs);

    SystemLogs::log_run_complete(analysis_result.order.has_value());

    if (!analysis_result.order) {
        return std::nullopt;
    }
    return HybridTrader::Core::build_order_payload(*analysis_result.order);
}

void write_order_payload(std::ostream& payload_stream, const std::optional<nlohmann::json>& order_payload) {
    if (order_payload) {
        payload_stream << order_payload->dump(2) << std::endl;
    } else {
        payload_stream << "null" << std::endl;
    }
}

void shutdown(SystemState& system_state) {
    if (system_state.logger) {
        system_state.logger->stop();
    }
    if (system_state.logging_thread.joinable()) {
        system_state.logging_thread.join();
    }
    clear_logging_context();
}

} // namespace System
} // namespace HybridTrader
