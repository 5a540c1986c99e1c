#ifndef SYSTEM_MANAGER_HPP
#define SYSTEM_MANAGER_HPP

#include <memory>
#include <optional>
#include <ostream>
#include <nlohmann/json.hpp>
#include "system/system_state.hpp"
#include "system/command_line.hpp"

namespace HybridTrader {
namespace System {

struct SystemInitializationResult {
    std::unique_ptr<SystemState> system_state;

    SystemInitializationResult() = default;
    SystemInitializationResult(SystemInitializationResult&&) = default;
    SystemInitializationResult& operator=(SystemInitializationResult&&) = default;

    SystemInitializationResult(const SystemInitializationResult&) = delete;
    SystemInitializationResult& operator=(const SystemInitializationResult&) = delete;
};

// Loads and validates configuration, creates the run folder and starts the logging thread.
SystemInitializationResult initialize(const CommandLineOptions& options);

// One decision run. Returns the order payload, or nullopt for NO_TRADE.
std::optional<nlohmann::json> run(SystemState& system_state, const CommandLineOptions& options);

// The pretty-printed payload, or "null" for NO_TRADE. Nothing else is written to this stream.
void write_order_payload(std::ostream& payload_stream, const std::optional<nlohmann::json>& order_payload);

void shutdown(SystemState& system_state);

} // namespace System
} // namespace HybridTrader

#endif // SYSTEM_MANAGER_HPP
