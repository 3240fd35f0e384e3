#include "services/Collaborators.hpp"
#include "logging/LogRegistry.hpp"

#include <nlohmann/json.hpp>

using namespace bh::services;
using namespace bh::logging;

void LogExecutionStore::persistExecutionState(const types::Execution& execution) {
    LogRegistry::dispatch()->debug("[ExecutionStore] {} -> {}", execution.id, std::string(types::Execution::toString(execution.state)));
}

void AuditOutcomeNotifier::notifyOutcome(const types::Execution& execution) {
    const nlohmann::json j = execution;
    LogRegistry::audit()->info("{}", j.dump());
}
