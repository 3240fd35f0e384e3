#pragma once

#include "types/Execution.hpp"

namespace bh::services {

// Receives every state transition of every execution
class ExecutionStore {
public:
    virtual ~ExecutionStore() = default;
    virtual void persistExecutionState(const types::Execution& execution) = 0;
};

// Receives each execution once, when it reaches a terminal state
class OutcomeNotifier {
public:
    virtual ~OutcomeNotifier() = default;
    virtual void notifyOutcome(const types::Execution& execution) = 0;
};

class LogExecutionStore final : public ExecutionStore {
public:
    void persistExecutionState(const types::Execution& execution) override;
};

class AuditOutcomeNotifier final : public OutcomeNotifier {
public:
    void notifyOutcome(const types::Execution& execution) override;
};

}
