#include "sync/tasks/Transfer.hpp"
#include "sync/Orchestrator.hpp"
#include "logging/LogRegistry.hpp"

using namespace ferry::sync::tasks;
using namespace ferry::logging;

Transfer::Transfer(Orchestrator& orchestrator, model::TransferTask task)
    : orchestrator(orchestrator), task(std::move(task)) {}

void Transfer::operator()() {
    bool ok = false;
    try {
        ok = orchestrator.transfer(task);
    } catch (const std::exception& e) {
        LogRegistry::sync()->error("[TransferTask] Failed to transfer {}: {}", task.subject(), e.what());
    }
    promise.set_value(ok);
}
