#pragma once

#include "concurrency/Task.hpp"
#include "sync/model/TransferTask.hpp"

namespace ferry::sync {
class Orchestrator;
}

namespace ferry::sync::tasks {

// Runs one file transfer, retries included, on a pool worker.
struct Transfer final : concurrency::PromisedTask {
    Orchestrator& orchestrator;
    model::TransferTask task;

    Transfer(Orchestrator& orchestrator, model::TransferTask task);

    void operator()() override;
};

}
