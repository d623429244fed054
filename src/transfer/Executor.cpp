#include "transfer/Executor.hpp"
#include "remote/RemoteProbe.hpp"
#include "logging/LogRegistry.hpp"

#include <stdexcept>

using namespace ferry::transfer;
using namespace ferry::sync::model;
using namespace ferry::logging;

namespace {

std::string remoteParent(const std::string& remotePath) {
    const auto slash = remotePath.find_last_of('/');
    if (slash == std::string::npos) return ".";
    if (slash == 0) return "/";
    return remotePath.substr(0, slash);
}

}

Executor::Executor(std::shared_ptr<remote::RemoteProbe> probe) : probe_(std::move(probe)) {
    if (!probe_) throw std::invalid_argument("Executor requires a remote probe");
}

TransferResult Executor::run(const TransferTask& task) {
    switch (task.kind) {
    case TransferKind::Tree:
        return transferTree(task.source, task.destination);
    case TransferKind::File: {
        const auto parent = remoteParent(task.file.remote);
        // A directory that truly cannot be created surfaces as a failed transfer below
        if (!probe_->mkdir_p(parent))
            LogRegistry::transfer()->warn("[Executor] Could not ensure remote directory {}", parent);
        return transferFile(task.file);
    }
    }
    throw std::logic_error("Unhandled transfer kind");
}
