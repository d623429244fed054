#pragma once

#include "sync/model/TransferTask.hpp"

#include <memory>
#include <string>
#include <vector>

namespace ferry::remote {
class RemoteProbe;
}

namespace ferry::transfer {

struct TransferResult {
    bool success{false};
    int exit_code{-1};
    std::vector<std::string> changed{}; // names whose content was sent, from itemized output

    [[nodiscard]] bool changedAny() const { return !changed.empty(); }
};

/*
 * Moves one unit of work to the remote. Tree tasks go out in one invocation and let the
 * bulk-transfer tool diff on its own; file tasks first make sure the remote parent exists.
 * There is no partial success below one invocation.
 */
class Executor {
public:
    explicit Executor(std::shared_ptr<remote::RemoteProbe> probe);
    virtual ~Executor() = default;

    TransferResult run(const sync::model::TransferTask& task);

protected:
    virtual TransferResult transferTree(const sync::model::SourceFolder& source, const std::string& destination) = 0;
    virtual TransferResult transferFile(const sync::model::ClassifiedFile& file) = 0;

    std::shared_ptr<remote::RemoteProbe> probe_;
};

}
