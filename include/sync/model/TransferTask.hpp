#pragma once

#include "sync/model/Classification.hpp"
#include "sync/model/SourceFolder.hpp"

#include <string>

namespace ferry::sync::model {

enum class TransferKind {
    File,
    Tree,
};

struct TransferTask {
    TransferKind kind{TransferKind::File};
    SourceFolder source{};
    ClassifiedFile file{};    // set for File tasks
    std::string destination;  // "host:path" for Tree tasks

    static TransferTask forFile(const SourceFolder& source, ClassifiedFile file);
    static TransferTask forTree(const SourceFolder& source, std::string destination);

    // What the error log names when this task fails.
    [[nodiscard]] std::string subject() const;
};

}
