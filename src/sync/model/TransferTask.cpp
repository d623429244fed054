#include "sync/model/TransferTask.hpp"

using namespace ferry::sync::model;

TransferTask TransferTask::forFile(const SourceFolder& source, ClassifiedFile file) {
    TransferTask t;
    t.kind = TransferKind::File;
    t.source = source;
    t.file = std::move(file);
    return t;
}

TransferTask TransferTask::forTree(const SourceFolder& source, std::string destination) {
    TransferTask t;
    t.kind = TransferKind::Tree;
    t.source = source;
    t.destination = std::move(destination);
    return t;
}

std::string TransferTask::subject() const {
    if (kind == TransferKind::Tree) return source.local.string();
    return file.local.string();
}
