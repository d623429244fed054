#include "sync/model/Classification.hpp"

namespace ferry::sync::model {

std::string to_string(const Classification c) {
    switch (c) {
    case Classification::New: return "new";
    case Classification::Identical: return "identical";
    case Classification::SizeMismatch: return "size-mismatch";
    case Classification::ChecksumMismatch: return "checksum-mismatch";
    }
    return "unknown";
}

}
