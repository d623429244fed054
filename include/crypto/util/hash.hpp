#pragma once

#include <string>
#include <filesystem>

namespace ferry::crypto::hash {

// Hex-encoded BLAKE2b digest of the file content. Throws if the file cannot be read.
std::string blake2b(const std::filesystem::path& filepath);

}
