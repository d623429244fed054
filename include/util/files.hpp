#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace ferry::util {

std::string readFileToString(const std::filesystem::path& path);

// Writes to a sibling temp file and renames it over path, so readers see the old or the new content.
void writeFileAtomic(const std::filesystem::path& path, const std::string& content);

// Modification time in whole seconds since the epoch (st_mtime).
int64_t mtimeSeconds(const std::filesystem::path& path);

}
