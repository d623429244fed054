#pragma once

#include <filesystem>
#include <string>

namespace ferry::sync::model {

struct SourceFolder {
    std::filesystem::path local;   // absolute source directory
    std::string remote_prefix;     // remote directory the tree lands in

    SourceFolder() = default;
    SourceFolder(std::filesystem::path local, std::string remotePrefix);

    // rsync without a trailing slash pushes "src" into "<destination>/src"; mirror that layout.
    static SourceFolder under(const std::filesystem::path& source, const std::string& destination);

    // remote_prefix + "/" + rel, with exactly one separator.
    [[nodiscard]] std::string remotePathFor(const std::filesystem::path& rel) const;
};

}
