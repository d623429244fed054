#include "sync/model/SourceFolder.hpp"

using namespace ferry::sync::model;

namespace {

std::string stripTrailingSlashes(std::string s) {
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    return s;
}

}

SourceFolder::SourceFolder(std::filesystem::path local, std::string remotePrefix)
    : local(std::move(local)), remote_prefix(stripTrailingSlashes(std::move(remotePrefix))) {}

SourceFolder SourceFolder::under(const std::filesystem::path& source, const std::string& destination) {
    auto abs = std::filesystem::absolute(source).lexically_normal();
    if (!abs.has_filename()) abs = abs.parent_path();

    const auto dest = stripTrailingSlashes(destination);
    const auto name = abs.filename().string();
    if (dest == "/") return {abs, "/" + name};
    return {abs, dest + "/" + name};
}

std::string SourceFolder::remotePathFor(const std::filesystem::path& rel) const {
    const auto relStr = rel.generic_string();
    if (remote_prefix.empty()) return relStr;
    if (remote_prefix.back() == '/') return remote_prefix + relStr;
    return remote_prefix + "/" + relStr;
}
