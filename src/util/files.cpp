#include "util/files.hpp"

#include <fstream>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>
#include <fmt/core.h>

namespace ferry::util {

std::string readFileToString(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) throw std::runtime_error("Failed to open file: " + path.string());

    const std::streamsize size = in.tellg();
    in.seekg(0, std::ios::beg);

    std::string buffer(size, '\0');
    if (!in.read(buffer.data(), size))
        throw std::runtime_error("Failed to read file: " + path.string());
    in.close();

    return buffer;
}

void writeFileAtomic(const std::filesystem::path& path, const std::string& content) {
    namespace fs = std::filesystem;

    if (path.has_parent_path() && !fs::exists(path.parent_path()))
        fs::create_directories(path.parent_path());

    const fs::path tmp = fmt::format("{}.tmp.{}", path.string(), ::getpid());

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) throw std::runtime_error("Failed to open temp file: " + tmp.string());
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            out.close();
            std::error_code ec;
            fs::remove(tmp, ec);
            throw std::runtime_error("Failed to write temp file: " + tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw std::runtime_error(fmt::format("Failed to replace {}: {}", path.string(), ec.message()));
    }
}

int64_t mtimeSeconds(const std::filesystem::path& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0)
        throw std::runtime_error("Failed to stat file: " + path.string());
    return static_cast<int64_t>(st.st_mtime);
}

}
