#pragma once

#include "transfer/Executor.hpp"
#include "config/Config.hpp"
#include "util/process.hpp"

#include <filesystem>
#include <functional>
#include <optional>

namespace ferry::transfer {

struct RsyncOptions {
    bool preserve_attributes = true;  // -a, otherwise -r
    bool partial = true;              // --partial
    bool compress = false;            // -z
    bool checksum = true;             // -c
    bool sparse = true;               // -S
    bool progress = true;             // -h --progress
    bool itemize = true;              // --itemize-changes
    std::filesystem::path log_file{}; // --log-file=
    std::string remote_shell{};       // -e
    std::vector<std::string> excludes{};
    std::vector<std::string> extra{};

    static RsyncOptions from(const config::Config& cfg, std::string remoteShell);
};

struct ItemizedChange {
    char update{};     // '<' sent, '>' received, 'c' created, 'h' hard link, '.' attributes only, '*' message
    char type{};       // 'f' file, 'd' directory, 'L' symlink, ...
    std::string name;

    [[nodiscard]] bool contentSent() const { return update == '<' || update == '>'; }
};

class RsyncExecutor final : public Executor {
public:
    using Runner = std::function<util::ProcessResult(const std::vector<std::string>&, const util::LineCallback&)>;

    RsyncExecutor(std::shared_ptr<remote::RemoteProbe> probe, std::string host, RsyncOptions options,
                  Runner runner = defaultRunner());

    [[nodiscard]] std::vector<std::string> flags() const;
    [[nodiscard]] std::vector<std::string> treeArgs(const sync::model::SourceFolder& source, const std::string& destination) const;
    [[nodiscard]] std::vector<std::string> fileArgs(const sync::model::ClassifiedFile& file) const;

    static std::optional<ItemizedChange> parseItemized(const std::string& line);

    static Runner defaultRunner();

protected:
    TransferResult transferTree(const sync::model::SourceFolder& source, const std::string& destination) override;
    TransferResult transferFile(const sync::model::ClassifiedFile& file) override;

private:
    TransferResult invoke(const std::vector<std::string>& argv) const;

    std::string host_;
    RsyncOptions options_;
    Runner runner_;
};

}
