#include "transfer/RsyncExecutor.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/core.h>

using namespace ferry::transfer;
using namespace ferry::sync::model;
using namespace ferry::logging;
using namespace ferry::util;

RsyncOptions RsyncOptions::from(const config::Config& cfg, std::string remoteShell) {
    RsyncOptions o;
    o.preserve_attributes = cfg.transfer.preserve_attributes;
    o.partial = cfg.transfer.partial;
    o.compress = cfg.transfer.compress;
    o.sparse = cfg.transfer.sparse;
    o.progress = cfg.transfer.progress;
    o.checksum = cfg.sync.checksum;
    o.log_file = cfg.paths.session_log;
    o.remote_shell = std::move(remoteShell);
    o.excludes = cfg.sync.excludes;
    o.extra = cfg.transfer.options;
    return o;
}

RsyncExecutor::RsyncExecutor(std::shared_ptr<remote::RemoteProbe> probe, std::string host,
                             RsyncOptions options, Runner runner)
    : Executor(std::move(probe)), host_(std::move(host)), options_(std::move(options)), runner_(std::move(runner)) {}

RsyncExecutor::Runner RsyncExecutor::defaultRunner() {
    return [](const std::vector<std::string>& argv, const LineCallback& onLine) { return runProcess(argv, onLine); };
}

std::vector<std::string> RsyncExecutor::flags() const {
    std::vector<std::string> f;
    f.emplace_back(options_.preserve_attributes ? "-a" : "-r");
    if (options_.checksum) f.emplace_back("-c");
    if (options_.sparse) f.emplace_back("-S");
    if (options_.compress) f.emplace_back("-z");
    if (options_.partial) f.emplace_back("--partial");
    if (options_.progress) {
        f.emplace_back("-h");
        f.emplace_back("--progress");
    }
    if (options_.itemize) f.emplace_back("--itemize-changes");
    if (!options_.log_file.empty()) f.push_back("--log-file=" + options_.log_file.string());
    if (!options_.remote_shell.empty()) {
        f.emplace_back("-e");
        f.push_back(options_.remote_shell);
    }
    for (const auto& pattern : options_.excludes) f.push_back("--exclude=" + pattern);
    f.insert(f.end(), options_.extra.begin(), options_.extra.end());
    return f;
}

std::vector<std::string> RsyncExecutor::treeArgs(const SourceFolder& source, const std::string& destination) const {
    std::vector<std::string> argv = {"rsync"};
    const auto f = flags();
    argv.insert(argv.end(), f.begin(), f.end());

    // No trailing slash: the folder itself lands under the destination
    auto src = source.local.string();
    while (src.size() > 1 && src.back() == '/') src.pop_back();
    argv.push_back(src);
    argv.push_back(destination);
    return argv;
}

std::vector<std::string> RsyncExecutor::fileArgs(const ClassifiedFile& file) const {
    std::vector<std::string> argv = {"rsync"};
    const auto f = flags();
    argv.insert(argv.end(), f.begin(), f.end());
    argv.push_back(file.local.string());
    argv.push_back(host_ + ":" + file.remote);
    return argv;
}

std::optional<ItemizedChange> RsyncExecutor::parseItemized(const std::string& line) {
    // YXcstpoguax<space>name; the attribute field is 11 characters wide
    constexpr size_t ATTR_WIDTH = 11;
    if (line.size() <= ATTR_WIDTH + 1 || line[ATTR_WIDTH] != ' ') return std::nullopt;

    const char update = line[0];
    switch (update) {
    case '<': case '>': case 'c': case 'h': case '.': case '*': break;
    default: return std::nullopt;
    }

    return ItemizedChange{update, line[1], line.substr(ATTR_WIDTH + 1)};
}

TransferResult RsyncExecutor::invoke(const std::vector<std::string>& argv) const {
    LogRegistry::transfer()->debug("[RsyncExecutor] {}", joinArgs(argv));

    TransferResult result;
    const auto proc = runner_(argv, [&result](const std::string& line) {
        if (const auto change = parseItemized(line)) {
            if (change->contentSent()) result.changed.push_back(change->name);
            LogRegistry::transfer()->debug("[rsync] {}", line);
        } else {
            LogRegistry::transfer()->trace("[rsync] {}", line);
        }
    });

    result.exit_code = proc.exit_code;
    result.success = proc.ok();
    if (!result.success)
        LogRegistry::transfer()->warn("[RsyncExecutor] rsync exited with status {}", proc.exit_code);
    return result;
}

TransferResult RsyncExecutor::transferTree(const SourceFolder& source, const std::string& destination) {
    LogRegistry::transfer()->info("[RsyncExecutor] Syncing {} to {}", source.local.string(), destination);
    return invoke(treeArgs(source, destination));
}

TransferResult RsyncExecutor::transferFile(const ClassifiedFile& file) {
    LogRegistry::transfer()->info("[RsyncExecutor] Sending {} to {}:{}", file.local.string(), host_, file.remote);
    return invoke(fileArgs(file));
}
