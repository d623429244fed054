#include "remote/SSHProbe.hpp"
#include "logging/LogRegistry.hpp"

#include <sstream>
#include <fmt/core.h>

using namespace ferry::remote;
using namespace ferry::logging;
using namespace ferry::util;

SSHProbe::SSHProbe(std::string host, config::SSHConfig cfg, Runner runner)
    : host_(std::move(host)), cfg_(std::move(cfg)), runner_(std::move(runner)) {}

SSHProbe::Runner SSHProbe::defaultRunner() {
    return [](const std::vector<std::string>& argv) { return runProcess(argv); };
}

std::vector<std::string> SSHProbe::sshOptions() const {
    std::vector<std::string> opts = {
        "-o", "BatchMode=yes",
        "-o", fmt::format("ServerAliveInterval={}", cfg_.server_alive_interval),
        "-o", fmt::format("ServerAliveCountMax={}", cfg_.server_alive_count_max),
        "-o", fmt::format("ConnectTimeout={}", cfg_.connect_timeout)
    };
    for (const auto& o : cfg_.options) {
        opts.emplace_back("-o");
        opts.push_back(o);
    }
    return opts;
}

std::vector<std::string> SSHProbe::baseArgs() const {
    std::vector<std::string> args = {"ssh"};
    const auto opts = sshOptions();
    args.insert(args.end(), opts.begin(), opts.end());
    args.push_back(host_);
    return args;
}

std::vector<std::string> SSHProbe::command(const std::string& remoteCommand) const {
    auto args = baseArgs();
    args.push_back("--");
    args.push_back(remoteCommand);
    return args;
}

std::string SSHProbe::remoteShell() const {
    // rsync splits -e on whitespace honouring quotes, so spaced options must stay one word
    std::vector<std::string> args = {"ssh"};
    for (const auto& o : sshOptions()) {
        const bool plain = o.find_first_of(" \t'\"\\") == std::string::npos;
        args.push_back(plain ? o : shellQuote(o));
    }
    return joinArgs(args);
}

ProcessResult SSHProbe::run(const std::string& remoteCommand) const {
    return runner_(command(remoteCommand));
}

bool SSHProbe::exists(const std::string& remotePath) {
    try {
        return run("test -e " + shellQuote(remotePath)).ok();
    } catch (const std::exception& e) {
        LogRegistry::remote()->warn("[SSHProbe] exists({}) failed on {}: {}", remotePath, host_, e.what());
        return false;
    }
}

std::optional<RemoteStat> SSHProbe::stat(const std::string& remotePath) {
    try {
        const auto res = run("stat -c '%s %Y' " + shellQuote(remotePath));
        if (!res.ok()) {
            LogRegistry::remote()->debug("[SSHProbe] stat({}) exited with {}", remotePath, res.exit_code);
            return std::nullopt;
        }
        auto st = parseStat(res.output);
        if (!st) LogRegistry::remote()->warn("[SSHProbe] Unparsable stat output for {}: '{}'", remotePath, res.output);
        return st;
    } catch (const std::exception& e) {
        LogRegistry::remote()->warn("[SSHProbe] stat({}) failed on {}: {}", remotePath, host_, e.what());
        return std::nullopt;
    }
}

bool SSHProbe::mkdir_p(const std::string& remoteDir) {
    try {
        const auto res = run("mkdir -p " + shellQuote(remoteDir));
        if (!res.ok()) {
            LogRegistry::remote()->warn("[SSHProbe] mkdir -p {} exited with {}: {}", remoteDir, res.exit_code, res.output);
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        LogRegistry::remote()->warn("[SSHProbe] mkdir -p {} failed on {}: {}", remoteDir, host_, e.what());
        return false;
    }
}

std::optional<RemoteStat> SSHProbe::parseStat(const std::string& output) {
    std::istringstream in(output);
    RemoteStat st;
    if (!(in >> st.size >> st.mtime)) return std::nullopt;
    return st;
}
