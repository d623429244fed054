#pragma once

#include "remote/RemoteProbe.hpp"
#include "config/Config.hpp"
#include "util/process.hpp"

#include <functional>
#include <string>
#include <vector>

namespace ferry::remote {

class SSHProbe final : public RemoteProbe {
public:
    using Runner = std::function<util::ProcessResult(const std::vector<std::string>&)>;

    SSHProbe(std::string host, config::SSHConfig cfg, Runner runner = defaultRunner());

    bool exists(const std::string& remotePath) override;
    std::optional<RemoteStat> stat(const std::string& remotePath) override;
    bool mkdir_p(const std::string& remoteDir) override;

    // ssh argv up to and including the host, without a remote command.
    [[nodiscard]] std::vector<std::string> baseArgs() const;

    // ssh argv running remoteCommand on the host.
    [[nodiscard]] std::vector<std::string> command(const std::string& remoteCommand) const;

    // "ssh -o ..." as a single string, for rsync's -e.
    [[nodiscard]] std::string remoteShell() const;

    // Parses "<size> <mtime>" as printed by stat -c '%s %Y'.
    static std::optional<RemoteStat> parseStat(const std::string& output);

    static Runner defaultRunner();

private:
    [[nodiscard]] std::vector<std::string> sshOptions() const;
    util::ProcessResult run(const std::string& remoteCommand) const;

    std::string host_;
    config::SSHConfig cfg_;
    Runner runner_;
};

}
