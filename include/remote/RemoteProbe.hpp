#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace ferry::remote {

struct RemoteStat {
    uint64_t size{};
    int64_t mtime{};
};

// Queries against the remote side. Implementations never throw: a failed query reads as "not there".
class RemoteProbe {
public:
    virtual ~RemoteProbe() = default;

    virtual bool exists(const std::string& remotePath) = 0;
    virtual std::optional<RemoteStat> stat(const std::string& remotePath) = 0;

    // Idempotent. A false return is logged by the caller, never fatal.
    virtual bool mkdir_p(const std::string& remoteDir) = 0;
};

}
