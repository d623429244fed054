#pragma once

#include <functional>
#include <string>
#include <vector>

namespace ferry::util {

struct ProcessResult {
    int exit_code{-1};
    std::string output{}; // stdout and stderr, interleaved

    [[nodiscard]] bool ok() const { return exit_code == 0; }
};

using LineCallback = std::function<void(const std::string&)>;

// Runs argv[0] from PATH and waits for it. 127 means exec failed, 128+N means killed by signal N.
// Throws std::runtime_error if the pipe or the fork cannot be created.
ProcessResult runProcess(const std::vector<std::string>& argv, const LineCallback& onLine = {});

// Wraps s in single quotes for a POSIX shell, escaping embedded quotes.
std::string shellQuote(const std::string& s);

// argv joined with spaces, for logging.
std::string joinArgs(const std::vector<std::string>& argv);

}
