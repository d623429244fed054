#include "util/process.hpp"

#include <cerrno>
#include <stdexcept>
#include <fcntl.h>
#include <unistd.h>
#include <sys/wait.h>
#include <fmt/core.h>

namespace ferry::util {

namespace {

void emitLines(std::string& pending, const LineCallback& onLine, const bool flushAll) {
    if (!onLine) return;
    size_t start = 0;
    for (size_t nl; (nl = pending.find_first_of("\r\n", start)) != std::string::npos; start = nl + 1)
        if (nl > start) onLine(pending.substr(start, nl - start));
    pending.erase(0, start);
    if (flushAll && !pending.empty()) {
        onLine(pending);
        pending.clear();
    }
}

}

ProcessResult runProcess(const std::vector<std::string>& argv, const LineCallback& onLine) {
    if (argv.empty()) throw std::runtime_error("runProcess called with an empty argv");

    int pipefd[2];
    if (pipe2(pipefd, O_CLOEXEC) == -1) throw std::runtime_error(fmt::format("Failed to create pipe for {}", argv.front()));

    const pid_t pid = fork();
    if (pid < 0) {
        close(pipefd[0]);
        close(pipefd[1]);
        throw std::runtime_error(fmt::format("Failed to fork {}", argv.front()));
    }

    if (pid == 0) {
        // Child process: stdout and stderr both go to the pipe; dup2 clears close-on-exec on the copies
        dup2(pipefd[1], STDOUT_FILENO);
        dup2(pipefd[1], STDERR_FILENO);
        close(pipefd[0]);
        close(pipefd[1]);

        std::vector<char*> args;
        args.reserve(argv.size() + 1);
        for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
        args.push_back(nullptr);

        execvp(args[0], args.data());
        _exit(127); // exec failed
    }

    close(pipefd[1]);

    ProcessResult result;
    std::string pending;
    char buffer[4096];

    while (true) {
        const ssize_t n = read(pipefd[0], buffer, sizeof(buffer));
        if (n == 0) break;
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        result.output.append(buffer, n);
        pending.append(buffer, n);
        emitLines(pending, onLine, false);
    }
    emitLines(pending, onLine, true);
    close(pipefd[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) throw std::runtime_error(fmt::format("waitpid failed for {}", argv.front()));
    }

    if (WIFEXITED(status)) result.exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) result.exit_code = 128 + WTERMSIG(status);

    return result;
}

std::string shellQuote(const std::string& s) {
    std::string out = "'";
    for (const char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

std::string joinArgs(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& a : argv) {
        if (!out.empty()) out += ' ';
        out += a;
    }
    return out;
}

}
