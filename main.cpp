// Config
#include "config/Config.hpp"

// Logging
#include "logging/LogRegistry.hpp"

// Sync
#include "sync/Orchestrator.hpp"
#include "sync/model/ErrorLog.hpp"
#include "cache/ChecksumCache.hpp"
#include "concurrency/Sleeper.hpp"

// Remote side
#include "remote/SSHProbe.hpp"
#include "transfer/RsyncExecutor.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

using namespace ferry;
using namespace ferry::config;
using namespace ferry::logging;

namespace {

constexpr int EXIT_COMPLETED_WITH_ERRORS = 2;

void usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [config-file]\n"
              << "  config-file  .env (default) or YAML (*.yaml, *.yml) configuration\n";
}

}

int main(const int argc, char** argv) {
    std::filesystem::path configPath = ".env";
    if (argc > 1) {
        const std::string arg = argv[1];
        if (arg == "-h" || arg == "--help") {
            usage(argv[0]);
            return EXIT_SUCCESS;
        }
        configPath = arg;
    }

    Config cfg;
    try {
        cfg = loadConfigFile(configPath);
        LogRegistry::init(cfg.logging, cfg.paths.session_log);
    } catch (const std::exception& e) {
        std::cerr << "[ferry] " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    try {
        auto probe = std::make_shared<remote::SSHProbe>(cfg.remote.host, cfg.remote.ssh);
        auto executor = std::make_shared<transfer::RsyncExecutor>(
            probe, cfg.remote.host, transfer::RsyncOptions::from(cfg, probe->remoteShell()));

        cache::ChecksumCache cache;
        sync::model::SessionErrorLog errors;

        sync::Orchestrator orchestrator(cfg, probe, executor,
                                        std::make_shared<concurrency::ThreadSleeper>(), cache, errors);
        const auto summary = orchestrator.run();

        for (const auto& line : summary.lines()) {
            if (summary.clean()) LogRegistry::ferry()->info("{}", line);
            else LogRegistry::ferry()->warn("{}", line);
        }

        return summary.clean() ? EXIT_SUCCESS : EXIT_COMPLETED_WITH_ERRORS;
    } catch (const ConfigurationError& e) {
        LogRegistry::ferry()->error("[-] Configuration error: {}", e.what());
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        LogRegistry::ferry()->error("[-] Synchronization failed: {}", e.what());
        return EXIT_FAILURE;
    }
}
