#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>

#include <signal.h>

#include "core/ConfigManager.h"
#include "core/HostProtocol.h"
#include "core/Supervisor.h"
#include "server/ServerLauncher.h"
#include "utils/Logger.h"

namespace fs = std::filesystem;

namespace {
std::atomic<bool> g_shutdownRequested{false};

void handleShutdownSignal(int) {
    g_shutdownRequested = true;
}

// No SA_RESTART: a blocked stdin read returns EINTR so the request loop can exit.
void installSignalHandlers() {
    struct sigaction sa {};
    sa.sa_handler = handleShutdownSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    std::signal(SIGPIPE, SIG_IGN);
}

std::string findConfigPath(int argc, char* argv[]) {
    if (argc >= 2) return argv[1];
    if (fs::exists(fs::u8path("config.json"))) return "config.json";
    fs::path exeDir = ServerLauncher::executableDir();
    if (!exeDir.empty() && fs::exists(exeDir / "config.json")) {
        return (exeDir / "config.json").u8string();
    }
    return "";
}
} // namespace

int main(int argc, char* argv[]) {
    installSignalHandlers();

    Config cfg;
    std::string configPath = findConfigPath(argc, argv);
    try {
        cfg = configPath.empty() ? Config::defaults() : Config::load(configPath);
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << std::endl;
        std::cerr << "Usage: cowork-supervisor [config.json]" << std::endl;
        return 1;
    }

    Logger& logger = Logger::getInstance();
    logger.setLogFile(cfg.logging.file);
    logger.setMinLevel(cfg.logging.debug ? LogLevel::DEBUG : LogLevel::INFO);
    if (!configPath.empty()) {
        logger.info("Loaded configuration from: " + configPath);
    }
    logger.info("Data directory: " + cfg.storage.dataDir);

    Supervisor supervisor(cfg);
    HostProtocol protocol(supervisor);

    std::string line;
    while (!g_shutdownRequested && std::getline(std::cin, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        std::cout << protocol.handleLine(line).dump() << std::endl;
    }

    if (g_shutdownRequested) {
        logger.info("Shutdown requested, stopping workspace servers");
    }
    supervisor.stopAllServers();
    return 0;
}
