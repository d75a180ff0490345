#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/ConfigManager.h"
#include "process/ChildProcess.h"

namespace fs = std::filesystem;

/**
 * @brief Decides how a workspace server is started.
 *
 * Priority: explicit config command, then source mode (runtime + entry
 * script under the repo root), then the bundled sidecar binary.
 */
class ServerLauncher {
public:
    explicit ServerLauncher(Config::Server config);

    /**
     * @brief Base command without workspace arguments.
     * @throws SupervisorError (NotFound) when the entry, dist dir or sidecar is missing
     */
    LaunchCommand resolve() const;

    /**
     * @brief resolve() plus --dir <path> --port 0 --json [--yolo].
     */
    LaunchCommand forWorkspace(const std::string& workspacePath, bool unrestricted) const;

    /**
     * @brief Searches dirs for the sidecar binary: exact name first, then a
     * target-suffixed name such as cowork-server-x86_64-unknown-linux-gnu.
     */
    static std::optional<fs::path> findSidecar(const std::vector<fs::path>& dirs, const std::string& baseName);

    static bool matchesSidecarName(const std::string& fileName, const std::string& baseName);

    static fs::path executableDir();

private:
    LaunchCommand resolveSource() const;
    LaunchCommand resolveBundled() const;

    Config::Server config;
};
