#include "server/ServerLauncher.h"
#include "core/Errors.h"
#include <cstdlib>
#include <system_error>

ServerLauncher::ServerLauncher(Config::Server config) : config(std::move(config)) {}

LaunchCommand ServerLauncher::resolve() const {
    if (!config.command.empty()) {
        LaunchCommand cmd;
        cmd.program = config.command.front();
        cmd.args.assign(config.command.begin() + 1, config.command.end());
        return cmd;
    }
    if (config.useSource) {
        return resolveSource();
    }
    return resolveBundled();
}

LaunchCommand ServerLauncher::forWorkspace(const std::string& workspacePath, bool unrestricted) const {
    LaunchCommand cmd = resolve();
    cmd.args.push_back("--dir");
    cmd.args.push_back(workspacePath);
    cmd.args.push_back("--port");
    cmd.args.push_back("0");
    cmd.args.push_back("--json");
    if (unrestricted) {
        cmd.args.push_back("--yolo");
    }
    return cmd;
}

LaunchCommand ServerLauncher::resolveSource() const {
    std::error_code ec;
    fs::path root = fs::absolute(fs::u8path(config.repoRoot), ec);
    if (ec) root = fs::u8path(config.repoRoot);

    fs::path entry = root / fs::u8path(config.entry);
    if (!fs::exists(entry, ec)) {
        throw SupervisorError::notFound("Server entrypoint not found: " + entry.u8string());
    }

    LaunchCommand cmd;
    cmd.program = config.runtime;
    cmd.args.push_back(entry.u8string());
    cmd.workingDir = root.u8string();
    return cmd;
}

LaunchCommand ServerLauncher::resolveBundled() const {
    std::error_code ec;
    fs::path resourceDir = config.resourceDir.empty() ? executableDir() : fs::u8path(config.resourceDir);

    fs::path builtInDir = resourceDir / "dist";
    if (!fs::exists(builtInDir, ec)) {
        throw SupervisorError::notFound("Bundled dist directory not found: " + builtInDir.u8string());
    }

    std::optional<fs::path> sidecar;
    const char* overridePath = std::getenv("COWORK_DESKTOP_SIDECAR_PATH");
    if (overridePath && *overridePath && fs::exists(fs::u8path(overridePath), ec)) {
        sidecar = fs::u8path(overridePath);
    }
    if (!sidecar) {
        std::vector<fs::path> dirs = {resourceDir, resourceDir / "binaries"};
        fs::path exeDir = executableDir();
        if (!exeDir.empty()) {
            dirs.push_back(exeDir);
            dirs.push_back(exeDir / "binaries");
        }
        sidecar = findSidecar(dirs, config.sidecarName);
    }
    if (!sidecar) {
        throw SupervisorError::notFound("Server sidecar binary not found (expected " + config.sidecarName + ")");
    }

    LaunchCommand cmd;
    cmd.program = sidecar->u8string();
    cmd.workingDir = resourceDir.u8string();
    cmd.env["COWORK_BUILTIN_DIR"] = builtInDir.u8string();
    cmd.env["COWORK_DESKTOP_BUNDLE"] = "1";
    return cmd;
}

bool ServerLauncher::matchesSidecarName(const std::string& fileName, const std::string& baseName) {
    if (fileName == baseName) return true;
    // Accept target-suffixed binaries (ex: cowork-server-aarch64-apple-darwin)
    std::string prefix = baseName + "-";
    return fileName.size() > prefix.size() && fileName.compare(0, prefix.size(), prefix) == 0;
}

std::optional<fs::path> ServerLauncher::findSidecar(const std::vector<fs::path>& dirs, const std::string& baseName) {
    std::error_code ec;

    // First pass: exact filename.
    for (const auto& dir : dirs) {
        fs::path candidate = dir / baseName;
        if (fs::is_regular_file(candidate, ec)) return candidate;
    }

    // Second pass: scan for target-suffixed binaries.
    for (const auto& dir : dirs) {
        if (!fs::is_directory(dir, ec)) continue;
        for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
            if (!it->is_regular_file(ec)) continue;
            if (matchesSidecarName(it->path().filename().u8string(), baseName)) {
                return it->path();
            }
        }
    }
    return std::nullopt;
}

fs::path ServerLauncher::executableDir() {
    std::error_code ec;
    fs::path exe = fs::canonical("/proc/self/exe", ec);
    if (ec) return {};
    return exe.parent_path();
}
