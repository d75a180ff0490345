#pragma once
#include <filesystem>

namespace fs = std::filesystem;

/// On-disk layout under the application data directory.
class AppPaths {
public:
    explicit AppPaths(fs::path dataDir) : root(std::move(dataDir)) {}

    const fs::path& dataDir() const { return root; }
    fs::path stateFile() const { return root / "state.json"; }
    fs::path transcriptsDir() const { return root / "transcripts"; }

    /// Creates the data and transcripts directories. Throws SupervisorError (Io).
    void ensureDirectories() const;

private:
    fs::path root;
};
