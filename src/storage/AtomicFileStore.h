#pragma once
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

namespace fs = std::filesystem;

/**
 * @brief Whole-file read and write-temp-then-rename for one file category.
 *
 * One instance per logical file; its mutex serializes every read and write
 * of that file, so a reader sees either the old or the new content and two
 * writers never interleave. Only file I/O runs under the lock, callers
 * serialize and parse outside it.
 */
class AtomicFileStore {
public:
    explicit AtomicFileStore(fs::path path);

    /**
     * @brief Reads the whole file.
     * @return std::nullopt when the file does not exist
     * @throws SupervisorError (Io)
     */
    std::optional<std::string> read() const;

    /**
     * @brief Writes contents to the sibling temp path, then renames it over
     * the real path. The committed file is untouched if any step fails.
     * @throws SupervisorError (Io)
     */
    void write(const std::string& contents);

    const fs::path& path() const { return filePath; }
    fs::path tempPath() const;

private:
    fs::path filePath;
    mutable std::mutex mtx;
};
