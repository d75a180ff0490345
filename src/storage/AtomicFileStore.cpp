#include "storage/AtomicFileStore.h"
#include "core/Errors.h"
#include <fstream>
#include <iterator>
#include <system_error>

AtomicFileStore::AtomicFileStore(fs::path path) : filePath(std::move(path)) {}

fs::path AtomicFileStore::tempPath() const {
    fs::path tmp = filePath;
    tmp += ".tmp";
    return tmp;
}

std::optional<std::string> AtomicFileStore::read() const {
    std::lock_guard<std::mutex> lock(mtx);

    std::error_code ec;
    if (!fs::exists(filePath, ec)) {
        if (ec) {
            throw SupervisorError::io("Failed to stat " + filePath.u8string() + ": " + ec.message());
        }
        return std::nullopt;
    }

    std::ifstream file(filePath, std::ios::binary);
    if (!file.is_open()) {
        throw SupervisorError::io("Failed to read " + filePath.u8string());
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw SupervisorError::io("Failed to read " + filePath.u8string());
    }
    return content;
}

void AtomicFileStore::write(const std::string& contents) {
    std::error_code ec;
    if (filePath.has_parent_path()) {
        fs::create_directories(filePath.parent_path(), ec);
        if (ec) {
            throw SupervisorError::io("Failed to create " + filePath.parent_path().u8string() + ": " + ec.message());
        }
    }

    fs::path tmp = tempPath();

    std::lock_guard<std::mutex> lock(mtx);
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw SupervisorError::io("Failed to write temp file " + tmp.u8string());
        }
        out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        out.flush();
        if (!out) {
            out.close();
            fs::remove(tmp, ec);
            throw SupervisorError::io("Failed to write temp file " + tmp.u8string());
        }
    }

    fs::rename(tmp, filePath, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw SupervisorError::io("Failed to rename " + tmp.u8string() + " to " + filePath.u8string() + ": " +
                                  ec.message());
    }
}
