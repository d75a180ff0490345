#include "utils/IdValidator.h"
#include "core/Errors.h"
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace {
bool isSafeChar(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '-' || c == '_';
}
} // namespace

namespace IdValidator {

bool isSafeId(const std::string& id) {
    if (id.empty() || id.size() > kMaxIdLength) return false;
    for (char c : id) {
        if (!isSafeChar(c)) return false;
    }
    return true;
}

void validateSafeId(const std::string& id, const std::string& label) {
    if (id.empty()) {
        throw SupervisorError::invalidInput(label + " must not be empty");
    }
    if (id.size() > kMaxIdLength) {
        throw SupervisorError::invalidInput(label + " is too long");
    }
    if (!isSafeId(id)) {
        throw SupervisorError::invalidInput(
            label + " contains invalid characters (only alphanumeric, hyphens, underscores allowed)");
    }
}

void validateWorkspacePath(const std::string& path) {
    std::error_code ec;
    fs::path p = fs::u8path(path);
    if (path.empty() || !fs::exists(p, ec)) {
        throw SupervisorError::notFound("Workspace path does not exist: " + path);
    }
    if (!fs::is_directory(p, ec)) {
        throw SupervisorError::invalidInput("Workspace path is not a directory: " + path);
    }
}

} // namespace IdValidator
