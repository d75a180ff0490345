#include "storage/AppPaths.h"
#include "core/Errors.h"
#include <system_error>

void AppPaths::ensureDirectories() const {
    std::error_code ec;
    fs::create_directories(transcriptsDir(), ec);
    if (ec) {
        throw SupervisorError::io("Failed to create data directory " + transcriptsDir().u8string() + ": " +
                                  ec.message());
    }
}
