#pragma once
#include <cstddef>
#include <string>

/**
 * @brief Guards identifiers and paths before they reach the filesystem or a
 * child process command line.
 *
 * Every identifier that is later joined into a path (thread ids, workspace
 * ids) must pass validateSafeId first. Both functions throw SupervisorError.
 */
namespace IdValidator {

constexpr std::size_t kMaxIdLength = 256;

/**
 * @brief Accepts 1..256 characters from [A-Za-z0-9_-].
 * @param id    value to check
 * @param label name used in the error message (e.g. "thread_id")
 * @throws SupervisorError (InvalidInput)
 */
void validateSafeId(const std::string& id, const std::string& label);

/// Non-throwing form of validateSafeId.
bool isSafeId(const std::string& id);

/**
 * @brief Requires an existing directory.
 * @throws SupervisorError NotFound when missing, InvalidInput when not a directory
 */
void validateWorkspacePath(const std::string& path);

} // namespace IdValidator
