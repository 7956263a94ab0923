// Copyright (c) 2025 The NearLink Developers
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace nearlink {
namespace util {

/**
 * Crash-safe file replacement
 *
 * Pattern:
 * 1. Write to a temporary sibling file (.tmp.<random> suffix)
 * 2. fsync() the file
 * 3. fsync() the directory so the rename is durable
 * 4. rename() over the original
 *
 * Readers see either the old contents or the new contents, never a torn file.
 *
 * @param mode Permissions of the new file (0600 for secrets such as identities)
 * Returns true on success, false on failure (temp file is removed)
 */
bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data,
                       int mode = 0644);

/**
 * Read a whole file as a string
 * Returns std::nullopt if the file is missing, unreadable or larger than 1 MiB
 */
std::optional<std::string> read_file_string(const std::filesystem::path &path);

/**
 * Create directory if it doesn't exist (recursive)
 * Returns true on success or if already exists
 */
bool ensure_directory(const std::filesystem::path &dir);

/**
 * Default data directory: $HOME/.nearlink, or ./.nearlink without HOME
 */
std::filesystem::path get_default_datadir();

} // namespace util
} // namespace nearlink
