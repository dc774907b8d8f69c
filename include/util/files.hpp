// Copyright (c) 2024 TimeChunk developers
// Distributed under the MIT software license

#ifndef TIMECHUNK_UTIL_FILES_HPP
#define TIMECHUNK_UTIL_FILES_HPP

#include <filesystem>
#include <string>

namespace timechunk {
namespace util {

/**
 * Crash-safe file replacement
 *
 * Writes to a sibling temporary file, fsyncs it, then renames it over
 * `path`. Readers see either the old file or the new one, never a torn
 * write. Creates the parent directory if needed.
 */
bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data);

// Create directory (recursively) if it doesn't exist
bool ensure_directory(const std::filesystem::path &dir);

// ~/.timechunk, or ./.timechunk when HOME is unset
std::filesystem::path get_default_datadir();

} // namespace util
} // namespace timechunk

#endif // TIMECHUNK_UTIL_FILES_HPP
