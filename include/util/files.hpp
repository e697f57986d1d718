#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>

namespace shapefuzz {
namespace util {

/**
 * Corpus file IO
 *
 * Entries are written atomically: the bytes go to a temporary file in
 * the same directory, are fsync()ed, and the temporary is renamed over
 * the target. A reader (e.g. a fuzzer watching the corpus directory)
 * therefore never sees a half-written entry.
 */

/**
 * Write data to file atomically
 * Returns true on success, false on failure
 */
bool atomic_write_file(const std::filesystem::path &path, const std::vector<uint8_t> &data,
                       int mode = 0644);

/**
 * Read entire file into vector
 * Returns an empty vector on failure or if larger than max_size
 */
std::vector<uint8_t> read_file(const std::filesystem::path &path,
                               size_t max_size = 100 * 1024 * 1024);

/**
 * Create directory if it doesn't exist (recursive)
 * Returns true on success or if already exists
 */
bool ensure_directory(const std::filesystem::path &dir);

} // namespace util
} // namespace shapefuzz
