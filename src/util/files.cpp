#include "util/files.hpp"
#include "util/logging.hpp"
#include <cstdio>
#include <fstream>
#include <random>
#include <string>

#if defined(__APPLE__) || defined(__linux__)
#include <fcntl.h>
#include <unistd.h>
#define SHAPEFUZZ_POSIX_FILES 1
#endif

namespace shapefuzz {
namespace util {

namespace {

#ifdef SHAPEFUZZ_POSIX_FILES
// Make the rename durable
bool sync_directory(const std::filesystem::path &dir) {
#if defined(__APPLE__)
  int fd = open(dir.c_str(), O_RDONLY); // no O_DIRECTORY on macOS
#else
  int fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY);
#endif
  if (fd < 0) {
    return false;
  }
  bool result = fsync(fd) == 0;
  close(fd);
  return result;
}

bool write_and_sync(const std::filesystem::path &path, const std::vector<uint8_t> &data,
                    int mode) {
  int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, mode);
  if (fd < 0) {
    return false;
  }

  size_t total = 0;
  while (total < data.size()) {
    ssize_t n = write(fd, data.data() + total, data.size() - total);
    if (n <= 0) {
      close(fd);
      return false;
    }
    total += static_cast<size_t>(n);
  }

  bool synced = fsync(fd) == 0;
  close(fd);
  return synced;
}
#else
bool sync_directory(const std::filesystem::path &) { return true; }

// No fsync available; the rename is still atomic
bool write_and_sync(const std::filesystem::path &path, const std::vector<uint8_t> &data, int) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return false;
  }
  out.write(reinterpret_cast<const char *>(data.data()),
            static_cast<std::streamsize>(data.size()));
  out.flush();
  return static_cast<bool>(out);
}
#endif

// Workers write into the same directory concurrently
std::string random_suffix() {
  static thread_local std::mt19937 gen(std::random_device{}());
  static thread_local std::uniform_int_distribution<> dis(0, 0xFFFF);
  char buf[8];
  snprintf(buf, sizeof(buf), "%04x", dis(gen));
  return std::string(buf);
}

} // namespace

bool atomic_write_file(const std::filesystem::path &path, const std::vector<uint8_t> &data,
                       int mode) {
  auto parent = path.parent_path();
  if (!parent.empty() && !ensure_directory(parent)) {
    LOG_ERROR("cannot create directory {}", parent.string());
    return false;
  }

  auto temp_path = path;
  temp_path += ".tmp." + random_suffix();

  std::error_code ec;
  if (!write_and_sync(temp_path, data, mode)) {
    LOG_ERROR("failed to write {}", temp_path.string());
    std::filesystem::remove(temp_path, ec);
    return false;
  }

  if (!parent.empty() && !sync_directory(parent)) {
    std::filesystem::remove(temp_path, ec);
    return false;
  }

  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    LOG_ERROR("failed to rename {} to {}: {}", temp_path.string(), path.string(), ec.message());
    std::filesystem::remove(temp_path, ec);
    return false;
  }
  return true;
}

std::vector<uint8_t> read_file(const std::filesystem::path &path, size_t max_size) {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  if (!file) {
    return {};
  }

  std::streampos pos = file.tellg();
  if (pos == std::streampos(-1) || pos < 0) {
    return {};
  }

  const auto size = static_cast<size_t>(pos);
  if (size > max_size) {
    LOG_WARN("refusing to read {} ({} bytes exceeds {})", path.string(), size, max_size);
    return {};
  }

  std::vector<uint8_t> data(size);
  file.seekg(0);
  file.read(reinterpret_cast<char *>(data.data()), static_cast<std::streamsize>(size));
  if (!file) {
    return {};
  }
  return data;
}

bool ensure_directory(const std::filesystem::path &dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  return !ec || std::filesystem::is_directory(dir);
}

} // namespace util
} // namespace shapefuzz
