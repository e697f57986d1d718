#include "util/string_parsing.hpp"
#include <charconv>
#include <sstream>
#include <system_error>

namespace shapefuzz {
namespace util {

namespace {

// Whole-string parse; from_chars already rejects leading whitespace and '+'
template <typename T> std::optional<T> ParseWhole(const std::string &str, T min, T max) {
  if (str.empty()) {
    return std::nullopt;
  }

  T value{};
  const char *begin = str.data();
  const char *end = str.data() + str.size();
  auto [ptr, ec] = std::from_chars(begin, end, value);

  if (ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  if (value < min || value > max) {
    return std::nullopt;
  }
  return value;
}

} // namespace

std::optional<int> SafeParseInt(const std::string &str, int min, int max) {
  return ParseWhole<int>(str, min, max);
}

std::optional<uint64_t> SafeParseUInt64(const std::string &str, uint64_t min, uint64_t max) {
  return ParseWhole<uint64_t>(str, min, max);
}

std::optional<size_t> SafeParseSize(const std::string &str, size_t min, size_t max) {
  return ParseWhole<size_t>(str, min, max);
}

std::vector<std::string> SplitComponents(const std::string &str) {
  std::vector<std::string> items;
  std::stringstream ss(str);
  std::string item;
  while (std::getline(ss, item, ',')) {
    if (!item.empty()) {
      items.push_back(item);
    }
  }
  return items;
}

} // namespace util
} // namespace shapefuzz
