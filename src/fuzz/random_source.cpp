// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "fuzz/random_source.hpp"

namespace shapefuzz {
namespace fuzz {

uint64_t ByteStreamRandomSource::Next() {
  if (exhausted()) {
    return tail_();
  }
  uint64_t value = 0;
  for (int shift = 0; shift < 64 && pos_ < size_; shift += 8) {
    value |= static_cast<uint64_t>(data_[pos_++]) << shift;
  }
  return value;
}

} // namespace fuzz
} // namespace shapefuzz
