// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "codec/byte_sink.hpp"
#include "util/logging.hpp"
#include <ostream>

namespace shapefuzz {
namespace codec {

void ByteSink::write_uint8(uint8_t value) { write_bytes(&value, 1); }

void ByteSink::write_uint16(uint16_t value) {
  uint8_t buf[2];
  Write16(buf, value, order_);
  write_bytes(buf, sizeof(buf));
}

void ByteSink::write_uint32(uint32_t value) {
  uint8_t buf[4];
  Write32(buf, value, order_);
  write_bytes(buf, sizeof(buf));
}

void ByteSink::write_uint64(uint64_t value) {
  uint8_t buf[8];
  Write64(buf, value, order_);
  write_bytes(buf, sizeof(buf));
}

void ByteSink::write_float(float value) {
  write_uint32(std::bit_cast<uint32_t>(value));
}

void ByteSink::write_double(double value) {
  write_uint64(std::bit_cast<uint64_t>(value));
}

void ByteSink::write_bytes(const uint8_t *data, size_t len) {
  if (len == 0) {
    return;
  }
  if (!append(data, len)) {
    if (!error_) {
      LOG_CODEC_WARN("ByteSink: destination rejected {} bytes after {} written", len,
                     written_);
    }
    error_ = true;
    return;
  }
  written_ += len;
}

void ByteSink::write_bytes(const std::vector<uint8_t> &data) {
  write_bytes(data.data(), data.size());
}

BufferSink::BufferSink(Endianness order) : ByteSink(order) {
  buffer_.reserve(256);
}

bool BufferSink::append(const uint8_t *data, size_t len) {
  buffer_.insert(buffer_.end(), data, data + len);
  return true;
}

StreamSink::StreamSink(std::ostream &out, Endianness order)
    : ByteSink(order), out_(out) {}

bool StreamSink::append(const uint8_t *data, size_t len) {
  if (!out_) {
    return false;
  }
  out_.write(reinterpret_cast<const char *>(data), static_cast<std::streamsize>(len));
  return static_cast<bool>(out_);
}

} // namespace codec
} // namespace shapefuzz
