// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "codec/endian.hpp"
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <utility>
#include <vector>

namespace shapefuzz {
namespace codec {

/**
 * Append-only byte destination for binary serialization
 *
 * Every multi-byte numeric write uses the sink's endianness. Writes are
 * best-effort: a failed append never throws, it latches has_error() so
 * the caller can check once after the whole value has been encoded.
 */
class ByteSink {
public:
  explicit ByteSink(Endianness order) : order_(order) {}
  virtual ~ByteSink() = default;

  ByteSink(const ByteSink &) = delete;
  ByteSink &operator=(const ByteSink &) = delete;

  // Write primitives
  void write_uint8(uint8_t value);
  void write_uint16(uint16_t value);
  void write_uint32(uint32_t value);
  void write_uint64(uint64_t value);
  void write_float(float value);
  void write_double(double value);

  // Bulk write, no byte-order conversion
  void write_bytes(const uint8_t *data, size_t len);
  void write_bytes(const std::vector<uint8_t> &data);

  Endianness endianness() const { return order_; }
  bool has_error() const { return error_; }

  // Total bytes accepted by the destination
  size_t bytes_written() const { return written_; }

protected:
  // Returns false when the destination rejected the bytes
  virtual bool append(const uint8_t *data, size_t len) = 0;

private:
  Endianness order_;
  bool error_{false};
  size_t written_{0};
};

/**
 * In-memory sink; never fails
 */
class BufferSink : public ByteSink {
public:
  explicit BufferSink(Endianness order = Endianness::Little);

  const std::vector<uint8_t> &data() const { return buffer_; }
  size_t size() const { return buffer_.size(); }
  void clear() { buffer_.clear(); }

  std::vector<uint8_t> release() { return std::move(buffer_); }

protected:
  bool append(const uint8_t *data, size_t len) override;

private:
  std::vector<uint8_t> buffer_;
};

/**
 * Sink over a std::ostream (files, pipes). Stream failures are latched
 * into has_error(); once the stream has failed further writes are dropped.
 */
class StreamSink : public ByteSink {
public:
  StreamSink(std::ostream &out, Endianness order);

protected:
  bool append(const uint8_t *data, size_t len) override;

private:
  std::ostream &out_;
};

} // namespace codec
} // namespace shapefuzz
