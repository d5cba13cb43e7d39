#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <vector>

#include "types.hpp"

namespace pakx {

// Receives decoded payload bytes as they become available
using ByteSink = std::function<void(std::span<const uint8_t>)>;

// CRC-32 (zlib polynomial); pass the previous result as `crc` to continue a running sum
uint32_t checksum(std::span<const uint8_t> data, uint32_t crc = 0);

// Whole-buffer zlib compression. Fails with CompressionFailed.
std::optional<std::vector<uint8_t>> compressPayload(std::span<const uint8_t> data, int level,
                                                    Error *outError = nullptr);

// Upper bound of zlib's expansion when inflating (1032:1)
inline constexpr uint64_t maxInflateRatio = 1032;

// Streaming zlib deflater; compressed output is pushed to a sink chunk by chunk
class Deflater {
public:
  explicit Deflater(int level);
  ~Deflater();

  Deflater(const Deflater &) = delete;
  Deflater &operator=(const Deflater &) = delete;
  Deflater(Deflater &&) noexcept;
  Deflater &operator=(Deflater &&) noexcept;

  // False when zlib refused the level given to the constructor
  bool ready() const;

  // Compresses all of `input`. Fails with CompressionFailed.
  bool update(std::span<const uint8_t> input, const ByteSink &sink, Error *outError = nullptr);

  // Flushes the remaining output and ends the stream
  bool finish(const ByteSink &sink, Error *outError = nullptr);

private:
  bool pump(int flush, const ByteSink &sink, Error *outError);

  struct Stream;
  std::unique_ptr<Stream> stream_;
  std::vector<uint8_t> window_;
  int level_;
  bool finished_ = false;
};

// Streaming zlib inflater; output is pushed to a sink chunk by chunk
class Inflater {
public:
  Inflater();
  ~Inflater();

  Inflater(const Inflater &) = delete;
  Inflater &operator=(const Inflater &) = delete;
  Inflater(Inflater &&) noexcept;
  Inflater &operator=(Inflater &&) noexcept;

  // Consumes all of `input`. Returns false if the stream is corrupt or has trailing bytes.
  bool update(std::span<const uint8_t> input, const ByteSink &sink, Error *outError = nullptr);

  // True once the end of the zlib stream was reached
  bool finished() const { return finished_; }

private:
  struct Stream;
  std::unique_ptr<Stream> stream_;
  std::vector<uint8_t> window_;
  bool finished_ = false;
};

} // namespace pakx
