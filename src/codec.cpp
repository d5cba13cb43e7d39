#include <algorithm>
#include <limits>

#include <fmt/format.h>
#include <zlib.h>

#include <pakx/codec.hpp>

namespace pakx {

namespace {

// zlib lengths are uInt; larger spans are fed in pieces
constexpr size_t maxZlibChunk = size_t{1} << 30;
constexpr size_t zlibWindowSize = 64 * 1024;

} // namespace

uint32_t checksum(std::span<const uint8_t> data, uint32_t crc) {
  uLong value = crc;
  while (!data.empty()) {
    size_t chunk = std::min(data.size(), maxZlibChunk);
    value = ::crc32(value, data.data(), static_cast<uInt>(chunk));
    data = data.subspan(chunk);
  }
  return static_cast<uint32_t>(value);
}

std::optional<std::vector<uint8_t>> compressPayload(std::span<const uint8_t> data, int level,
                                                    Error *outError) {
  if (level < Z_DEFAULT_COMPRESSION || level > Z_BEST_COMPRESSION) {
    setError(outError, ErrorCode::CompressionFailed,
             fmt::format("Invalid compression level {}", level));
    return std::nullopt;
  }

  std::vector<uint8_t> out(compressBound(static_cast<uLong>(data.size())));
  uLongf destLen = static_cast<uLongf>(out.size());
  int ret = compress2(out.data(), &destLen, data.data(), static_cast<uLong>(data.size()), level);
  if (ret != Z_OK) {
    setError(outError, ErrorCode::CompressionFailed,
             fmt::format("zlib compress2 failed with code {} for {} bytes", ret, data.size()));
    return std::nullopt;
  }

  out.resize(destLen);
  return out;
}

struct Inflater::Stream {
  z_stream zs{};
  bool ready = false;

  Stream() { ready = inflateInit(&zs) == Z_OK; }
  ~Stream() {
    if (ready) {
      inflateEnd(&zs);
    }
  }
};

Inflater::Inflater() : stream_(std::make_unique<Stream>()), window_(zlibWindowSize) {}

Inflater::~Inflater() = default;

Inflater::Inflater(Inflater &&) noexcept = default;

Inflater &Inflater::operator=(Inflater &&) noexcept = default;

bool Inflater::update(std::span<const uint8_t> input, const ByteSink &sink, Error *outError) {
  if (!stream_ || !stream_->ready) {
    return setError(outError, ErrorCode::IntegrityMismatch, "zlib inflate stream unavailable");
  }

  while (!input.empty()) {
    if (finished_) {
      return setError(outError, ErrorCode::IntegrityMismatch,
                      fmt::format("{} trailing bytes after end of compressed stream", input.size()));
    }

    size_t chunk = std::min(input.size(), maxZlibChunk);
    z_stream &zs = stream_->zs;
    zs.next_in = const_cast<Bytef *>(input.data()); // zlib does not take const*
    zs.avail_in = static_cast<uInt>(chunk);

    do {
      zs.next_out = window_.data();
      zs.avail_out = static_cast<uInt>(window_.size());

      int ret = inflate(&zs, Z_NO_FLUSH);
      if (ret != Z_OK && ret != Z_STREAM_END && ret != Z_BUF_ERROR) {
        return setError(outError, ErrorCode::IntegrityMismatch,
                        fmt::format("Compressed payload is corrupt (zlib: {})",
                                    zs.msg ? zs.msg : "unknown error"));
      }

      size_t produced = window_.size() - zs.avail_out;
      if (produced > 0) {
        sink(std::span<const uint8_t>(window_.data(), produced));
      }

      if (ret == Z_STREAM_END) {
        finished_ = true;
        break;
      }
      if (ret == Z_BUF_ERROR && produced == 0) {
        break; // needs more input
      }
    } while (zs.avail_out == 0 || zs.avail_in > 0);

    size_t consumed = chunk - zs.avail_in;
    input = input.subspan(consumed);
    if (!finished_ && consumed == 0) {
      return setError(outError, ErrorCode::IntegrityMismatch,
                      "Compressed payload stalled without progress");
    }
  }

  return true;
}

struct Deflater::Stream {
  z_stream zs{};
  bool ready = false;

  explicit Stream(int level) { ready = deflateInit(&zs, level) == Z_OK; }
  ~Stream() {
    if (ready) {
      deflateEnd(&zs);
    }
  }
};

Deflater::Deflater(int level)
    : stream_(std::make_unique<Stream>(level)), window_(zlibWindowSize), level_(level) {}

Deflater::~Deflater() = default;

Deflater::Deflater(Deflater &&) noexcept = default;

Deflater &Deflater::operator=(Deflater &&) noexcept = default;

bool Deflater::ready() const {
  return stream_ && stream_->ready;
}

bool Deflater::pump(int flush, const ByteSink &sink, Error *outError) {
  z_stream &zs = stream_->zs;
  int ret = Z_OK;
  do {
    zs.next_out = window_.data();
    zs.avail_out = static_cast<uInt>(window_.size());

    ret = deflate(&zs, flush);
    if (ret == Z_STREAM_ERROR) {
      return setError(outError, ErrorCode::CompressionFailed,
                      fmt::format("zlib deflate failed ({})", zs.msg ? zs.msg : "stream error"));
    }

    size_t produced = window_.size() - zs.avail_out;
    if (produced > 0) {
      sink(std::span<const uint8_t>(window_.data(), produced));
    }
  } while (zs.avail_out == 0 && ret != Z_STREAM_END);

  if (flush == Z_FINISH && ret != Z_STREAM_END) {
    return setError(outError, ErrorCode::CompressionFailed,
                    fmt::format("zlib deflate did not end the stream (code {})", ret));
  }
  return true;
}

bool Deflater::update(std::span<const uint8_t> input, const ByteSink &sink, Error *outError) {
  if (!ready()) {
    return setError(outError, ErrorCode::CompressionFailed,
                    fmt::format("Invalid compression level {}", level_));
  }
  if (finished_) {
    return setError(outError, ErrorCode::CompressionFailed,
                    "Compressed stream was already finished");
  }

  while (!input.empty()) {
    size_t chunk = std::min(input.size(), maxZlibChunk);
    z_stream &zs = stream_->zs;
    zs.next_in = const_cast<Bytef *>(input.data()); // zlib does not take const*
    zs.avail_in = static_cast<uInt>(chunk);
    if (!pump(Z_NO_FLUSH, sink, outError)) {
      return false;
    }
    input = input.subspan(chunk - zs.avail_in);
  }
  return true;
}

bool Deflater::finish(const ByteSink &sink, Error *outError) {
  if (!ready()) {
    return setError(outError, ErrorCode::CompressionFailed,
                    fmt::format("Invalid compression level {}", level_));
  }
  if (finished_) {
    return true;
  }

  z_stream &zs = stream_->zs;
  zs.next_in = nullptr;
  zs.avail_in = 0;
  if (!pump(Z_FINISH, sink, outError)) {
    return false;
  }
  finished_ = true;
  return true;
}

} // namespace pakx
