#include <spdlog/spdlog.h>

#include <pakx/transport.hpp>

namespace pakx {

bool Transport::service(const Request &request, Completion &completion, Error *outError) {
  if (const auto *read = std::get_if<ReadRequest>(&request)) {
    return serviceRead(*read, completion, outError);
  }
  // Capability is decided by the transport type, never by attempting the IO
  return setError(outError, ErrorCode::ReadOnly,
                  "Operation needs write access but the store is read-only");
}

bool Transport::serviceRead(const ReadRequest &request, Completion &completion,
                            Error *outError) {
  uint64_t offset = request.mode == ReadRequest::Mode::Absolute ? request.offset : cursor_;
  if (!store_.seek(offset, outError)) {
    return false;
  }

  buffer_.resize(static_cast<size_t>(request.length));
  size_t filled = 0;
  while (filled < buffer_.size()) {
    auto got = store_.read(std::span<uint8_t>(buffer_).subspan(filled), outError);
    if (!got) {
      return false;
    }
    if (*got == 0) {
      break;
    }
    filled += *got;
  }

  ++counters_.reads;
  counters_.bytesRead += filled;
  cursor_ = offset + filled;

  completion.data = std::span<const uint8_t>(buffer_.data(), filled);
  completion.endOfInput = filled < buffer_.size();
  if (completion.endOfInput) {
    spdlog::trace("Short read at {}: {} of {} bytes", offset, filled, request.length);
  }
  return true;
}

bool MutableTransport::service(const Request &request, Completion &completion,
                               Error *outError) {
  if (const auto *write = std::get_if<WriteRequest>(&request)) {
    if (!writable_.seek(write->offset, outError) || !writable_.write(write->data, outError)) {
      return false;
    }
    ++counters_.writes;
    counters_.bytesWritten += write->data.size();
    cursor_ = write->offset + write->data.size();
    completion = Completion{};
    return true;
  }

  if (const auto *truncate = std::get_if<TruncateRequest>(&request)) {
    if (!writable_.truncate(truncate->length, outError)) {
      return false;
    }
    ++counters_.truncates;
    spdlog::trace("Truncated store to {} bytes", truncate->length);
    completion = Completion{};
    return true;
  }

  return Transport::service(request, completion, outError);
}

bool MutableTransport::truncate(uint64_t length, Error *outError) {
  if (!writable_.truncate(length, outError)) {
    return false;
  }
  ++counters_.truncates;
  return true;
}

bool MutableTransport::sync(Error *outError) {
  return writable_.sync(outError);
}

} // namespace pakx
