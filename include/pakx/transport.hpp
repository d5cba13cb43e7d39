#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "resumable.hpp"
#include "store.hpp"
#include "types.hpp"

namespace pakx {

// Request counters, mostly useful to tests and diagnostics
struct TransportCounters {
  uint64_t reads = 0;
  uint64_t writes = 0;
  uint64_t truncates = 0;
  uint64_t bytesRead = 0;
  uint64_t bytesWritten = 0;
};

// Drives resumable operations over a readable store, servicing each request
// synchronously. Store errors are passed through unchanged.
class Transport {
public:
  explicit Transport(ReadableStore &store) : store_(store) {}
  virtual ~Transport() = default;

  Transport(const Transport &) = delete;
  Transport &operator=(const Transport &) = delete;

  // Runs `operation` to completion. Returns std::nullopt on failure, with the
  // operation's or the store's error in outError if provided.
  template <typename T>
  std::optional<T> run(Resumable<T> &operation, Error *outError = nullptr) {
    Step<T> step = operation.start();
    while (step.suspended()) {
      Completion completion;
      if (!service(step.request(), completion, outError)) {
        return std::nullopt;
      }
      step = operation.feed(completion);
    }

    if (step.failed()) {
      if (outError) {
        *outError = step.error();
      }
      return std::nullopt;
    }
    return step.takeValue();
  }

  std::optional<uint64_t> size(Error *outError = nullptr) { return store_.size(outError); }

  const TransportCounters &counters() const { return counters_; }

protected:
  virtual bool service(const Request &request, Completion &completion, Error *outError);

  bool serviceRead(const ReadRequest &request, Completion &completion, Error *outError);

  TransportCounters counters_;
  uint64_t cursor_ = 0; // Store position after the last serviced request

private:
  ReadableStore &store_;
  std::vector<uint8_t> buffer_;
};

// Transport that can also service write and truncate requests
class MutableTransport : public Transport {
public:
  explicit MutableTransport(WritableStore &store) : Transport(store), writable_(store) {}

  // Direct truncate, used to discard scratch data after a failed operation
  bool truncate(uint64_t length, Error *outError = nullptr);

  bool sync(Error *outError = nullptr);

protected:
  bool service(const Request &request, Completion &completion, Error *outError) override;

private:
  WritableStore &writable_;
};

} // namespace pakx
