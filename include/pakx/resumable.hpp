#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "codec.hpp"
#include "format.hpp"
#include "types.hpp"

namespace pakx {

// Requests a resumable operation suspends on. Operations never touch a store themselves;
// a Transport services the request and feeds the outcome back.

struct ReadRequest {
  enum class Mode {
    Absolute, // exactly `length` bytes starting at `offset`
    Continue, // `length` more bytes from where the previous read stopped
  };

  Mode mode = Mode::Absolute;
  uint64_t offset = 0;
  uint64_t length = 0;
};

struct WriteRequest {
  uint64_t offset = 0;
  std::span<const uint8_t> data; // Owned by the operation, valid until the next feed()
};

struct TruncateRequest {
  uint64_t length = 0;
};

using Request = std::variant<ReadRequest, WriteRequest, TruncateRequest>;

// Outcome of a serviced request
struct Completion {
  std::span<const uint8_t> data; // Bytes read; shorter than requested only at end of input
  bool endOfInput = false;
};

// One step of a resumable operation: suspended on a request, done, or failed
template <typename T> class Step {
public:
  static Step suspend(Request request) {
    return Step(State(std::in_place_index<0>, std::move(request)));
  }
  static Step done(T value) { return Step(State(std::in_place_index<1>, std::move(value))); }
  static Step fail(Error error) { return Step(State(std::in_place_index<2>, std::move(error))); }
  static Step fail(ErrorCode code, std::string message) {
    return fail(Error{code, std::move(message)});
  }

  bool suspended() const { return state_.index() == 0; }
  bool isDone() const { return state_.index() == 1; }
  bool failed() const { return state_.index() == 2; }

  const Request &request() const { return std::get<0>(state_); }
  const T &value() const { return std::get<1>(state_); }
  T takeValue() { return std::move(std::get<1>(state_)); }
  const Error &error() const { return std::get<2>(state_); }

private:
  using State = std::variant<Request, T, Error>;
  explicit Step(State state) : state_(std::move(state)) {}

  State state_;
};

// A suspendable computation. start() is called once; feed() once per serviced request,
// until a step is done or failed. All progress lives in member fields.
template <typename T> class Resumable {
public:
  using Result = T;

  virtual ~Resumable() = default;

  virtual Step<T> start() = 0;
  virtual Step<T> feed(const Completion &completion) = 0;
};

// ---------------------------------------------------------------------------
// Decoders

// Reads and validates the fixed-size archive header at offset 0
class HeaderDecoder : public Resumable<ArchiveHeader> {
public:
  Step<ArchiveHeader> start() override;
  Step<ArchiveHeader> feed(const Completion &completion) override;

private:
  bool started_ = false;
};

// Reads all `capacity` index slots in batches and classifies each one.
// `storeLength` bounds the data area for entry range checks; a table that would end
// past it fails with UnexpectedEof before anything is read.
class IndexTableDecoder : public Resumable<std::vector<IndexSlot>> {
public:
  IndexTableDecoder(const ArchiveHeader &header, uint64_t storeLength,
                    uint32_t slotsPerRead = 256);

  Step<std::vector<IndexSlot>> start() override;
  Step<std::vector<IndexSlot>> feed(const Completion &completion) override;

private:
  Step<std::vector<IndexSlot>> requestBatch();
  bool checkBounds(const IndexSlot &slot, uint32_t position, Error *outError) const;

  ArchiveHeader header_;
  uint64_t storeLength_;
  uint32_t slotsPerRead_;

  uint32_t next_ = 0;    // First slot of the pending batch
  uint32_t pending_ = 0; // Slots in the pending batch
  uint32_t occupied_ = 0;
  std::vector<IndexSlot> slots_;
};

// Streams one entry's payload to a sink, inflating deflate entries, then verifies the
// uncompressed length and CRC-32. Returns the number of bytes delivered.
class PayloadDecoder : public Resumable<uint64_t> {
public:
  PayloadDecoder(std::string name, const EntryDescriptor &entry, ByteSink sink,
                 size_t chunkSize = 64 * 1024);

  Step<uint64_t> start() override;
  Step<uint64_t> feed(const Completion &completion) override;

private:
  Step<uint64_t> requestChunk(ReadRequest::Mode mode);
  Step<uint64_t> finish();
  void deliver(std::span<const uint8_t> chunk);

  std::string name_;
  EntryDescriptor entry_;
  ByteSink sink_;
  size_t chunkSize_;

  Inflater inflater_;
  uint64_t consumed_ = 0;  // Stored bytes received so far
  uint64_t requested_ = 0; // Size of the pending read
  uint64_t produced_ = 0;  // Uncompressed bytes delivered
  uint32_t crc_ = 0;
  bool overflow_ = false;
};

// ---------------------------------------------------------------------------
// Encoders

// Writes header and every slot, then optionally truncates the store.
// Used to lay down a fresh index (create), to persist it (flush) and to commit a repack.
class IndexTableEncoder : public Resumable<uint64_t> {
public:
  IndexTableEncoder(const ArchiveHeader &header, std::span<const IndexSlot> slots,
                    std::optional<uint64_t> truncateTo = std::nullopt,
                    uint32_t slotsPerWrite = 256);

  Step<uint64_t> start() override;
  Step<uint64_t> feed(const Completion &completion) override;

private:
  enum class Phase { Header, Slots, Truncate, Done };

  Step<uint64_t> writeBatch();

  ArchiveHeader header_;
  std::span<const IndexSlot> slots_;
  std::optional<uint64_t> truncateTo_;
  uint32_t slotsPerWrite_;

  Phase phase_ = Phase::Header;
  uint32_t next_ = 0;
  uint64_t written_ = 0;
  std::vector<uint8_t> buffer_;
};

// Writes the header and only the listed slot positions
class IndexPatchEncoder : public Resumable<uint64_t> {
public:
  IndexPatchEncoder(const ArchiveHeader &header, std::span<const IndexSlot> slots,
                    std::vector<uint32_t> positions);

  Step<uint64_t> start() override;
  Step<uint64_t> feed(const Completion &completion) override;

private:
  Step<uint64_t> writeNext();

  ArchiveHeader header_;
  std::span<const IndexSlot> slots_;
  std::vector<uint32_t> positions_;

  size_t next_ = 0;
  uint64_t written_ = 0;
  std::vector<uint8_t> buffer_;
};

// Writes a payload at a fixed offset in chunks
class PayloadEncoder : public Resumable<uint64_t> {
public:
  PayloadEncoder(uint64_t offset, std::span<const uint8_t> data, size_t chunkSize = 64 * 1024);

  Step<uint64_t> start() override;
  Step<uint64_t> feed(const Completion &completion) override;

private:
  Step<uint64_t> writeNext();

  uint64_t offset_;
  std::span<const uint8_t> data_;
  size_t chunkSize_;
  uint64_t written_ = 0;
  uint64_t pending_ = 0;
};

// Moves `length` bytes from one offset to another through read/write requests.
// Overlapping ranges are handled by copying back to front when moving up.
class CopyOperation : public Resumable<uint64_t> {
public:
  CopyOperation(uint64_t from, uint64_t to, uint64_t length, size_t chunkSize = 64 * 1024);

  Step<uint64_t> start() override;
  Step<uint64_t> feed(const Completion &completion) override;

private:
  Step<uint64_t> readNext();

  uint64_t from_;
  uint64_t to_;
  uint64_t length_;
  size_t chunkSize_;
  bool backward_;

  bool awaitingWrite_ = false;
  uint64_t copied_ = 0;
  uint64_t chunkOffset_ = 0; // Offset of the in-flight chunk relative to the range start
  std::vector<uint8_t> buffer_;
};

} // namespace pakx
