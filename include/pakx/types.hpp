#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace pakx {

enum class ErrorCode {
  Io,                 // Backing store failed a seek/read/write/truncate/sync
  UnexpectedEof,      // Store ended before a read request was satisfied
  BadMagic,           // File does not start with the archive signature
  UnsupportedVersion, // Format version is not understood
  CorruptHeader,      // Header sizes or offsets are inconsistent
  CorruptSlot,        // Index slot is inconsistent with the archive bounds
  IntegrityMismatch,  // Payload failed its length or checksum verification
  NotFound,
  AlreadyExists,
  ReadOnly,          // Mutation requested over a store without write capability
  CompressionFailed, // Codec refused to compress the payload
  InvalidName,       // Entry name is empty, too long or contains NUL
};

// Stable, user-facing name of an error kind
const char *toString(ErrorCode code) noexcept;

struct Error {
  ErrorCode code = ErrorCode::Io;
  std::string message;

  // "<kind>: <message>"
  std::string describe() const;
};

// Fills outError (if provided); always returns false so callers can `return setError(...)`
bool setError(Error *outError, ErrorCode code, std::string message);

// Thrown when the index is structurally modified while an entry range is being iterated
class ConcurrentModificationError : public std::runtime_error {
public:
  explicit ConcurrentModificationError(const std::string &msg) : std::runtime_error(msg) {}
};

// Archive-wide tuning knobs
struct Options {
  uint32_t initialCapacity = 16;   // Index slots written by create()
  double maxLoadFactor = 0.75;     // (live + tombstones) / capacity before a rehash
  int compressionLevel = -1;       // zlib level, -1 selects the codec default
  size_t ioChunkSize = 64 * 1024;  // Largest single read/write issued while streaming payloads
};

// Per-insert behaviour
struct InsertOptions {
  bool compress = false;
  std::optional<int> compressionLevel; // Falls back to Options::compressionLevel
  bool replace = false; // Overwrite an existing entry instead of failing with AlreadyExists
};

// Public view of a stored entry
struct EntryInfo {
  std::string name;
  uint64_t offset = 0;
  uint64_t storedSize = 0;
  uint64_t size = 0; // Uncompressed size
  bool compressed = false;
  uint32_t checksum = 0;
};

// Space usage summary of an open archive
struct ArchiveStats {
  uint32_t capacity = 0;
  uint32_t entryCount = 0;
  uint32_t tombstoneCount = 0;
  uint64_t fileSize = 0;
  uint64_t dataOffset = 0;
  uint64_t storedBytes = 0; // Sum of stored payload sizes
  uint64_t freeBytes = 0;   // Sum of free regions inside the data area
  size_t freeRegionCount = 0;

  // Share of the data area not occupied by live payloads, in [0, 1]
  double fragmentation() const {
    uint64_t dataSize = fileSize > dataOffset ? fileSize - dataOffset : 0;
    return dataSize == 0 ? 0.0 : static_cast<double>(dataSize - storedBytes) / dataSize;
  }
};

} // namespace pakx
