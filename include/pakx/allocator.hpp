#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <map>
#include <vector>

#include "types.hpp"

namespace pakx {

// Byte range [offset, offset + length)
struct Extent {
  uint64_t offset = 0;
  uint64_t length = 0;

  uint64_t end() const { return offset + length; }

  bool operator==(const Extent &) const = default;
};

using FreeRegion = Extent;

// One step of a compaction plan
struct Move {
  uint64_t from = 0;
  uint64_t to = 0;
  uint64_t length = 0;
};

// Tracks free ranges of the data area [dataStart, dataEnd). Regions are kept ordered
// by offset, never overlap and are never adjacent to each other.
class SpaceAllocator {
public:
  SpaceAllocator() = default;
  SpaceAllocator(uint64_t dataStart, uint64_t dataEnd) { reset(dataStart, dataEnd); }

  // Rebuilds the free list from the ranges in use: every gap between them (and up to
  // dataEnd) becomes a free region. Fails with CorruptSlot on overlap or out-of-bounds.
  bool seed(uint64_t dataStart, uint64_t dataEnd, std::vector<Extent> used,
            Error *outError = nullptr);

  // First fit by lowest offset; extends the data area when nothing fits.
  // A zero-length request returns dataEnd() and reserves nothing.
  uint64_t allocate(uint64_t length);

  // Where a payload of not yet known length can be appended: the start of the free
  // region touching dataEnd(), or dataEnd() itself
  uint64_t tailOffset() const;

  // Reserves `length` bytes at tailOffset() and returns that offset. A zero-length
  // claim returns dataEnd() like allocate(0).
  uint64_t claimTail(uint64_t length);

  // Returns a range to the free list, merging with its neighbours
  void release(uint64_t offset, uint64_t length);

  // Moves the data start up to `newStart`, dropping free space below it
  void reserveFront(uint64_t newStart);

  // Moves that pack `live` from dataStart() in ascending offset order. Every move goes
  // to a lower offset, so applying them in order never overwrites unmoved data.
  std::vector<Move> planCompaction(std::vector<Extent> live) const;

  // Forgets every free region
  void reset(uint64_t dataStart, uint64_t dataEnd);

  std::vector<FreeRegion> regions() const;
  size_t regionCount() const { return free_.size(); }
  uint64_t freeBytes() const;

  uint64_t dataStart() const { return dataStart_; }
  uint64_t dataEnd() const { return dataEnd_; }

private:
  std::map<uint64_t, uint64_t> free_; // offset -> length
  uint64_t dataStart_ = 0;
  uint64_t dataEnd_ = 0;
};

} // namespace pakx
