#include <algorithm>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <pakx/allocator.hpp>

namespace pakx {

void SpaceAllocator::reset(uint64_t dataStart, uint64_t dataEnd) {
  free_.clear();
  dataStart_ = dataStart;
  dataEnd_ = std::max(dataStart, dataEnd);
}

bool SpaceAllocator::seed(uint64_t dataStart, uint64_t dataEnd, std::vector<Extent> used,
                          Error *outError) {
  std::sort(used.begin(), used.end(),
            [](const Extent &a, const Extent &b) { return a.offset < b.offset; });

  std::map<uint64_t, uint64_t> regions;
  uint64_t cursor = dataStart;
  for (const auto &extent : used) {
    if (extent.length == 0) {
      continue;
    }
    if (extent.offset < dataStart || extent.end() > dataEnd || extent.end() < extent.offset) {
      return setError(outError, ErrorCode::CorruptSlot,
                      fmt::format("Range [{}, {}) lies outside the data area [{}, {})",
                                  extent.offset, extent.end(), dataStart, dataEnd));
    }
    if (extent.offset < cursor) {
      return setError(outError, ErrorCode::CorruptSlot,
                      fmt::format("Range [{}, {}) overlaps another entry ending at {}",
                                  extent.offset, extent.end(), cursor));
    }
    if (extent.offset > cursor) {
      regions.emplace(cursor, extent.offset - cursor);
    }
    cursor = extent.end();
  }
  if (dataEnd > cursor) {
    regions.emplace(cursor, dataEnd - cursor);
  }

  free_ = std::move(regions);
  dataStart_ = dataStart;
  dataEnd_ = std::max(dataStart, dataEnd);
  spdlog::trace("Seeded allocator over [{}, {}) with {} free regions", dataStart_, dataEnd_,
                free_.size());
  return true;
}

uint64_t SpaceAllocator::allocate(uint64_t length) {
  if (length == 0) {
    return dataEnd_;
  }

  for (auto it = free_.begin(); it != free_.end(); ++it) {
    if (it->second < length) {
      continue;
    }
    uint64_t offset = it->first;
    uint64_t remaining = it->second - length;
    free_.erase(it);
    if (remaining > 0) {
      free_.emplace(offset + length, remaining);
    }
    spdlog::trace("Allocated {} bytes at {} (first fit)", length, offset);
    return offset;
  }

  // Nothing fits: grow the data area, reusing a free tail
  uint64_t offset = dataEnd_;
  if (!free_.empty()) {
    auto last = std::prev(free_.end());
    if (last->first + last->second == dataEnd_) {
      offset = last->first;
      free_.erase(last);
    }
  }
  dataEnd_ = offset + length;
  spdlog::trace("Allocated {} bytes at {} (data area now ends at {})", length, offset, dataEnd_);
  return offset;
}

uint64_t SpaceAllocator::tailOffset() const {
  if (!free_.empty()) {
    auto last = std::prev(free_.end());
    if (last->first + last->second == dataEnd_) {
      return last->first;
    }
  }
  return dataEnd_;
}

uint64_t SpaceAllocator::claimTail(uint64_t length) {
  if (length == 0) {
    return dataEnd_;
  }

  uint64_t offset = tailOffset();
  if (offset < dataEnd_) {
    auto last = std::prev(free_.end());
    uint64_t available = last->second;
    free_.erase(last);
    if (available > length) {
      free_.emplace(offset + length, available - length);
    }
  }
  dataEnd_ = std::max(dataEnd_, offset + length);
  spdlog::trace("Claimed {} bytes at {} (data area now ends at {})", length, offset, dataEnd_);
  return offset;
}

void SpaceAllocator::release(uint64_t offset, uint64_t length) {
  if (length == 0) {
    return;
  }

  uint64_t start = offset;
  uint64_t end = offset + length;

  auto next = free_.lower_bound(offset);
  if (next != free_.begin()) {
    auto prev = std::prev(next);
    if (prev->first + prev->second == start) {
      start = prev->first;
      free_.erase(prev);
    }
  }
  if (next != free_.end() && next->first == end) {
    end = next->first + next->second;
    free_.erase(next);
  }

  free_.emplace(start, end - start);
  dataEnd_ = std::max(dataEnd_, end);
}

void SpaceAllocator::reserveFront(uint64_t newStart) {
  if (newStart <= dataStart_) {
    return;
  }

  while (!free_.empty() && free_.begin()->first < newStart) {
    auto it = free_.begin();
    uint64_t end = it->first + it->second;
    free_.erase(it);
    if (end > newStart) {
      free_.emplace(newStart, end - newStart);
    }
  }

  dataStart_ = newStart;
  dataEnd_ = std::max(dataEnd_, newStart);
}

std::vector<Move> SpaceAllocator::planCompaction(std::vector<Extent> live) const {
  std::sort(live.begin(), live.end(),
            [](const Extent &a, const Extent &b) { return a.offset < b.offset; });

  std::vector<Move> moves;
  uint64_t cursor = dataStart_;
  for (const auto &extent : live) {
    if (extent.length == 0) {
      continue;
    }
    if (extent.offset != cursor) {
      moves.push_back(Move{extent.offset, cursor, extent.length});
    }
    cursor += extent.length;
  }
  return moves;
}

std::vector<FreeRegion> SpaceAllocator::regions() const {
  std::vector<FreeRegion> result;
  result.reserve(free_.size());
  for (const auto &[offset, length] : free_) {
    result.push_back(FreeRegion{offset, length});
  }
  return result;
}

uint64_t SpaceAllocator::freeBytes() const {
  uint64_t total = 0;
  for (const auto &[offset, length] : free_) {
    total += length;
  }
  return total;
}

} // namespace pakx
