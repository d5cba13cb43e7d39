#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "format.hpp"
#include "types.hpp"

namespace pakx {

class ArchiveIndex;

// Walks occupied slots in table order. Throws ConcurrentModificationError when the
// index was structurally modified after the iterator was created.
class EntryIterator {
public:
  using iterator_category = std::forward_iterator_tag;
  using value_type = IndexSlot;
  using difference_type = std::ptrdiff_t;
  using pointer = const IndexSlot *;
  using reference = const IndexSlot &;

  EntryIterator() = default;
  EntryIterator(const ArchiveIndex *index, uint32_t position);

  reference operator*() const;
  pointer operator->() const { return &**this; }

  EntryIterator &operator++();
  EntryIterator operator++(int) {
    EntryIterator copy = *this;
    ++*this;
    return copy;
  }

  bool operator==(const EntryIterator &other) const { return position_ == other.position_; }

private:
  void check() const;
  void skipFree();

  const ArchiveIndex *index_ = nullptr;
  uint32_t position_ = 0;
  uint64_t generation_ = 0;
};

// Lazy view over occupied slots
class EntryRange {
public:
  EntryRange(EntryIterator first, EntryIterator last) : first_(first), last_(last) {}

  EntryIterator begin() const { return first_; }
  EntryIterator end() const { return last_; }

private:
  EntryIterator first_;
  EntryIterator last_;
};

// Lazy view over entry names
class NameRange {
public:
  class iterator {
  public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = std::string;
    using difference_type = std::ptrdiff_t;
    using pointer = const std::string *;
    using reference = const std::string &;

    iterator() = default;
    explicit iterator(EntryIterator it) : it_(it) {}

    reference operator*() const { return it_->name; }
    pointer operator->() const { return &it_->name; }
    iterator &operator++() {
      ++it_;
      return *this;
    }
    iterator operator++(int) {
      iterator copy = *this;
      ++it_;
      return copy;
    }
    bool operator==(const iterator &other) const { return it_ == other.it_; }

  private:
    EntryIterator it_;
  };

  explicit NameRange(EntryRange entries) : entries_(entries) {}

  iterator begin() const { return iterator(entries_.begin()); }
  iterator end() const { return iterator(entries_.end()); }

private:
  EntryRange entries_;
};

// Slot positions written since the last takeChanges()
struct IndexChanges {
  bool all = false; // Table layout changed; every slot must be rewritten
  std::vector<uint32_t> positions;

  bool empty() const { return !all && positions.empty(); }
};

// In-memory open-addressing directory mirroring the on-disk index table.
// Slot position is nameHash(name) % capacity with linear probing.
class ArchiveIndex {
public:
  explicit ArchiveIndex(uint32_t capacity = 16, double maxLoadFactor = 0.75);

  // Adopts slots decoded from disk. Rejects duplicate names and entries that
  // their own probe sequence cannot reach.
  static std::optional<ArchiveIndex> load(std::vector<IndexSlot> slots,
                                          double maxLoadFactor = 0.75,
                                          Error *outError = nullptr);

  const EntryDescriptor *lookup(std::string_view name) const;
  std::optional<uint32_t> position(std::string_view name) const;
  bool contains(std::string_view name) const { return position(name).has_value(); }

  // Fails with AlreadyExists. Rehashes first when the table is too loaded.
  bool insert(std::string_view name, const EntryDescriptor &entry, Error *outError = nullptr);

  // Replaces the descriptor of an existing entry; false if absent
  bool update(std::string_view name, const EntryDescriptor &entry);

  // Tombstones the slot and returns the old descriptor
  std::optional<EntryDescriptor> remove(std::string_view name);

  // True when one more insertion would exceed the load factor
  bool needsRehash() const;

  // Smallest doubling of the current capacity that keeps one more live entry under the
  // load factor. Equals capacity() when only tombstones need purging.
  uint32_t growthCapacity() const;

  // Rebuilds the table at `capacity`, dropping tombstones. Entries are reinserted in
  // old table order.
  void rehash(uint32_t capacity);

  EntryRange entries() const;
  NameRange names() const { return NameRange(entries()); }

  IndexChanges takeChanges();

  uint32_t capacity() const { return static_cast<uint32_t>(slots_.size()); }
  uint32_t size() const { return live_; }
  uint32_t tombstones() const { return tombstones_; }
  double maxLoadFactor() const { return maxLoadFactor_; }
  const std::vector<IndexSlot> &slots() const { return slots_; }
  uint64_t generation() const { return generation_; }

private:
  struct Probe {
    std::optional<uint32_t> found;    // Position of the matching occupied slot
    std::optional<uint32_t> insertAt; // First tombstone or empty slot on the path
  };

  Probe probe(std::string_view name, uint32_t hash) const;
  void markChanged(uint32_t position);

  std::vector<IndexSlot> slots_;
  double maxLoadFactor_;
  uint32_t live_ = 0;
  uint32_t tombstones_ = 0;
  uint64_t generation_ = 0;
  IndexChanges changes_;
};

} // namespace pakx
