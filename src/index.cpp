#include <algorithm>
#include <unordered_set>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <pakx/index.hpp>

namespace pakx {

// ---------------------------------------------------------------------------
// EntryIterator

EntryIterator::EntryIterator(const ArchiveIndex *index, uint32_t position)
    : index_(index), position_(position), generation_(index->generation()) {
  skipFree();
}

void EntryIterator::check() const {
  if (index_ && index_->generation() != generation_) {
    throw ConcurrentModificationError("Archive index was modified during iteration");
  }
}

void EntryIterator::skipFree() {
  const auto &slots = index_->slots();
  while (position_ < slots.size() && !slots[position_].occupied()) {
    ++position_;
  }
}

EntryIterator::reference EntryIterator::operator*() const {
  check();
  return index_->slots()[position_];
}

EntryIterator &EntryIterator::operator++() {
  check();
  ++position_;
  skipFree();
  return *this;
}

// ---------------------------------------------------------------------------
// ArchiveIndex

ArchiveIndex::ArchiveIndex(uint32_t capacity, double maxLoadFactor)
    : slots_(std::max<uint32_t>(capacity, 1)),
      maxLoadFactor_(std::clamp(maxLoadFactor, 0.05, 1.0)) {}

std::optional<ArchiveIndex> ArchiveIndex::load(std::vector<IndexSlot> slots, double maxLoadFactor,
                                               Error *outError) {
  if (slots.empty()) {
    setError(outError, ErrorCode::CorruptHeader, "Index table has no slots");
    return std::nullopt;
  }

  ArchiveIndex index(static_cast<uint32_t>(slots.size()), maxLoadFactor);
  index.slots_ = std::move(slots);

  std::unordered_set<std::string_view> seen;
  for (uint32_t i = 0; i < index.capacity(); ++i) {
    const auto &slot = index.slots_[i];
    if (slot.state == SlotState::Tombstone) {
      ++index.tombstones_;
      continue;
    }
    if (!slot.occupied()) {
      continue;
    }

    if (!seen.insert(slot.name).second) {
      setError(outError, ErrorCode::CorruptSlot,
               fmt::format("Duplicate entry name in index: {} (slot {})", slot.name, i));
      return std::nullopt;
    }

    auto found = index.probe(slot.name, slot.hash).found;
    if (!found || *found != i) {
      setError(outError, ErrorCode::CorruptSlot,
               fmt::format("Entry '{}' in slot {} is not reachable from its hash position {}",
                           slot.name, i, slot.hash % index.capacity()));
      return std::nullopt;
    }
    ++index.live_;
  }

  return index;
}

ArchiveIndex::Probe ArchiveIndex::probe(std::string_view name, uint32_t hash) const {
  Probe result;
  uint32_t cap = capacity();
  uint32_t pos = hash % cap;

  for (uint32_t step = 0; step < cap; ++step) {
    const auto &slot = slots_[pos];
    if (slot.state == SlotState::Empty) {
      if (!result.insertAt) {
        result.insertAt = pos;
      }
      return result;
    }
    if (slot.state == SlotState::Tombstone) {
      if (!result.insertAt) {
        result.insertAt = pos;
      }
    } else if (slot.hash == hash && slot.name == name) {
      result.found = pos;
      return result;
    }
    pos = (pos + 1) % cap;
  }

  return result;
}

void ArchiveIndex::markChanged(uint32_t position) {
  if (!changes_.all) {
    changes_.positions.push_back(position);
  }
}

const EntryDescriptor *ArchiveIndex::lookup(std::string_view name) const {
  auto found = probe(name, nameHash(name)).found;
  return found ? &slots_[*found].entry : nullptr;
}

std::optional<uint32_t> ArchiveIndex::position(std::string_view name) const {
  return probe(name, nameHash(name)).found;
}

bool ArchiveIndex::insert(std::string_view name, const EntryDescriptor &entry, Error *outError) {
  uint32_t hash = nameHash(name);
  if (probe(name, hash).found) {
    return setError(outError, ErrorCode::AlreadyExists,
                    fmt::format("Entry already exists: {}", name));
  }

  if (needsRehash()) {
    rehash(growthCapacity());
  }

  auto target = probe(name, hash).insertAt;
  if (!target) {
    // Only reachable with a load factor of 1 and a table full of live entries
    rehash(capacity() * 2);
    target = probe(name, hash).insertAt;
  }

  auto &slot = slots_[*target];
  if (slot.state == SlotState::Tombstone) {
    --tombstones_;
  }
  slot.state = SlotState::Occupied;
  slot.hash = hash;
  slot.name = std::string(name);
  slot.entry = entry;

  ++live_;
  ++generation_;
  markChanged(*target);
  return true;
}

bool ArchiveIndex::update(std::string_view name, const EntryDescriptor &entry) {
  auto found = position(name);
  if (!found) {
    return false;
  }
  slots_[*found].entry = entry;
  markChanged(*found);
  return true;
}

std::optional<EntryDescriptor> ArchiveIndex::remove(std::string_view name) {
  auto found = position(name);
  if (!found) {
    return std::nullopt;
  }

  auto &slot = slots_[*found];
  EntryDescriptor old = slot.entry;
  slot = IndexSlot{};
  slot.state = SlotState::Tombstone;

  --live_;
  ++tombstones_;
  ++generation_;
  markChanged(*found);
  return old;
}

bool ArchiveIndex::needsRehash() const {
  return static_cast<double>(live_ + tombstones_ + 1) > maxLoadFactor_ * capacity();
}

uint32_t ArchiveIndex::growthCapacity() const {
  uint32_t cap = capacity();
  while (static_cast<double>(live_ + 1) > maxLoadFactor_ * cap) {
    cap *= 2;
  }
  return cap;
}

void ArchiveIndex::rehash(uint32_t newCapacity) {
  newCapacity = std::max(newCapacity, live_ + 1);
  spdlog::debug("Rehashing index: {} -> {} slots ({} live, {} tombstones dropped)", capacity(),
                newCapacity, live_, tombstones_);

  std::vector<IndexSlot> old = std::move(slots_);
  slots_.assign(newCapacity, IndexSlot{});
  tombstones_ = 0;

  for (auto &slot : old) {
    if (!slot.occupied()) {
      continue;
    }
    uint32_t pos = slot.hash % newCapacity;
    while (slots_[pos].state != SlotState::Empty) {
      pos = (pos + 1) % newCapacity;
    }
    slots_[pos] = std::move(slot);
  }

  ++generation_;
  changes_.all = true;
  changes_.positions.clear();
}

EntryRange ArchiveIndex::entries() const {
  return EntryRange(EntryIterator(this, 0), EntryIterator(this, capacity()));
}

IndexChanges ArchiveIndex::takeChanges() {
  IndexChanges changes = std::move(changes_);
  changes_ = IndexChanges{};
  std::sort(changes.positions.begin(), changes.positions.end());
  changes.positions.erase(std::unique(changes.positions.begin(), changes.positions.end()),
                          changes.positions.end());
  return changes;
}

} // namespace pakx
