#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "types.hpp"

namespace pakx {

// File signature, first four bytes of every archive
inline constexpr uint8_t archiveMagic[4] = {'P', 'A', 'K', 'X'};

// Archive header (32 bytes, big-endian)
//   0  magic[4]
//   4  version     u16
//   6  headerSize  u16
//   8  slotSize    u16
//   10 reserved    u16
//   12 capacity    u32   index slot count
//   16 entryCount  u32   occupied slots
//   20 indexOffset u32
//   24 dataOffset  u64   first byte after the index table
struct ArchiveHeader {
  uint16_t version = formatVersion;
  uint32_t capacity = 0;
  uint32_t entryCount = 0;
  uint32_t indexOffset = headerSize;
  uint64_t dataOffset = 0;

  static constexpr size_t headerSize = 32;
  static constexpr uint16_t formatVersion = 1;

  // Header of an empty archive whose index holds `capacity` slots
  static ArchiveHeader forCapacity(uint32_t capacity);

  uint64_t indexSize() const;
};

enum class SlotState : uint8_t {
  Empty = 0,
  Occupied = 1,
  Tombstone = 2,
};

// Location and encoding of one payload inside the data area
struct EntryDescriptor {
  uint64_t offset = 0;
  uint64_t storedSize = 0; // Bytes on disk (compressed size when deflated)
  uint64_t size = 0;       // Uncompressed size
  bool compressed = false;
  uint32_t checksum = 0; // CRC-32 of the uncompressed bytes

  uint64_t end() const { return offset + storedSize; }
};

// Index slot (128 bytes, big-endian)
//   0  state       u8
//   1  flags       u8    bit 0: deflate
//   2  nameLength  u16
//   4  nameHash    u32
//   8  offset      u64
//   16 storedSize  u64
//   24 size        u64
//   32 checksum    u32
//   36 reserved    u32
//   40 name[88]    zero padded
struct IndexSlot {
  SlotState state = SlotState::Empty;
  uint32_t hash = 0;
  std::string name;
  EntryDescriptor entry;

  static constexpr size_t slotSize = 128;
  static constexpr size_t nameOffset = 40;
  static constexpr size_t maxNameLength = slotSize - nameOffset;

  static constexpr uint8_t flagDeflate = 0x01;
  static constexpr uint8_t knownFlags = flagDeflate;

  bool occupied() const { return state == SlotState::Occupied; }
};

// Case-insensitive rotate/xor hash used for slot placement
uint32_t nameHash(std::string_view name) noexcept;

// Rejects names that cannot be stored in a slot
bool validateName(std::string_view name, Error *outError = nullptr);

// Pure fixed-size record codecs. `out`/`in` must be at least headerSize/slotSize bytes.

void serializeHeader(const ArchiveHeader &header, std::span<uint8_t> out);

// Checks magic, version and internal consistency (not file bounds)
std::optional<ArchiveHeader> parseHeader(std::span<const uint8_t> in, Error *outError = nullptr);

void serializeSlot(const IndexSlot &slot, std::span<uint8_t> out);

// Checks state, flags, name and hash. `position` is only used in error messages.
std::optional<IndexSlot> parseSlot(std::span<const uint8_t> in, uint32_t position,
                                   Error *outError = nullptr);

} // namespace pakx
