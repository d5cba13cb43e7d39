#include <algorithm>
#include <cctype>
#include <cstring>

#include <fmt/format.h>

#include <pakx/endian.hpp>
#include <pakx/format.hpp>

namespace pakx {

ArchiveHeader ArchiveHeader::forCapacity(uint32_t capacity) {
  ArchiveHeader header;
  header.capacity = capacity;
  header.entryCount = 0;
  header.indexOffset = headerSize;
  header.dataOffset = header.indexOffset + header.indexSize();
  return header;
}

uint64_t ArchiveHeader::indexSize() const {
  return static_cast<uint64_t>(capacity) * IndexSlot::slotSize;
}

uint32_t nameHash(std::string_view name) noexcept {
  uint32_t hash = 0;
  for (char c : name) {
    auto lower = static_cast<uint32_t>(std::tolower(static_cast<unsigned char>(c)));
    hash = (hash << 27) | (hash >> 5);
    hash ^= lower;
  }
  return hash;
}

bool validateName(std::string_view name, Error *outError) {
  if (name.empty()) {
    return setError(outError, ErrorCode::InvalidName, "Entry name is empty");
  }
  if (name.size() > IndexSlot::maxNameLength) {
    return setError(outError, ErrorCode::InvalidName,
                    fmt::format("Entry name is {} bytes long (limit {}): {}", name.size(),
                                IndexSlot::maxNameLength, name));
  }
  if (name.find('\0') != std::string_view::npos) {
    return setError(outError, ErrorCode::InvalidName, "Entry name contains a NUL byte");
  }
  return true;
}

void serializeHeader(const ArchiveHeader &header, std::span<uint8_t> out) {
  uint8_t *p = out.data();
  std::memcpy(p, archiveMagic, 4);
  storeBE16(p + 4, header.version);
  storeBE16(p + 6, static_cast<uint16_t>(ArchiveHeader::headerSize));
  storeBE16(p + 8, static_cast<uint16_t>(IndexSlot::slotSize));
  storeBE16(p + 10, 0);
  storeBE32(p + 12, header.capacity);
  storeBE32(p + 16, header.entryCount);
  storeBE32(p + 20, header.indexOffset);
  storeBE64(p + 24, header.dataOffset);
}

std::optional<ArchiveHeader> parseHeader(std::span<const uint8_t> in, Error *outError) {
  if (in.size() < ArchiveHeader::headerSize) {
    setError(outError, ErrorCode::UnexpectedEof,
             fmt::format("File too small to hold an archive header (size: {})", in.size()));
    return std::nullopt;
  }

  const uint8_t *p = in.data();
  if (std::memcmp(p, archiveMagic, 4) != 0) {
    setError(outError, ErrorCode::BadMagic,
             fmt::format("Invalid archive magic (expected 'PAKX', got {:02x} {:02x} {:02x} {:02x})",
                         p[0], p[1], p[2], p[3]));
    return std::nullopt;
  }

  ArchiveHeader header;
  header.version = loadBE16(p + 4);
  if (header.version != ArchiveHeader::formatVersion) {
    setError(outError, ErrorCode::UnsupportedVersion,
             fmt::format("Unsupported archive version {} (expected {})", header.version,
                         ArchiveHeader::formatVersion));
    return std::nullopt;
  }

  uint16_t headerSize = loadBE16(p + 6);
  uint16_t slotSize = loadBE16(p + 8);
  if (headerSize != ArchiveHeader::headerSize || slotSize != IndexSlot::slotSize) {
    setError(outError, ErrorCode::CorruptHeader,
             fmt::format("Archive uses header size {} and slot size {} (expected {} and {})",
                         headerSize, slotSize, ArchiveHeader::headerSize, IndexSlot::slotSize));
    return std::nullopt;
  }

  header.capacity = loadBE32(p + 12);
  header.entryCount = loadBE32(p + 16);
  header.indexOffset = loadBE32(p + 20);
  header.dataOffset = loadBE64(p + 24);

  if (header.capacity == 0) {
    setError(outError, ErrorCode::CorruptHeader, "Archive index capacity is zero");
    return std::nullopt;
  }
  if (header.entryCount > header.capacity) {
    setError(outError, ErrorCode::CorruptHeader,
             fmt::format("Archive claims {} entries but has only {} index slots",
                         header.entryCount, header.capacity));
    return std::nullopt;
  }
  if (header.indexOffset != ArchiveHeader::headerSize ||
      header.dataOffset != header.indexOffset + header.indexSize()) {
    setError(outError, ErrorCode::CorruptHeader,
             fmt::format("Inconsistent archive layout (index at {}, data at {}, capacity {})",
                         header.indexOffset, header.dataOffset, header.capacity));
    return std::nullopt;
  }

  return header;
}

void serializeSlot(const IndexSlot &slot, std::span<uint8_t> out) {
  uint8_t *p = out.data();
  std::memset(p, 0, IndexSlot::slotSize);
  p[0] = static_cast<uint8_t>(slot.state);
  if (!slot.occupied()) {
    return;
  }

  p[1] = slot.entry.compressed ? IndexSlot::flagDeflate : 0;
  storeBE16(p + 2, static_cast<uint16_t>(slot.name.size()));
  storeBE32(p + 4, slot.hash);
  storeBE64(p + 8, slot.entry.offset);
  storeBE64(p + 16, slot.entry.storedSize);
  storeBE64(p + 24, slot.entry.size);
  storeBE32(p + 32, slot.entry.checksum);
  std::memcpy(p + IndexSlot::nameOffset, slot.name.data(),
              std::min(slot.name.size(), IndexSlot::maxNameLength));
}

std::optional<IndexSlot> parseSlot(std::span<const uint8_t> in, uint32_t position,
                                   Error *outError) {
  if (in.size() < IndexSlot::slotSize) {
    setError(outError, ErrorCode::UnexpectedEof,
             fmt::format("Index slot {} is truncated ({} bytes)", position, in.size()));
    return std::nullopt;
  }

  const uint8_t *p = in.data();
  IndexSlot slot;

  switch (p[0]) {
  case static_cast<uint8_t>(SlotState::Empty):
    slot.state = SlotState::Empty;
    return slot;
  case static_cast<uint8_t>(SlotState::Tombstone):
    slot.state = SlotState::Tombstone;
    return slot;
  case static_cast<uint8_t>(SlotState::Occupied):
    slot.state = SlotState::Occupied;
    break;
  default:
    setError(outError, ErrorCode::CorruptSlot,
             fmt::format("Index slot {} has unknown state {:#04x}", position, p[0]));
    return std::nullopt;
  }

  uint8_t flags = p[1];
  if ((flags & ~IndexSlot::knownFlags) != 0) {
    setError(outError, ErrorCode::CorruptSlot,
             fmt::format("Index slot {} has unrecognised flags {:#04x}", position, flags));
    return std::nullopt;
  }

  uint16_t nameLength = loadBE16(p + 2);
  if (nameLength == 0 || nameLength > IndexSlot::maxNameLength) {
    setError(outError, ErrorCode::CorruptSlot,
             fmt::format("Index slot {} has invalid name length {}", position, nameLength));
    return std::nullopt;
  }

  slot.name.assign(reinterpret_cast<const char *>(p + IndexSlot::nameOffset), nameLength);
  if (slot.name.find('\0') != std::string::npos) {
    setError(outError, ErrorCode::CorruptSlot,
             fmt::format("Index slot {} has a name with an embedded NUL", position));
    return std::nullopt;
  }

  slot.hash = loadBE32(p + 4);
  if (slot.hash != nameHash(slot.name)) {
    setError(outError, ErrorCode::CorruptSlot,
             fmt::format("Index slot {} hash {:#010x} does not match name '{}'", position,
                         slot.hash, slot.name));
    return std::nullopt;
  }

  slot.entry.compressed = (flags & IndexSlot::flagDeflate) != 0;
  slot.entry.offset = loadBE64(p + 8);
  slot.entry.storedSize = loadBE64(p + 16);
  slot.entry.size = loadBE64(p + 24);
  slot.entry.checksum = loadBE32(p + 32);

  if (!slot.entry.compressed && slot.entry.storedSize != slot.entry.size) {
    setError(outError, ErrorCode::CorruptSlot,
             fmt::format("Entry '{}' is stored raw but its sizes differ ({} vs {})", slot.name,
                         slot.entry.storedSize, slot.entry.size));
    return std::nullopt;
  }

  return slot;
}

} // namespace pakx
