#include <array>
#include <cstring>
#include <string>

#include <pakx/endian.hpp>
#include <pakx/format.hpp>

#include <gtest/gtest.h>

using namespace pakx;

namespace {

IndexSlot makeSlot(const std::string &name, uint64_t offset, uint64_t size) {
  IndexSlot slot;
  slot.state = SlotState::Occupied;
  slot.name = name;
  slot.hash = nameHash(name);
  slot.entry.offset = offset;
  slot.entry.storedSize = size;
  slot.entry.size = size;
  slot.entry.checksum = 0xDEADBEEF;
  return slot;
}

std::array<uint8_t, IndexSlot::slotSize> encode(const IndexSlot &slot) {
  std::array<uint8_t, IndexSlot::slotSize> out{};
  serializeSlot(slot, out);
  return out;
}

} // namespace

TEST(FormatTest, NameHashIsCaseInsensitive) {
  EXPECT_EQ(nameHash("a"), 0x61u);
  EXPECT_EQ(nameHash("ab"), 0x08000061u);
  EXPECT_EQ(nameHash("Data/File.TXT"), nameHash("data/file.txt"));
  EXPECT_NE(nameHash("a.txt"), nameHash("b.txt"));
  EXPECT_EQ(nameHash(""), 0u);
}

TEST(FormatTest, ValidateName) {
  Error error;
  EXPECT_TRUE(validateName("a.txt", &error));
  EXPECT_TRUE(validateName(std::string(IndexSlot::maxNameLength, 'x'), &error));

  EXPECT_FALSE(validateName("", &error));
  EXPECT_EQ(error.code, ErrorCode::InvalidName);

  EXPECT_FALSE(validateName(std::string(IndexSlot::maxNameLength + 1, 'x'), &error));
  EXPECT_EQ(error.code, ErrorCode::InvalidName);

  EXPECT_FALSE(validateName(std::string("a\0b", 3), &error));
  EXPECT_EQ(error.code, ErrorCode::InvalidName);
}

TEST(FormatTest, HeaderLayout) {
  auto header = ArchiveHeader::forCapacity(16);
  header.entryCount = 3;
  EXPECT_EQ(header.indexOffset, 32u);
  EXPECT_EQ(header.dataOffset, 32u + 16u * 128u);

  std::array<uint8_t, ArchiveHeader::headerSize> bytes{};
  serializeHeader(header, bytes);

  EXPECT_EQ(std::memcmp(bytes.data(), "PAKX", 4), 0);
  EXPECT_EQ(loadBE16(bytes.data() + 4), 1);
  EXPECT_EQ(loadBE16(bytes.data() + 6), 32);
  EXPECT_EQ(loadBE16(bytes.data() + 8), 128);
  EXPECT_EQ(loadBE32(bytes.data() + 12), 16u);
  EXPECT_EQ(loadBE32(bytes.data() + 16), 3u);
  EXPECT_EQ(bytes[30], 0x08);
  EXPECT_EQ(bytes[31], 0x20);

  Error error;
  auto parsed = parseHeader(bytes, &error);
  ASSERT_TRUE(parsed.has_value()) << error.describe();
  EXPECT_EQ(parsed->capacity, 16u);
  EXPECT_EQ(parsed->entryCount, 3u);
  EXPECT_EQ(parsed->dataOffset, header.dataOffset);
}

TEST(FormatTest, HeaderRejectsCorruption) {
  std::array<uint8_t, ArchiveHeader::headerSize> good{};
  serializeHeader(ArchiveHeader::forCapacity(8), good);
  Error error;

  auto bytes = good;
  bytes[0] = 'X';
  EXPECT_FALSE(parseHeader(bytes, &error));
  EXPECT_EQ(error.code, ErrorCode::BadMagic);

  bytes = good;
  storeBE16(bytes.data() + 4, 2);
  EXPECT_FALSE(parseHeader(bytes, &error));
  EXPECT_EQ(error.code, ErrorCode::UnsupportedVersion);

  bytes = good;
  storeBE16(bytes.data() + 8, 64);
  EXPECT_FALSE(parseHeader(bytes, &error));
  EXPECT_EQ(error.code, ErrorCode::CorruptHeader);

  bytes = good;
  storeBE32(bytes.data() + 16, 9);
  EXPECT_FALSE(parseHeader(bytes, &error));
  EXPECT_EQ(error.code, ErrorCode::CorruptHeader);

  bytes = good;
  storeBE64(bytes.data() + 24, 4096);
  EXPECT_FALSE(parseHeader(bytes, &error));
  EXPECT_EQ(error.code, ErrorCode::CorruptHeader);

  bytes = good;
  storeBE32(bytes.data() + 12, 0);
  EXPECT_FALSE(parseHeader(bytes, &error));
  EXPECT_EQ(error.code, ErrorCode::CorruptHeader);

  EXPECT_FALSE(parseHeader(std::span<const uint8_t>(good.data(), 20), &error));
  EXPECT_EQ(error.code, ErrorCode::UnexpectedEof);
}

TEST(FormatTest, SlotLayout) {
  auto slot = makeSlot("dir/a.txt", 4096, 10);
  slot.entry.compressed = true;
  slot.entry.storedSize = 7;
  auto bytes = encode(slot);

  EXPECT_EQ(bytes[0], 1);
  EXPECT_EQ(bytes[1], IndexSlot::flagDeflate);
  EXPECT_EQ(loadBE16(bytes.data() + 2), 9);
  EXPECT_EQ(loadBE32(bytes.data() + 4), nameHash("dir/a.txt"));
  EXPECT_EQ(loadBE64(bytes.data() + 8), 4096u);
  EXPECT_EQ(loadBE64(bytes.data() + 16), 7u);
  EXPECT_EQ(loadBE64(bytes.data() + 24), 10u);
  EXPECT_EQ(loadBE32(bytes.data() + 32), 0xDEADBEEFu);
  EXPECT_EQ(std::memcmp(bytes.data() + 40, "dir/a.txt", 9), 0);
  EXPECT_EQ(bytes[49], 0);

  Error error;
  auto parsed = parseSlot(bytes, 0, &error);
  ASSERT_TRUE(parsed.has_value()) << error.describe();
  EXPECT_TRUE(parsed->occupied());
  EXPECT_EQ(parsed->name, "dir/a.txt");
  EXPECT_TRUE(parsed->entry.compressed);
  EXPECT_EQ(parsed->entry.storedSize, 7u);
  EXPECT_EQ(parsed->entry.size, 10u);
}

TEST(FormatTest, EmptyAndTombstoneSlotsCarryNoData) {
  IndexSlot tombstone;
  tombstone.state = SlotState::Tombstone;
  tombstone.name = "ignored";
  auto bytes = encode(tombstone);
  EXPECT_EQ(bytes[0], 2);
  for (size_t i = 1; i < bytes.size(); ++i) {
    ASSERT_EQ(bytes[i], 0) << "byte " << i;
  }

  auto parsed = parseSlot(bytes, 3);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->state, SlotState::Tombstone);
  EXPECT_TRUE(parsed->name.empty());
}

TEST(FormatTest, SlotRejectsCorruption) {
  const auto good = encode(makeSlot("a.txt", 2080, 3));
  Error error;

  auto bytes = good;
  bytes[0] = 7;
  EXPECT_FALSE(parseSlot(bytes, 1, &error));
  EXPECT_EQ(error.code, ErrorCode::CorruptSlot);

  bytes = good;
  bytes[1] = 0x80;
  EXPECT_FALSE(parseSlot(bytes, 1, &error));
  EXPECT_EQ(error.code, ErrorCode::CorruptSlot);

  bytes = good;
  storeBE16(bytes.data() + 2, 0);
  EXPECT_FALSE(parseSlot(bytes, 1, &error));
  EXPECT_EQ(error.code, ErrorCode::CorruptSlot);

  bytes = good;
  storeBE16(bytes.data() + 2, IndexSlot::maxNameLength + 1);
  EXPECT_FALSE(parseSlot(bytes, 1, &error));
  EXPECT_EQ(error.code, ErrorCode::CorruptSlot);

  bytes = good;
  bytes[4] ^= 0x01; // hash no longer matches the name
  EXPECT_FALSE(parseSlot(bytes, 1, &error));
  EXPECT_EQ(error.code, ErrorCode::CorruptSlot);

  bytes = good;
  storeBE64(bytes.data() + 24, 4); // raw entry whose sizes differ
  EXPECT_FALSE(parseSlot(bytes, 1, &error));
  EXPECT_EQ(error.code, ErrorCode::CorruptSlot);
}

TEST(FormatTest, ErrorKindNames) {
  EXPECT_STREQ(toString(ErrorCode::Io), "IoError");
  EXPECT_STREQ(toString(ErrorCode::BadMagic), "BadMagic");
  EXPECT_STREQ(toString(ErrorCode::IntegrityMismatch), "IntegrityMismatch");

  Error error{ErrorCode::NotFound, "Entry not found: x"};
  EXPECT_EQ(error.describe(), "NotFound: Entry not found: x");
}
