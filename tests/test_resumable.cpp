#include <array>
#include <string>
#include <vector>

#include <pakx/codec.hpp>
#include <pakx/resumable.hpp>
#include <pakx/transport.hpp>

#include <gtest/gtest.h>

#include "test_stores.hpp"

using namespace pakx;
using namespace pakx::test;

namespace {

template <typename T> const ReadRequest &readOf(const Step<T> &step) {
  return std::get<ReadRequest>(step.request());
}

template <typename T> const WriteRequest &writeOf(const Step<T> &step) {
  return std::get<WriteRequest>(step.request());
}

Completion completed(std::span<const uint8_t> data, bool endOfInput = false) {
  Completion completion;
  completion.data = data;
  completion.endOfInput = endOfInput;
  return completion;
}

EntryDescriptor rawEntry(uint64_t offset, const std::vector<uint8_t> &data) {
  EntryDescriptor entry;
  entry.offset = offset;
  entry.storedSize = data.size();
  entry.size = data.size();
  entry.checksum = checksum(data);
  return entry;
}

} // namespace

TEST(HeaderDecoderTest, DecodesFromSingleRead) {
  std::array<uint8_t, ArchiveHeader::headerSize> bytes{};
  serializeHeader(ArchiveHeader::forCapacity(4), bytes);

  HeaderDecoder decoder;
  auto step = decoder.start();
  ASSERT_TRUE(step.suspended());
  EXPECT_EQ(readOf(step).mode, ReadRequest::Mode::Absolute);
  EXPECT_EQ(readOf(step).offset, 0u);
  EXPECT_EQ(readOf(step).length, ArchiveHeader::headerSize);

  step = decoder.feed(completed(bytes));
  ASSERT_TRUE(step.isDone());
  EXPECT_EQ(step.value().capacity, 4u);
}

TEST(HeaderDecoderTest, ShortInput) {
  HeaderDecoder decoder;
  decoder.start();

  auto truncated = decoder.feed(completed(bytesOf("PAKX\x00\x01"), true));
  ASSERT_TRUE(truncated.failed());
  EXPECT_EQ(truncated.error().code, ErrorCode::UnexpectedEof);

  HeaderDecoder other;
  other.start();
  auto foreign = other.feed(completed(bytesOf("PK\x03\x04zip"), true));
  ASSERT_TRUE(foreign.failed());
  EXPECT_EQ(foreign.error().code, ErrorCode::BadMagic);
}

TEST(IndexTableDecoderTest, ReadsInBatches) {
  auto header = ArchiveHeader::forCapacity(4);
  header.entryCount = 1;

  std::vector<uint8_t> table(4 * IndexSlot::slotSize, 0);
  IndexSlot slot;
  slot.state = SlotState::Occupied;
  slot.name = "a";
  slot.hash = nameHash("a");
  slot.entry.offset = header.dataOffset;
  serializeSlot(slot, std::span<uint8_t>(table).subspan(IndexSlot::slotSize * 3,
                                                        IndexSlot::slotSize));

  IndexTableDecoder decoder(header, header.dataOffset, 2);
  auto step = decoder.start();
  ASSERT_TRUE(step.suspended());
  EXPECT_EQ(readOf(step).mode, ReadRequest::Mode::Absolute);
  EXPECT_EQ(readOf(step).offset, header.indexOffset);
  EXPECT_EQ(readOf(step).length, 2 * IndexSlot::slotSize);

  auto span = std::span<const uint8_t>(table);
  step = decoder.feed(completed(span.first(2 * IndexSlot::slotSize)));
  ASSERT_TRUE(step.suspended());
  EXPECT_EQ(readOf(step).mode, ReadRequest::Mode::Continue);
  EXPECT_EQ(readOf(step).length, 2 * IndexSlot::slotSize);

  step = decoder.feed(completed(span.subspan(2 * IndexSlot::slotSize)));
  ASSERT_TRUE(step.isDone());
  const auto &slots = step.value();
  ASSERT_EQ(slots.size(), 4u);
  EXPECT_TRUE(slots[3].occupied());
  EXPECT_EQ(slots[3].name, "a");
  EXPECT_FALSE(slots[0].occupied());
}

TEST(IndexTableDecoderTest, Failures) {
  auto header = ArchiveHeader::forCapacity(2);
  std::vector<uint8_t> table(2 * IndexSlot::slotSize, 0);

  {
    IndexTableDecoder decoder(header, header.dataOffset);
    decoder.start();
    auto step = decoder.feed(completed(std::span<const uint8_t>(table).first(200), true));
    ASSERT_TRUE(step.failed());
    EXPECT_EQ(step.error().code, ErrorCode::UnexpectedEof);
  }

  {
    auto claimed = header;
    claimed.entryCount = 1;
    IndexTableDecoder decoder(claimed, claimed.dataOffset);
    decoder.start();
    auto step = decoder.feed(completed(table));
    ASSERT_TRUE(step.failed());
    EXPECT_EQ(step.error().code, ErrorCode::CorruptHeader);
  }

  {
    // Table larger than the store is refused before any read is issued
    auto huge = ArchiveHeader::forCapacity(0xFFFFFFFF);
    IndexTableDecoder decoder(huge, ArchiveHeader::headerSize);
    auto step = decoder.start();
    ASSERT_TRUE(step.failed());
    EXPECT_EQ(step.error().code, ErrorCode::UnexpectedEof);
  }

  {
    // Entry claims bytes past the end of the store
    IndexSlot slot;
    slot.state = SlotState::Occupied;
    slot.name = "big";
    slot.hash = nameHash("big");
    slot.entry.offset = header.dataOffset;
    slot.entry.storedSize = slot.entry.size = 10;
    serializeSlot(slot, std::span<uint8_t>(table).first(IndexSlot::slotSize));

    auto claimed = header;
    claimed.entryCount = 1;
    IndexTableDecoder decoder(claimed, claimed.dataOffset + 4);
    decoder.start();
    auto step = decoder.feed(completed(table));
    ASSERT_TRUE(step.failed());
    EXPECT_EQ(step.error().code, ErrorCode::CorruptSlot);
  }
}

TEST(PayloadDecoderTest, StreamsRawPayloadInChunks) {
  auto data = bytesOf("hello world");
  std::vector<uint8_t> received;
  PayloadDecoder decoder("greeting", rawEntry(100, data),
                         [&](std::span<const uint8_t> chunk) {
                           received.insert(received.end(), chunk.begin(), chunk.end());
                         },
                         4);

  auto step = decoder.start();
  ASSERT_TRUE(step.suspended());
  EXPECT_EQ(readOf(step).mode, ReadRequest::Mode::Absolute);
  EXPECT_EQ(readOf(step).offset, 100u);
  EXPECT_EQ(readOf(step).length, 4u);

  auto span = std::span<const uint8_t>(data);
  step = decoder.feed(completed(span.first(4)));
  ASSERT_TRUE(step.suspended());
  EXPECT_EQ(readOf(step).mode, ReadRequest::Mode::Continue);
  EXPECT_EQ(readOf(step).length, 4u);

  step = decoder.feed(completed(span.subspan(4, 4)));
  ASSERT_TRUE(step.suspended());
  EXPECT_EQ(readOf(step).length, 3u);

  step = decoder.feed(completed(span.subspan(8)));
  ASSERT_TRUE(step.isDone());
  EXPECT_EQ(step.value(), 11u);
  EXPECT_EQ(received, data);
}

TEST(PayloadDecoderTest, EmptyPayloadNeedsNoRead) {
  std::vector<uint8_t> empty;
  PayloadDecoder decoder("empty", rawEntry(2080, empty), nullptr);
  auto step = decoder.start();
  ASSERT_TRUE(step.isDone());
  EXPECT_EQ(step.value(), 0u);
}

TEST(PayloadDecoderTest, DetectsChecksumMismatch) {
  auto data = bytesOf("payload");
  auto entry = rawEntry(0, data);
  data[0] ^= 0x20;

  PayloadDecoder decoder("p", entry, nullptr);
  decoder.start();
  auto step = decoder.feed(completed(data));
  ASSERT_TRUE(step.failed());
  EXPECT_EQ(step.error().code, ErrorCode::IntegrityMismatch);
}

TEST(PayloadDecoderTest, ShortReadIsUnexpectedEof) {
  auto data = bytesOf("payload");
  PayloadDecoder decoder("p", rawEntry(0, data), nullptr);
  decoder.start();
  auto step = decoder.feed(completed(std::span<const uint8_t>(data).first(3), true));
  ASSERT_TRUE(step.failed());
  EXPECT_EQ(step.error().code, ErrorCode::UnexpectedEof);
}

TEST(PayloadDecoderTest, InflatesAcrossChunks) {
  std::string text;
  for (int i = 0; i < 200; ++i) {
    text += "compressible line " + std::to_string(i % 7) + "\n";
  }
  auto data = bytesOf(text);
  auto packed = compressPayload(data, 9);
  ASSERT_TRUE(packed.has_value());
  ASSERT_LT(packed->size(), data.size());

  EntryDescriptor entry = rawEntry(0, data);
  entry.compressed = true;
  entry.storedSize = packed->size();

  std::vector<uint8_t> received;
  PayloadDecoder decoder("text", entry,
                         [&](std::span<const uint8_t> chunk) {
                           received.insert(received.end(), chunk.begin(), chunk.end());
                         },
                         16);

  auto step = decoder.start();
  size_t consumed = 0;
  while (step.suspended()) {
    auto length = static_cast<size_t>(readOf(step).length);
    step = decoder.feed(completed(std::span<const uint8_t>(*packed).subspan(consumed, length)));
    consumed += length;
  }
  ASSERT_TRUE(step.isDone()) << step.error().describe();
  EXPECT_EQ(consumed, packed->size());
  EXPECT_EQ(received, data);
}

TEST(IndexTableEncoderTest, WritesHeaderSlotsThenTruncates) {
  auto header = ArchiveHeader::forCapacity(2);
  std::vector<IndexSlot> slots(2);

  IndexTableEncoder encoder(header, slots, uint64_t{300}, 1);
  auto step = encoder.start();
  ASSERT_TRUE(step.suspended());
  EXPECT_EQ(writeOf(step).offset, 0u);
  EXPECT_EQ(writeOf(step).data.size(), ArchiveHeader::headerSize);

  step = encoder.feed(Completion{});
  ASSERT_TRUE(step.suspended());
  EXPECT_EQ(writeOf(step).offset, 32u);
  EXPECT_EQ(writeOf(step).data.size(), IndexSlot::slotSize);

  step = encoder.feed(Completion{});
  ASSERT_TRUE(step.suspended());
  EXPECT_EQ(writeOf(step).offset, 160u);

  step = encoder.feed(Completion{});
  ASSERT_TRUE(step.suspended());
  ASSERT_TRUE(std::holds_alternative<TruncateRequest>(step.request()));
  EXPECT_EQ(std::get<TruncateRequest>(step.request()).length, 300u);

  step = encoder.feed(Completion{});
  ASSERT_TRUE(step.isDone());
  EXPECT_EQ(step.value(), 32u + 2 * 128u);
}

TEST(IndexTableEncoderTest, RejectsSlotCountMismatch) {
  std::vector<IndexSlot> slots(3);
  IndexTableEncoder encoder(ArchiveHeader::forCapacity(4), slots);
  auto step = encoder.start();
  ASSERT_TRUE(step.failed());
  EXPECT_EQ(step.error().code, ErrorCode::CorruptHeader);
}

TEST(IndexPatchEncoderTest, WritesOnlyListedSlots) {
  auto header = ArchiveHeader::forCapacity(4);
  std::vector<IndexSlot> slots(4);

  IndexPatchEncoder encoder(header, slots, {1, 3});
  auto step = encoder.start();
  ASSERT_TRUE(step.suspended());
  EXPECT_EQ(writeOf(step).offset, 0u);

  step = encoder.feed(Completion{});
  ASSERT_TRUE(step.suspended());
  EXPECT_EQ(writeOf(step).offset, 32u + 128u);

  step = encoder.feed(Completion{});
  ASSERT_TRUE(step.suspended());
  EXPECT_EQ(writeOf(step).offset, 32u + 3 * 128u);

  step = encoder.feed(Completion{});
  ASSERT_TRUE(step.isDone());

  IndexPatchEncoder outside(header, slots, {4});
  auto failed = outside.start();
  ASSERT_TRUE(failed.failed());
  EXPECT_EQ(failed.error().code, ErrorCode::CorruptSlot);
}

TEST(PayloadEncoderTest, SplitsIntoChunks) {
  auto data = bytesOf("0123456789");
  PayloadEncoder encoder(500, data, 4);

  std::vector<std::pair<uint64_t, size_t>> writes;
  auto step = encoder.start();
  while (step.suspended()) {
    writes.emplace_back(writeOf(step).offset, writeOf(step).data.size());
    step = encoder.feed(Completion{});
  }
  ASSERT_TRUE(step.isDone());
  EXPECT_EQ(step.value(), 10u);

  std::vector<std::pair<uint64_t, size_t>> expected{{500, 4}, {504, 4}, {508, 2}};
  EXPECT_EQ(writes, expected);
}

TEST(CopyOperationTest, OverlappingMoveUp) {
  MemoryStore store(bytesOf("abcdefgh"));
  MutableTransport transport(store);

  CopyOperation copy(0, 2, 6, 4);
  Error error;
  auto copied = transport.run(copy, &error);
  ASSERT_TRUE(copied.has_value()) << error.describe();
  EXPECT_EQ(*copied, 6u);
  EXPECT_EQ(store.bytes(), bytesOf("ababcdef"));
}

TEST(CopyOperationTest, OverlappingMoveDown) {
  MemoryStore store(bytesOf("abcdefgh"));
  MutableTransport transport(store);

  CopyOperation copy(2, 0, 6, 4);
  ASSERT_TRUE(transport.run(copy).has_value());
  EXPECT_EQ(store.bytes(), bytesOf("cdefghgh"));
}

TEST(CopyOperationTest, SourcePastEndFails) {
  MemoryStore store(bytesOf("abcd"));
  MutableTransport transport(store);

  CopyOperation copy(2, 10, 6);
  Error error;
  EXPECT_FALSE(transport.run(copy, &error).has_value());
  EXPECT_EQ(error.code, ErrorCode::UnexpectedEof);
}
