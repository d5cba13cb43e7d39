#include <algorithm>
#include <cstddef>
#include <cstring>

#include <fmt/format.h>

#include <pakx/resumable.hpp>

namespace pakx {

// ---------------------------------------------------------------------------
// HeaderDecoder

Step<ArchiveHeader> HeaderDecoder::start() {
  started_ = true;
  return Step<ArchiveHeader>::suspend(ReadRequest{ReadRequest::Mode::Absolute, 0,
                                                  ArchiveHeader::headerSize});
}

Step<ArchiveHeader> HeaderDecoder::feed(const Completion &completion) {
  if (!started_) {
    return Step<ArchiveHeader>::fail(ErrorCode::Io, "Header decoder fed before start");
  }

  const auto &data = completion.data;
  if (data.size() < ArchiveHeader::headerSize) {
    // A short file with a foreign signature is not an archive at all
    if (data.size() >= sizeof(archiveMagic) &&
        std::memcmp(data.data(), archiveMagic, sizeof(archiveMagic)) != 0) {
      return Step<ArchiveHeader>::fail(ErrorCode::BadMagic, "Invalid archive magic");
    }
    return Step<ArchiveHeader>::fail(
        ErrorCode::UnexpectedEof,
        fmt::format("File too small to hold an archive header (size: {})", data.size()));
  }

  Error error;
  auto header = parseHeader(data, &error);
  if (!header) {
    return Step<ArchiveHeader>::fail(std::move(error));
  }
  return Step<ArchiveHeader>::done(*header);
}

// ---------------------------------------------------------------------------
// IndexTableDecoder

IndexTableDecoder::IndexTableDecoder(const ArchiveHeader &header, uint64_t storeLength,
                                     uint32_t slotsPerRead)
    : header_(header), storeLength_(storeLength), slotsPerRead_(std::max<uint32_t>(slotsPerRead, 1)) {}

Step<std::vector<IndexSlot>> IndexTableDecoder::start() {
  next_ = 0;
  occupied_ = 0;
  slots_.clear();

  // The capacity comes from disk; it is only trusted once the store can hold the table
  if (header_.dataOffset > storeLength_) {
    return Step<std::vector<IndexSlot>>::fail(
        ErrorCode::UnexpectedEof,
        fmt::format("Index table of {} slots ends at {} but the store holds only {} bytes",
                    header_.capacity, header_.dataOffset, storeLength_));
  }
  slots_.reserve(header_.capacity);
  return requestBatch();
}

Step<std::vector<IndexSlot>> IndexTableDecoder::requestBatch() {
  pending_ = std::min(slotsPerRead_, header_.capacity - next_);

  ReadRequest request;
  request.length = static_cast<uint64_t>(pending_) * IndexSlot::slotSize;
  if (next_ == 0) {
    request.mode = ReadRequest::Mode::Absolute;
    request.offset = header_.indexOffset;
  } else {
    request.mode = ReadRequest::Mode::Continue;
  }
  return Step<std::vector<IndexSlot>>::suspend(request);
}

bool IndexTableDecoder::checkBounds(const IndexSlot &slot, uint32_t position,
                                    Error *outError) const {
  const auto &entry = slot.entry;
  bool inside = entry.offset >= header_.dataOffset && entry.offset <= storeLength_ &&
                entry.storedSize <= storeLength_ - entry.offset;
  if (!inside) {
    return setError(outError, ErrorCode::CorruptSlot,
                    fmt::format("Entry '{}' (slot {}) spans [{}, {}+{}) outside the data area "
                                "[{}, {})",
                                slot.name, position, entry.offset, entry.offset,
                                entry.storedSize, header_.dataOffset, storeLength_));
  }
  return true;
}

Step<std::vector<IndexSlot>> IndexTableDecoder::feed(const Completion &completion) {
  const auto &data = completion.data;
  uint64_t expected = static_cast<uint64_t>(pending_) * IndexSlot::slotSize;
  if (data.size() < expected) {
    uint32_t lastComplete = next_ + static_cast<uint32_t>(data.size() / IndexSlot::slotSize);
    return Step<std::vector<IndexSlot>>::fail(
        ErrorCode::UnexpectedEof,
        fmt::format("Index table truncated at slot {} of {}", lastComplete, header_.capacity));
  }

  for (uint32_t i = 0; i < pending_; ++i) {
    uint32_t position = next_ + i;
    Error error;
    auto slot = parseSlot(data.subspan(static_cast<size_t>(i) * IndexSlot::slotSize,
                                       IndexSlot::slotSize),
                          position, &error);
    if (!slot) {
      return Step<std::vector<IndexSlot>>::fail(std::move(error));
    }

    if (slot->occupied()) {
      if (!checkBounds(*slot, position, &error)) {
        return Step<std::vector<IndexSlot>>::fail(std::move(error));
      }
      ++occupied_;
    }
    slots_.push_back(std::move(*slot));
  }

  next_ += pending_;
  if (next_ < header_.capacity) {
    return requestBatch();
  }

  if (occupied_ != header_.entryCount) {
    return Step<std::vector<IndexSlot>>::fail(
        ErrorCode::CorruptHeader,
        fmt::format("Header claims {} entries but the index holds {}", header_.entryCount,
                    occupied_));
  }
  return Step<std::vector<IndexSlot>>::done(std::move(slots_));
}

// ---------------------------------------------------------------------------
// PayloadDecoder

PayloadDecoder::PayloadDecoder(std::string name, const EntryDescriptor &entry, ByteSink sink,
                               size_t chunkSize)
    : name_(std::move(name)), entry_(entry), sink_(std::move(sink)),
      chunkSize_(std::max<size_t>(chunkSize, 1)) {}

Step<uint64_t> PayloadDecoder::start() {
  consumed_ = 0;
  produced_ = 0;
  crc_ = 0;
  overflow_ = false;
  if (entry_.storedSize == 0) {
    return finish();
  }
  return requestChunk(ReadRequest::Mode::Absolute);
}

Step<uint64_t> PayloadDecoder::requestChunk(ReadRequest::Mode mode) {
  requested_ = std::min<uint64_t>(chunkSize_, entry_.storedSize - consumed_);
  return Step<uint64_t>::suspend(ReadRequest{mode, entry_.offset, requested_});
}

void PayloadDecoder::deliver(std::span<const uint8_t> chunk) {
  if (overflow_ || chunk.size() > entry_.size - produced_) {
    overflow_ = true;
    return;
  }
  crc_ = checksum(chunk, crc_);
  produced_ += chunk.size();
  if (sink_) {
    sink_(chunk);
  }
}

Step<uint64_t> PayloadDecoder::feed(const Completion &completion) {
  const auto &data = completion.data;
  if (data.size() < requested_) {
    return Step<uint64_t>::fail(
        ErrorCode::UnexpectedEof,
        fmt::format("Payload of '{}' ends after {} of {} bytes", name_,
                    consumed_ + data.size(), entry_.storedSize));
  }
  consumed_ += data.size();

  if (entry_.compressed) {
    Error error;
    ByteSink forward = [this](std::span<const uint8_t> chunk) { deliver(chunk); };
    if (!inflater_.update(data, forward, &error)) {
      error.message = fmt::format("Entry '{}': {}", name_, error.message);
      return Step<uint64_t>::fail(std::move(error));
    }
  } else {
    deliver(data);
  }

  if (overflow_) {
    return Step<uint64_t>::fail(
        ErrorCode::IntegrityMismatch,
        fmt::format("Entry '{}' decodes to more than its recorded {} bytes", name_, entry_.size));
  }

  if (consumed_ < entry_.storedSize) {
    return requestChunk(ReadRequest::Mode::Continue);
  }
  return finish();
}

Step<uint64_t> PayloadDecoder::finish() {
  if (entry_.compressed && !inflater_.finished()) {
    return Step<uint64_t>::fail(ErrorCode::IntegrityMismatch,
                                fmt::format("Compressed stream of '{}' is incomplete", name_));
  }
  if (produced_ != entry_.size) {
    return Step<uint64_t>::fail(ErrorCode::IntegrityMismatch,
                                fmt::format("Entry '{}' decoded to {} bytes, expected {}", name_,
                                            produced_, entry_.size));
  }
  if (crc_ != entry_.checksum) {
    return Step<uint64_t>::fail(ErrorCode::IntegrityMismatch,
                                fmt::format("Checksum mismatch for '{}' (stored {:08x}, got {:08x})",
                                            name_, entry_.checksum, crc_));
  }
  return Step<uint64_t>::done(produced_);
}

// ---------------------------------------------------------------------------
// IndexTableEncoder

IndexTableEncoder::IndexTableEncoder(const ArchiveHeader &header,
                                     std::span<const IndexSlot> slots,
                                     std::optional<uint64_t> truncateTo, uint32_t slotsPerWrite)
    : header_(header), slots_(slots), truncateTo_(truncateTo),
      slotsPerWrite_(std::max<uint32_t>(slotsPerWrite, 1)) {}

Step<uint64_t> IndexTableEncoder::start() {
  phase_ = Phase::Header;
  next_ = 0;
  written_ = 0;
  if (slots_.size() != header_.capacity) {
    return Step<uint64_t>::fail(ErrorCode::CorruptHeader,
                                fmt::format("Index has {} slots but header capacity is {}",
                                            slots_.size(), header_.capacity));
  }

  buffer_.assign(ArchiveHeader::headerSize, 0);
  serializeHeader(header_, buffer_);
  return Step<uint64_t>::suspend(WriteRequest{0, buffer_});
}

Step<uint64_t> IndexTableEncoder::writeBatch() {
  uint32_t count = std::min<uint32_t>(slotsPerWrite_, header_.capacity - next_);
  buffer_.assign(static_cast<size_t>(count) * IndexSlot::slotSize, 0);
  for (uint32_t i = 0; i < count; ++i) {
    serializeSlot(slots_[next_ + i],
                  std::span<uint8_t>(buffer_).subspan(static_cast<size_t>(i) * IndexSlot::slotSize,
                                                      IndexSlot::slotSize));
  }

  uint64_t offset = header_.indexOffset + static_cast<uint64_t>(next_) * IndexSlot::slotSize;
  next_ += count;
  return Step<uint64_t>::suspend(WriteRequest{offset, buffer_});
}

Step<uint64_t> IndexTableEncoder::feed(const Completion &) {
  switch (phase_) {
  case Phase::Header:
  case Phase::Slots:
    written_ += buffer_.size();
    if (next_ < header_.capacity) {
      phase_ = Phase::Slots;
      return writeBatch();
    }
    if (truncateTo_) {
      phase_ = Phase::Truncate;
      return Step<uint64_t>::suspend(TruncateRequest{*truncateTo_});
    }
    phase_ = Phase::Done;
    return Step<uint64_t>::done(written_);
  case Phase::Truncate:
    phase_ = Phase::Done;
    return Step<uint64_t>::done(written_);
  case Phase::Done:
    break;
  }
  return Step<uint64_t>::fail(ErrorCode::Io, "Index encoder fed after completion");
}

// ---------------------------------------------------------------------------
// IndexPatchEncoder

IndexPatchEncoder::IndexPatchEncoder(const ArchiveHeader &header,
                                     std::span<const IndexSlot> slots,
                                     std::vector<uint32_t> positions)
    : header_(header), slots_(slots), positions_(std::move(positions)) {}

Step<uint64_t> IndexPatchEncoder::start() {
  next_ = 0;
  written_ = 0;
  for (uint32_t position : positions_) {
    if (position >= slots_.size()) {
      return Step<uint64_t>::fail(ErrorCode::CorruptSlot,
                                  fmt::format("Slot {} is outside an index of {} slots", position,
                                              slots_.size()));
    }
  }

  buffer_.assign(ArchiveHeader::headerSize, 0);
  serializeHeader(header_, buffer_);
  return Step<uint64_t>::suspend(WriteRequest{0, buffer_});
}

Step<uint64_t> IndexPatchEncoder::writeNext() {
  uint32_t position = positions_[next_++];
  buffer_.assign(IndexSlot::slotSize, 0);
  serializeSlot(slots_[position], buffer_);
  uint64_t offset = header_.indexOffset + static_cast<uint64_t>(position) * IndexSlot::slotSize;
  return Step<uint64_t>::suspend(WriteRequest{offset, buffer_});
}

Step<uint64_t> IndexPatchEncoder::feed(const Completion &) {
  written_ += buffer_.size();
  if (next_ < positions_.size()) {
    return writeNext();
  }
  return Step<uint64_t>::done(written_);
}

// ---------------------------------------------------------------------------
// PayloadEncoder

PayloadEncoder::PayloadEncoder(uint64_t offset, std::span<const uint8_t> data, size_t chunkSize)
    : offset_(offset), data_(data), chunkSize_(std::max<size_t>(chunkSize, 1)) {}

Step<uint64_t> PayloadEncoder::start() {
  written_ = 0;
  if (data_.empty()) {
    return Step<uint64_t>::done(0);
  }
  return writeNext();
}

Step<uint64_t> PayloadEncoder::writeNext() {
  pending_ = std::min<uint64_t>(chunkSize_, data_.size() - written_);
  auto chunk = data_.subspan(static_cast<size_t>(written_), static_cast<size_t>(pending_));
  return Step<uint64_t>::suspend(WriteRequest{offset_ + written_, chunk});
}

Step<uint64_t> PayloadEncoder::feed(const Completion &) {
  written_ += pending_;
  if (written_ < data_.size()) {
    return writeNext();
  }
  return Step<uint64_t>::done(written_);
}

// ---------------------------------------------------------------------------
// CopyOperation

CopyOperation::CopyOperation(uint64_t from, uint64_t to, uint64_t length, size_t chunkSize)
    : from_(from), to_(to), length_(length), chunkSize_(std::max<size_t>(chunkSize, 1)),
      backward_(to > from && to < from + length) {}

Step<uint64_t> CopyOperation::start() {
  copied_ = 0;
  awaitingWrite_ = false;
  if (length_ == 0 || from_ == to_) {
    return Step<uint64_t>::done(length_);
  }
  return readNext();
}

Step<uint64_t> CopyOperation::readNext() {
  uint64_t chunk = std::min<uint64_t>(chunkSize_, length_ - copied_);
  chunkOffset_ = backward_ ? length_ - copied_ - chunk : copied_;
  awaitingWrite_ = false;
  return Step<uint64_t>::suspend(
      ReadRequest{ReadRequest::Mode::Absolute, from_ + chunkOffset_, chunk});
}

Step<uint64_t> CopyOperation::feed(const Completion &completion) {
  if (awaitingWrite_) {
    copied_ += buffer_.size();
    if (copied_ < length_) {
      return readNext();
    }
    return Step<uint64_t>::done(copied_);
  }

  uint64_t expected = std::min<uint64_t>(chunkSize_, length_ - copied_);
  if (completion.data.size() < expected) {
    return Step<uint64_t>::fail(
        ErrorCode::UnexpectedEof,
        fmt::format("Source range [{}, {}) ends early while relocating", from_, from_ + length_));
  }

  // The completion buffer belongs to the transport; keep our own copy for the write
  buffer_.assign(completion.data.begin(), completion.data.begin() + static_cast<std::ptrdiff_t>(expected));
  awaitingWrite_ = true;
  return Step<uint64_t>::suspend(WriteRequest{to_ + chunkOffset_, buffer_});
}

} // namespace pakx
