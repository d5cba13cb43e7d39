#include <algorithm>
#include <map>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <pakx/archive.hpp>
#include <pakx/resumable.hpp>

namespace pakx {

namespace {

// An entry whose descriptor changes when payloads are relocated
struct Relocation {
  std::string name;
  EntryDescriptor entry;
};

std::vector<Relocation> collectEntries(const ArchiveIndex &index) {
  std::vector<Relocation> result;
  result.reserve(index.size());
  for (const auto &slot : index.entries()) {
    result.push_back(Relocation{slot.name, slot.entry});
  }
  std::sort(result.begin(), result.end(), [](const Relocation &a, const Relocation &b) {
    return a.entry.offset < b.entry.offset;
  });
  return result;
}

} // namespace

Archive::Archive(Archive &&other) noexcept
    : Reader(std::move(other)), mutable_(std::exchange(other.mutable_, nullptr)),
      writing_(std::exchange(other.writing_, false)) {}

Archive &Archive::operator=(Archive &&other) noexcept {
  if (this != &other) {
    Reader::operator=(std::move(other));
    mutable_ = std::exchange(other.mutable_, nullptr);
    writing_ = std::exchange(other.writing_, false);
  }
  return *this;
}

Archive::~Archive() = default;

void Archive::attach(std::unique_ptr<WritableStore> store) {
  auto transport = std::make_unique<MutableTransport>(*store);
  mutable_ = transport.get();
  transport_ = std::move(transport);
  store_ = std::move(store);
}

std::optional<Archive> Archive::create(std::unique_ptr<WritableStore> store, Error *outError) {
  return create(std::move(store), Options{}, outError);
}

std::optional<Archive> Archive::create(std::unique_ptr<WritableStore> store,
                                       const Options &options, Error *outError) {
  if (!store) {
    setError(outError, ErrorCode::Io, "No backing store");
    return std::nullopt;
  }

  Archive archive;
  archive.options_ = options;
  archive.attach(std::move(store));

  uint32_t capacity = std::max<uint32_t>(options.initialCapacity, 1);
  archive.header_ = ArchiveHeader::forCapacity(capacity);
  archive.index_ = ArchiveIndex(capacity, options.maxLoadFactor);
  archive.allocator_.reset(archive.header_.dataOffset, archive.header_.dataOffset);

  // Anything already in the store past the empty index is discarded
  if (!archive.writeIndexTable(archive.header_.dataOffset, outError)) {
    return std::nullopt;
  }

  spdlog::debug("Created archive with {} index slots", capacity);
  return archive;
}

std::optional<Archive> Archive::create(const std::filesystem::path &path, Error *outError) {
  return create(path, Options{}, outError);
}

std::optional<Archive> Archive::create(const std::filesystem::path &path, const Options &options,
                                       Error *outError) {
  auto store = FileStore::create(path, outError);
  if (!store) {
    return std::nullopt;
  }
  return create(std::move(store), options, outError);
}

std::optional<Archive> Archive::open(std::unique_ptr<ReadableStore> store, Error *outError) {
  return open(std::move(store), Options{}, outError);
}

std::optional<Archive> Archive::open(std::unique_ptr<ReadableStore> store,
                                     const Options &options, Error *outError) {
  if (!store) {
    setError(outError, ErrorCode::Io, "No backing store");
    return std::nullopt;
  }

  auto *writable = dynamic_cast<WritableStore *>(store.get());
  if (!writable) {
    setError(outError, ErrorCode::ReadOnly,
             "Store does not support writing; open it with Reader instead");
    return std::nullopt;
  }
  store.release();

  Archive archive;
  archive.options_ = options;
  archive.attach(std::unique_ptr<WritableStore>(writable));
  if (!archive.load(outError)) {
    return std::nullopt;
  }
  return archive;
}

std::optional<Archive> Archive::open(const std::filesystem::path &path, Error *outError) {
  return open(path, Options{}, outError);
}

std::optional<Archive> Archive::open(const std::filesystem::path &path, const Options &options,
                                     Error *outError) {
  auto store = FileStore::open(path, outError);
  if (!store) {
    return std::nullopt;
  }
  return open(std::move(store), options, outError);
}

bool Archive::writeIndexTable(std::optional<uint64_t> truncateTo, Error *outError) {
  header_.entryCount = index_.size();
  index_.takeChanges();
  IndexTableEncoder encoder(header_, index_.slots(), truncateTo);
  return mutable_->run(encoder, outError).has_value();
}

bool Archive::writeIndexChanges(Error *outError) {
  IndexChanges changes = index_.takeChanges();
  if (changes.all) {
    return writeIndexTable(std::nullopt, outError);
  }
  header_.entryCount = index_.size();
  IndexPatchEncoder encoder(header_, index_.slots(), std::move(changes.positions));
  return mutable_->run(encoder, outError).has_value();
}

void Archive::checkNoWriter() const {
  if (writing_) {
    throw ConcurrentModificationError("Archive modified while an entry writer is open");
  }
}

bool Archive::ensureRoom(Error *outError) {
  if (!index_.needsRehash()) {
    return true;
  }

  uint32_t target = index_.growthCapacity();
  if (target > index_.capacity()) {
    return reserve(target, outError);
  }

  // Only tombstones are in the way; the table keeps its size and position on disk
  index_.rehash(index_.capacity());
  return true;
}

bool Archive::insert(std::string_view name, std::span<const uint8_t> data,
                     const InsertOptions &options, Error *outError) {
  if (!checkOpen(outError) || !validateName(name, outError)) {
    return false;
  }
  checkNoWriter();

  std::optional<EntryDescriptor> previous;
  if (const auto *existing = index_.lookup(name)) {
    if (!options.replace) {
      return setError(outError, ErrorCode::AlreadyExists,
                      fmt::format("Entry already exists: {}", name));
    }
    previous = *existing;
  }

  EntryDescriptor entry;
  entry.size = data.size();
  entry.checksum = checksum(data);

  std::vector<uint8_t> compressed;
  std::span<const uint8_t> payload = data;
  if (options.compress) {
    int level = options.compressionLevel.value_or(options_.compressionLevel);
    auto packed = compressPayload(data, level, outError);
    if (!packed) {
      return false;
    }
    compressed = std::move(*packed);
    payload = compressed;
    entry.compressed = true;
  }
  entry.storedSize = payload.size();

  if (!previous && !ensureRoom(outError)) {
    return false;
  }

  // New bytes go to free space first; the slot is switched only once they are written
  entry.offset = allocator_.allocate(entry.storedSize);
  PayloadEncoder encoder(entry.offset, payload, options_.ioChunkSize);
  if (!mutable_->run(encoder, outError)) {
    allocator_.release(entry.offset, entry.storedSize);
    return false;
  }

  return commitEntry(name, entry, previous, outError);
}

bool Archive::commitEntry(std::string_view name, const EntryDescriptor &entry,
                          const std::optional<EntryDescriptor> &previous, Error *outError) {
  if (previous) {
    index_.update(name, entry);
  } else if (!index_.insert(name, entry, outError)) {
    allocator_.release(entry.offset, entry.storedSize);
    return false;
  }

  if (!writeIndexChanges(outError)) {
    return false;
  }

  if (previous) {
    allocator_.release(previous->offset, previous->storedSize);
  }

  spdlog::debug("{} '{}': {} bytes stored as {} at offset {}", previous ? "Replaced" : "Inserted",
                name, entry.size, entry.storedSize, entry.offset);
  return true;
}

std::optional<EntryWriter> Archive::beginInsert(std::string_view name,
                                                const InsertOptions &options, Error *outError) {
  if (!checkOpen(outError) || !validateName(name, outError)) {
    return std::nullopt;
  }
  checkNoWriter();

  bool exists = index_.contains(name);
  if (exists && !options.replace) {
    setError(outError, ErrorCode::AlreadyExists, fmt::format("Entry already exists: {}", name));
    return std::nullopt;
  }

  std::optional<Deflater> deflater;
  if (options.compress) {
    int level = options.compressionLevel.value_or(options_.compressionLevel);
    deflater.emplace(level);
    if (!deflater->ready()) {
      setError(outError, ErrorCode::CompressionFailed,
               fmt::format("Invalid compression level {}", level));
      return std::nullopt;
    }
  }

  // Growth may relocate payloads, so it happens before anything is appended
  if (!exists && !ensureRoom(outError)) {
    return std::nullopt;
  }

  writing_ = true;
  uint64_t offset = allocator_.tailOffset();
  spdlog::trace("Streaming '{}' to offset {}", name, offset);
  return EntryWriter(*this, std::string(name), offset, std::move(deflater));
}

bool Archive::insertOrReplace(std::string_view name, std::span<const uint8_t> data,
                              bool compress, Error *outError) {
  InsertOptions options;
  options.compress = compress;
  options.replace = true;
  return insert(name, data, options, outError);
}

bool Archive::remove(std::string_view name, Error *outError) {
  if (!checkOpen(outError)) {
    return false;
  }
  checkNoWriter();

  auto removed = index_.remove(name);
  if (!removed) {
    return setError(outError, ErrorCode::NotFound, fmt::format("Entry not found: {}", name));
  }

  if (!writeIndexChanges(outError)) {
    return false;
  }

  allocator_.release(removed->offset, removed->storedSize);
  spdlog::debug("Removed '{}', released {} bytes at {}", name, removed->storedSize,
                removed->offset);
  return true;
}

bool Archive::rename(std::string_view from, std::string_view to, Error *outError) {
  if (!checkOpen(outError) || !validateName(to, outError)) {
    return false;
  }
  checkNoWriter();
  if (!index_.contains(from)) {
    return setError(outError, ErrorCode::NotFound, fmt::format("Entry not found: {}", from));
  }
  if (from == to) {
    return true;
  }
  if (index_.contains(to)) {
    return setError(outError, ErrorCode::AlreadyExists,
                    fmt::format("Entry already exists: {}", to));
  }

  if (!ensureRoom(outError)) {
    return false;
  }

  auto entry = index_.remove(from);
  if (!index_.insert(to, *entry, outError)) {
    return false;
  }

  spdlog::debug("Renamed '{}' to '{}'", from, to);
  return writeIndexChanges(outError);
}

bool Archive::replace(std::string_view from, std::string_view to, Error *outError) {
  if (!checkOpen(outError) || !validateName(to, outError)) {
    return false;
  }
  checkNoWriter();
  if (!index_.contains(from)) {
    return setError(outError, ErrorCode::NotFound, fmt::format("Entry not found: {}", from));
  }
  if (from == to) {
    return true;
  }

  const auto *target = index_.lookup(to);
  if (!target) {
    return rename(from, to, outError);
  }

  // `to` keeps its slot and takes over the payload of `from`
  EntryDescriptor previous = *target;
  auto entry = index_.remove(from);
  index_.update(to, *entry);
  if (!writeIndexChanges(outError)) {
    return false;
  }

  allocator_.release(previous.offset, previous.storedSize);
  spdlog::debug("Moved '{}' over '{}', released {} bytes at {}", from, to, previous.storedSize,
                previous.offset);
  return true;
}

bool Archive::reserve(uint32_t capacity, Error *outError) {
  if (!checkOpen(outError)) {
    return false;
  }
  checkNoWriter();
  if (capacity <= index_.capacity()) {
    return true;
  }

  ArchiveHeader grown = ArchiveHeader::forCapacity(capacity);
  uint64_t newStart = grown.dataOffset;

  // Payloads overlapping the larger table are copied into free space above it. Nothing
  // below the new start is touched until the new table is written.
  SpaceAllocator plan = allocator_;
  plan.reserveFront(newStart);

  std::vector<Relocation> moved;
  for (auto &item : collectEntries(index_)) {
    if (item.entry.offset >= newStart) {
      continue;
    }
    if (item.entry.storedSize == 0) {
      item.entry.offset = newStart;
      moved.push_back(std::move(item));
      continue;
    }

    uint64_t target = plan.allocate(item.entry.storedSize);
    CopyOperation copy(item.entry.offset, target, item.entry.storedSize, options_.ioChunkSize);
    if (!mutable_->run(copy, outError)) {
      spdlog::warn("Index growth aborted while relocating '{}'", item.name);
      return false;
    }
    spdlog::trace("Relocated '{}' from {} to {} for index growth", item.name, item.entry.offset,
                  target);

    if (item.entry.end() > newStart) {
      plan.release(newStart, item.entry.end() - newStart);
    }
    item.entry.offset = target;
    moved.push_back(std::move(item));
  }

  for (const auto &item : moved) {
    index_.update(item.name, item.entry);
  }
  index_.rehash(capacity);
  header_ = grown;
  allocator_ = std::move(plan);

  spdlog::debug("Index grown to {} slots, {} payloads relocated", capacity, moved.size());
  return writeIndexTable(std::nullopt, outError);
}

bool Archive::repack(Error *outError) {
  if (!checkOpen(outError)) {
    return false;
  }
  checkNoWriter();

  auto fileSize = mutable_->size(outError);
  if (!fileSize) {
    return false;
  }

  uint64_t dataStart = header_.dataOffset;
  std::vector<Relocation> entries = collectEntries(index_);

  std::vector<Extent> live;
  uint64_t packedEnd = dataStart;
  for (const auto &item : entries) {
    live.push_back(Extent{item.entry.offset, item.entry.storedSize});
    packedEnd += item.entry.storedSize;
  }

  std::vector<Move> moves = allocator_.planCompaction(live);

  bool zeroLengthOutside = std::any_of(entries.begin(), entries.end(), [&](const Relocation &r) {
    return r.entry.storedSize == 0 && r.entry.offset != dataStart;
  });
  if (moves.empty() && !zeroLengthOutside && *fileSize == packedEnd &&
      index_.tombstones() == 0) {
    spdlog::debug("Archive is already packed ({} bytes)", packedEnd);
    allocator_.reset(dataStart, packedEnd);
    return true;
  }

  // Phase 1: stage every payload that moves past the current end of file. The live
  // region is not written, so a failure here only leaves scratch data to cut off.
  uint64_t stagingBase = std::max(*fileSize, allocator_.dataEnd());
  std::vector<uint64_t> staged;
  staged.reserve(moves.size());
  uint64_t cursor = stagingBase;
  for (const auto &move : moves) {
    CopyOperation copy(move.from, cursor, move.length, options_.ioChunkSize);
    if (!mutable_->run(copy, outError)) {
      spdlog::warn("Repack staging failed; discarding {} staged bytes", cursor - stagingBase);
      Error cleanup;
      if (!mutable_->truncate(*fileSize, &cleanup)) {
        spdlog::warn("Could not remove repack scratch data: {}", cleanup.describe());
      }
      return false;
    }
    staged.push_back(cursor);
    cursor += move.length;
  }
  spdlog::debug("Repack staged {} payloads ({} bytes) at {}", moves.size(), cursor - stagingBase,
                stagingBase);

  // Phase 2: commit. From here on a failure can leave the archive inconsistent.
  for (size_t i = 0; i < moves.size(); ++i) {
    CopyOperation copy(staged[i], moves[i].to, moves[i].length, options_.ioChunkSize);
    if (!mutable_->run(copy, outError)) {
      spdlog::error("Repack commit failed while placing payloads; archive may be inconsistent");
      return false;
    }
  }

  std::map<uint64_t, uint64_t> relocated;
  for (const auto &move : moves) {
    relocated.emplace(move.from, move.to);
  }
  for (auto &item : entries) {
    if (item.entry.storedSize == 0) {
      item.entry.offset = dataStart;
    } else if (auto it = relocated.find(item.entry.offset); it != relocated.end()) {
      item.entry.offset = it->second;
    }
    index_.update(item.name, item.entry);
  }
  index_.rehash(index_.capacity());

  if (!writeIndexTable(packedEnd, outError)) {
    spdlog::error("Repack commit failed while writing the index; archive may be inconsistent");
    return false;
  }
  if (!mutable_->sync(outError)) {
    spdlog::error("Repack commit failed to sync; archive may be inconsistent");
    return false;
  }

  allocator_.reset(dataStart, packedEnd);
  spdlog::debug("Repacked archive: {} -> {} bytes", *fileSize, packedEnd);
  return true;
}

bool Archive::flush(Error *outError) {
  if (!checkOpen(outError)) {
    return false;
  }
  checkNoWriter();
  return writeIndexTable(std::nullopt, outError) && mutable_->sync(outError);
}

void Archive::close() {
  Reader::close();
  mutable_ = nullptr;
  writing_ = false;
}

// ---------------------------------------------------------------------------
// EntryWriter

EntryWriter::EntryWriter(Archive &archive, std::string name, uint64_t offset,
                         std::optional<Deflater> deflater)
    : archive_(&archive), name_(std::move(name)), offset_(offset),
      deflater_(std::move(deflater)) {}

EntryWriter::EntryWriter(EntryWriter &&other) noexcept
    : archive_(std::exchange(other.archive_, nullptr)), name_(std::move(other.name_)),
      offset_(other.offset_), stored_(other.stored_), size_(other.size_), crc_(other.crc_),
      deflater_(std::move(other.deflater_)), pending_(std::move(other.pending_)) {}

EntryWriter &EntryWriter::operator=(EntryWriter &&other) noexcept {
  if (this != &other) {
    detach();
    archive_ = std::exchange(other.archive_, nullptr);
    name_ = std::move(other.name_);
    offset_ = other.offset_;
    stored_ = other.stored_;
    size_ = other.size_;
    crc_ = other.crc_;
    deflater_ = std::move(other.deflater_);
    pending_ = std::move(other.pending_);
  }
  return *this;
}

EntryWriter::~EntryWriter() {
  if (archive_) {
    spdlog::debug("Entry writer for '{}' dropped; {} stored bytes discarded", name_, stored_);
  }
  detach();
}

void EntryWriter::detach() {
  if (archive_) {
    archive_->writing_ = false;
    archive_ = nullptr;
  }
}

bool EntryWriter::store(std::span<const uint8_t> data, Error *outError) {
  PayloadEncoder encoder(offset_ + stored_, data, archive_->options_.ioChunkSize);
  if (!archive_->mutable_->run(encoder, outError)) {
    return false;
  }
  stored_ += data.size();
  return true;
}

bool EntryWriter::write(std::span<const uint8_t> data, Error *outError) {
  if (!archive_) {
    return setError(outError, ErrorCode::Io, "Entry writer is closed");
  }
  if (!archive_->checkOpen(outError)) {
    detach();
    return false;
  }

  bool ok;
  if (deflater_) {
    pending_.clear();
    ByteSink sink = [this](std::span<const uint8_t> chunk) {
      pending_.insert(pending_.end(), chunk.begin(), chunk.end());
    };
    ok = deflater_->update(data, sink, outError) && store(pending_, outError);
  } else {
    ok = store(data, outError);
  }

  if (!ok) {
    spdlog::warn("Streaming '{}' failed after {} stored bytes", name_, stored_);
    detach();
    return false;
  }
  crc_ = checksum(data, crc_);
  size_ += data.size();
  return true;
}

bool EntryWriter::finish(Error *outError) {
  if (!archive_) {
    return setError(outError, ErrorCode::Io, "Entry writer is closed");
  }
  if (!archive_->checkOpen(outError)) {
    detach();
    return false;
  }

  if (deflater_) {
    pending_.clear();
    ByteSink sink = [this](std::span<const uint8_t> chunk) {
      pending_.insert(pending_.end(), chunk.begin(), chunk.end());
    };
    if (!deflater_->finish(sink, outError) || !store(pending_, outError)) {
      detach();
      return false;
    }
  }

  Archive &archive = *archive_;
  detach();

  std::optional<EntryDescriptor> previous;
  if (const auto *existing = archive.index_.lookup(name_)) {
    previous = *existing;
  }

  EntryDescriptor entry;
  entry.offset = archive.allocator_.claimTail(stored_);
  entry.storedSize = stored_;
  entry.size = size_;
  entry.compressed = deflater_.has_value();
  entry.checksum = crc_;
  return archive.commitEntry(name_, entry, previous, outError);
}

} // namespace pakx
