#include <algorithm>
#include <fstream>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <pakx/reader.hpp>
#include <pakx/resumable.hpp>

namespace pakx {

namespace {

// Largest up-front reservation for a compressed entry read into memory
constexpr uint64_t compressedReserveLimit = 64 * 1024 * 1024;

} // namespace

bool isContainedPath(std::string_view name) {
  std::filesystem::path p(name);
  if (name.empty() || p.is_absolute() || p.has_root_name() || p.has_root_directory()) {
    return false;
  }
  for (const auto &part : p) {
    if (part == "..") {
      return false;
    }
  }
  return true;
}

Reader::~Reader() = default;

Reader::Reader(Reader &&) noexcept = default;

Reader &Reader::operator=(Reader &&) noexcept = default;

std::optional<Reader> Reader::open(std::unique_ptr<ReadableStore> store, Error *outError) {
  return open(std::move(store), Options{}, outError);
}

std::optional<Reader> Reader::open(std::unique_ptr<ReadableStore> store, const Options &options,
                                   Error *outError) {
  if (!store) {
    setError(outError, ErrorCode::Io, "No backing store");
    return std::nullopt;
  }

  Reader reader;
  reader.options_ = options;
  reader.store_ = std::move(store);
  reader.transport_ = std::make_unique<Transport>(*reader.store_);
  if (!reader.load(outError)) {
    return std::nullopt;
  }
  return reader;
}

std::optional<Reader> Reader::open(const std::filesystem::path &path, Error *outError) {
  return open(path, Options{}, outError);
}

std::optional<Reader> Reader::open(const std::filesystem::path &path, const Options &options,
                                   Error *outError) {
  auto source = FileSource::open(path, outError);
  if (!source) {
    return std::nullopt;
  }
  return open(std::move(source), options, outError);
}

bool Reader::load(Error *outError) {
  auto storeLength = transport_->size(outError);
  if (!storeLength) {
    return false;
  }

  HeaderDecoder headerDecoder;
  auto header = transport_->run(headerDecoder, outError);
  if (!header) {
    return false;
  }

  IndexTableDecoder indexDecoder(*header, *storeLength);
  auto slots = transport_->run(indexDecoder, outError);
  if (!slots) {
    return false;
  }

  auto index = ArchiveIndex::load(std::move(*slots), options_.maxLoadFactor, outError);
  if (!index) {
    return false;
  }

  std::vector<Extent> used;
  used.reserve(index->size());
  for (const auto &slot : index->entries()) {
    used.push_back(Extent{slot.entry.offset, slot.entry.storedSize});
  }

  SpaceAllocator allocator;
  if (!allocator.seed(header->dataOffset, std::max(*storeLength, header->dataOffset),
                      std::move(used), outError)) {
    return false;
  }

  header_ = *header;
  index_ = std::move(*index);
  allocator_ = std::move(allocator);

  spdlog::debug("Opened archive: {} entries in {} slots, {} free bytes in {} regions",
                index_.size(), index_.capacity(), allocator_.freeBytes(),
                allocator_.regionCount());
  return true;
}

bool Reader::checkOpen(Error *outError) const {
  if (!store_) {
    return setError(outError, ErrorCode::Io, "Archive is closed");
  }
  return true;
}

std::optional<std::vector<uint8_t>> Reader::get(std::string_view name, Error *outError) {
  std::vector<uint8_t> result;
  if (const auto *entry = index_.lookup(name)) {
    // Raw sizes are checked against the store on open; a deflate entry's recorded size
    // is only verified while decoding, so it cannot be trusted for the allocation
    uint64_t expected = entry->size;
    if (entry->compressed) {
      expected = std::min({expected, entry->storedSize * maxInflateRatio, compressedReserveLimit});
    }
    result.reserve(static_cast<size_t>(expected));
  }

  ByteSink sink = [&result](std::span<const uint8_t> chunk) {
    result.insert(result.end(), chunk.begin(), chunk.end());
  };
  if (!extract(name, sink, outError)) {
    return std::nullopt;
  }
  return result;
}

bool Reader::extract(std::string_view name, const ByteSink &sink, Error *outError) {
  if (!checkOpen(outError)) {
    return false;
  }

  const auto *entry = index_.lookup(name);
  if (!entry) {
    return setError(outError, ErrorCode::NotFound, fmt::format("Entry not found: {}", name));
  }

  PayloadDecoder decoder(std::string(name), *entry, sink, options_.ioChunkSize);
  return transport_->run(decoder, outError).has_value();
}

bool Reader::extract(std::string_view name, const std::filesystem::path &destPath,
                     Error *outError) {
  if (!contains(name)) {
    return setError(outError, ErrorCode::NotFound, fmt::format("Entry not found: {}", name));
  }

  // Create parent directories if needed
  std::error_code ec;
  if (destPath.has_parent_path()) {
    std::filesystem::create_directories(destPath.parent_path(), ec);
    if (ec) {
      return setError(outError, ErrorCode::Io,
                      fmt::format("Failed to create directory {}: {}",
                                  destPath.parent_path().string(), ec.message()));
    }
  }

  std::ofstream out(destPath, std::ios::binary);
  if (!out) {
    return setError(outError, ErrorCode::Io,
                    fmt::format("Failed to create output file: {}", destPath.string()));
  }

  ByteSink sink = [&out](std::span<const uint8_t> chunk) {
    out.write(reinterpret_cast<const char *>(chunk.data()),
              static_cast<std::streamsize>(chunk.size()));
  };
  if (!extract(name, sink, outError)) {
    out.close();
    std::filesystem::remove(destPath, ec);
    return false;
  }

  out.flush();
  if (!out) {
    return setError(outError, ErrorCode::Io,
                    fmt::format("Failed to write to output file: {}", destPath.string()));
  }
  return true;
}

std::optional<EntryInfo> Reader::info(std::string_view name) const {
  const auto *entry = index_.lookup(name);
  if (!entry) {
    return std::nullopt;
  }

  EntryInfo result;
  result.name = std::string(name);
  result.offset = entry->offset;
  result.storedSize = entry->storedSize;
  result.size = entry->size;
  result.compressed = entry->compressed;
  result.checksum = entry->checksum;
  return result;
}

ArchiveStats Reader::stats() const {
  ArchiveStats result;
  result.capacity = index_.capacity();
  result.entryCount = index_.size();
  result.tombstoneCount = index_.tombstones();
  result.fileSize = allocator_.dataEnd();
  result.dataOffset = header_.dataOffset;
  for (const auto &slot : index_.entries()) {
    result.storedBytes += slot.entry.storedSize;
  }
  result.freeBytes = allocator_.freeBytes();
  result.freeRegionCount = allocator_.regionCount();
  return result;
}

void Reader::close() {
  transport_.reset();
  store_.reset();
  index_ = ArchiveIndex();
  allocator_ = SpaceAllocator();
  header_ = ArchiveHeader();
}

} // namespace pakx
