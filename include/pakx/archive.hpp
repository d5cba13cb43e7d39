#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "codec.hpp"
#include "reader.hpp"
#include "store.hpp"
#include "transport.hpp"
#include "types.hpp"

namespace pakx {

class Archive;

// Incremental insert started by Archive::beginInsert(). Bytes are stored at the end of
// the data area as they arrive, deflated on the fly when requested; the entry only
// becomes visible in finish(). Dropping the writer before finish() leaves the archive
// as it was, apart from unreferenced bytes past its data end.
//
// The archive must outlive the writer and stay in place while it is open. Other edits
// on the archive throw ConcurrentModificationError until the writer is finished or
// dropped; reads are allowed.
class EntryWriter {
public:
  EntryWriter(EntryWriter &&other) noexcept;
  EntryWriter &operator=(EntryWriter &&other) noexcept;
  ~EntryWriter();

  EntryWriter(const EntryWriter &) = delete;
  EntryWriter &operator=(const EntryWriter &) = delete;

  bool write(std::span<const uint8_t> data, Error *outError = nullptr);

  // Flushes the compressor, then points the slot at the stored bytes
  bool finish(Error *outError = nullptr);

  // Uncompressed bytes accepted so far
  uint64_t size() const { return size_; }

  bool isOpen() const { return archive_ != nullptr; }

private:
  friend class Archive;

  EntryWriter(Archive &archive, std::string name, uint64_t offset,
              std::optional<Deflater> deflater);

  bool store(std::span<const uint8_t> data, Error *outError);
  void detach();

  Archive *archive_ = nullptr;
  std::string name_;
  uint64_t offset_ = 0;
  uint64_t stored_ = 0;
  uint64_t size_ = 0;
  uint32_t crc_ = 0;
  std::optional<Deflater> deflater_;
  std::vector<uint8_t> pending_; // Compressor output awaiting its write
};

// Mutable archive handle: everything Reader offers plus in-place edits.
// Only constructible over a writable store.
class Archive : public Reader {
public:
  Archive(Archive &&) noexcept;
  Archive &operator=(Archive &&) noexcept;
  ~Archive() override;

  // Initialize an empty archive (header plus an empty index) on the store
  static std::optional<Archive> create(std::unique_ptr<WritableStore> store,
                                       Error *outError = nullptr);
  static std::optional<Archive> create(std::unique_ptr<WritableStore> store,
                                       const Options &options, Error *outError = nullptr);
  static std::optional<Archive> create(const std::filesystem::path &path,
                                       Error *outError = nullptr);
  static std::optional<Archive> create(const std::filesystem::path &path, const Options &options,
                                       Error *outError = nullptr);

  // Open an existing archive. Fails with ReadOnly when the store cannot be written.
  static std::optional<Archive> open(std::unique_ptr<ReadableStore> store,
                                     Error *outError = nullptr);
  static std::optional<Archive> open(std::unique_ptr<ReadableStore> store,
                                     const Options &options, Error *outError = nullptr);
  static std::optional<Archive> open(const std::filesystem::path &path,
                                     Error *outError = nullptr);
  static std::optional<Archive> open(const std::filesystem::path &path, const Options &options,
                                     Error *outError = nullptr);

  // Store a new entry (AlreadyExists unless options.replace). The payload is written
  // before the slot points at it; a replaced payload's space is released afterwards.
  bool insert(std::string_view name, std::span<const uint8_t> data,
              const InsertOptions &options = InsertOptions{}, Error *outError = nullptr);

  bool insertOrReplace(std::string_view name, std::span<const uint8_t> data,
                       bool compress = false, Error *outError = nullptr);

  // Start a streaming insert. Name, existence, compression level and index room are
  // checked here, before any payload byte is written.
  std::optional<EntryWriter> beginInsert(std::string_view name,
                                         const InsertOptions &options = InsertOptions{},
                                         Error *outError = nullptr);

  // Returns false with NotFound when the entry does not exist
  bool remove(std::string_view name, Error *outError = nullptr);

  bool rename(std::string_view from, std::string_view to, Error *outError = nullptr);

  // Like rename(), but an existing `to` is overwritten and its payload space released
  bool replace(std::string_view from, std::string_view to, Error *outError = nullptr);

  // Grow the index to at least `capacity` slots, relocating payloads that sit where
  // the larger table will go
  bool reserve(uint32_t capacity, Error *outError = nullptr);

  // Rewrite live entries contiguously after the index and shrink the file.
  // A failure before the commit step leaves the previous archive intact.
  bool repack(Error *outError = nullptr);

  // Write header and index from memory and sync the store
  bool flush(Error *outError = nullptr);

  // Request counters of the underlying transport; all zero once closed
  TransportCounters counters() const {
    return mutable_ ? mutable_->counters() : TransportCounters{};
  }

  void close() override;

private:
  friend class EntryWriter;

  Archive() = default;

  void attach(std::unique_ptr<WritableStore> store);

  // Throws ConcurrentModificationError while an EntryWriter is open
  void checkNoWriter() const;

  // Points `name` at a payload already written at entry.offset and persists the index
  bool commitEntry(std::string_view name, const EntryDescriptor &entry,
                   const std::optional<EntryDescriptor> &previous, Error *outError);

  // Makes sure one more slot can be occupied without exceeding the load factor
  bool ensureRoom(Error *outError);

  bool writeIndexChanges(Error *outError);
  bool writeIndexTable(std::optional<uint64_t> truncateTo, Error *outError);

  MutableTransport *mutable_ = nullptr; // Same object as transport_
  bool writing_ = false;                // An EntryWriter is open
};

} // namespace pakx
