#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "allocator.hpp"
#include "codec.hpp"
#include "format.hpp"
#include "index.hpp"
#include "store.hpp"
#include "transport.hpp"
#include "types.hpp"

namespace pakx {

// True when `name` joined to a directory stays inside it: relative, without a root
// name and without ".." parts. Entry names are untrusted when extracting.
bool isContainedPath(std::string_view name);

// Read-only archive handle. Owns its store, index and free-space map.
class Reader {
public:
  virtual ~Reader();

  // Delete copy, enable move
  Reader(const Reader &) = delete;
  Reader &operator=(const Reader &) = delete;
  Reader(Reader &&) noexcept;
  Reader &operator=(Reader &&) noexcept;

  // Open archive over any readable store; header and index are decoded eagerly
  // Returns std::nullopt on failure, with error in outError if provided
  static std::optional<Reader> open(std::unique_ptr<ReadableStore> store,
                                    Error *outError = nullptr);
  static std::optional<Reader> open(std::unique_ptr<ReadableStore> store, const Options &options,
                                    Error *outError = nullptr);

  // Open archive file from disk
  static std::optional<Reader> open(const std::filesystem::path &path, Error *outError = nullptr);
  static std::optional<Reader> open(const std::filesystem::path &path, const Options &options,
                                    Error *outError = nullptr);

  // Read a whole entry into memory (NotFound, IntegrityMismatch)
  std::optional<std::vector<uint8_t>> get(std::string_view name, Error *outError = nullptr);

  // Stream an entry to a sink chunk by chunk. The payload is verified as it is read,
  // so a sink may have received bytes before an IntegrityMismatch is reported.
  bool extract(std::string_view name, const ByteSink &sink, Error *outError = nullptr);

  // Extract an entry to a file, creating parent directories as needed
  bool extract(std::string_view name, const std::filesystem::path &destPath,
               Error *outError = nullptr);

  bool contains(std::string_view name) const { return index_.contains(name); }

  std::optional<EntryInfo> info(std::string_view name) const;

  // Lazy sequence of entry names in table order
  NameRange list() const { return index_.names(); }

  // Lazy sequence of occupied slots in table order
  EntryRange entries() const { return index_.entries(); }

  ArchiveStats stats() const;

  uint32_t entryCount() const { return index_.size(); }
  uint32_t capacity() const { return index_.capacity(); }
  const ArchiveHeader &header() const { return header_; }
  std::vector<FreeRegion> freeRegions() const { return allocator_.regions(); }
  const Options &options() const { return options_; }

  bool isOpen() const { return store_ != nullptr; }

  // Release the backing store; the handle is unusable afterwards
  virtual void close();

protected:
  Reader() = default;

  // Decodes header and index through transport_ and seeds the allocator
  bool load(Error *outError);

  bool checkOpen(Error *outError) const;

  std::unique_ptr<ReadableStore> store_;
  std::unique_ptr<Transport> transport_;
  ArchiveHeader header_;
  ArchiveIndex index_;
  SpaceAllocator allocator_;
  Options options_;
};

} // namespace pakx
