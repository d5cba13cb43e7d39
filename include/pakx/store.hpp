#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <utility>
#include <vector>

#include "types.hpp"

namespace pakx {

// Minimum capability a backing store must offer: positioned reads
class ReadableStore {
public:
  virtual ~ReadableStore() = default;

  virtual bool seek(uint64_t offset, Error *outError = nullptr) = 0;

  // Reads up to buffer.size() bytes at the cursor. Returns 0 at end of input.
  virtual std::optional<size_t> read(std::span<uint8_t> buffer, Error *outError = nullptr) = 0;

  virtual std::optional<uint64_t> size(Error *outError = nullptr) = 0;
};

// Stores that can also be mutated in place
class WritableStore : public ReadableStore {
public:
  // Writes all of `data` at the cursor, growing the store if needed
  virtual bool write(std::span<const uint8_t> data, Error *outError = nullptr) = 0;

  virtual bool truncate(uint64_t length, Error *outError = nullptr) = 0;

  // Pushes buffered writes to durable storage
  virtual bool sync(Error *outError = nullptr) = 0;
};

namespace detail {

// RAII file descriptor shared by the file stores
class FileHandle {
public:
  FileHandle() = default;
  ~FileHandle();

  FileHandle(const FileHandle &) = delete;
  FileHandle &operator=(const FileHandle &) = delete;
  FileHandle(FileHandle &&other) noexcept;
  FileHandle &operator=(FileHandle &&other) noexcept;

  enum class Mode { Read, ReadWrite, Create };

  bool open(const std::filesystem::path &path, Mode mode, Error *outError);
  void close() noexcept;
  bool isOpen() const;

  bool seek(uint64_t offset, Error *outError);
  std::optional<size_t> read(std::span<uint8_t> buffer, Error *outError);
  bool write(std::span<const uint8_t> data, Error *outError);
  std::optional<uint64_t> size(Error *outError);
  bool truncate(uint64_t length, Error *outError);
  bool sync(Error *outError);

  const std::filesystem::path &path() const { return path_; }

private:
#ifdef _WIN32
  void *handle_ = nullptr; // HANDLE on Windows
#else
  int fd_ = -1; // File descriptor on POSIX
#endif
  std::filesystem::path path_;
};

} // namespace detail

// Read-only view of a file on disk
class FileSource : public ReadableStore {
public:
  static std::unique_ptr<FileSource> open(const std::filesystem::path &path,
                                          Error *outError = nullptr);

  bool seek(uint64_t offset, Error *outError = nullptr) override;
  std::optional<size_t> read(std::span<uint8_t> buffer, Error *outError = nullptr) override;
  std::optional<uint64_t> size(Error *outError = nullptr) override;

private:
  detail::FileHandle file_;
};

// Read-write file on disk
class FileStore : public WritableStore {
public:
  // Opens an existing file. Fails with ReadOnly when the file cannot be opened for writing.
  static std::unique_ptr<FileStore> open(const std::filesystem::path &path,
                                         Error *outError = nullptr);

  // Creates (or empties) a file
  static std::unique_ptr<FileStore> create(const std::filesystem::path &path,
                                           Error *outError = nullptr);

  bool seek(uint64_t offset, Error *outError = nullptr) override;
  std::optional<size_t> read(std::span<uint8_t> buffer, Error *outError = nullptr) override;
  std::optional<uint64_t> size(Error *outError = nullptr) override;
  bool write(std::span<const uint8_t> data, Error *outError = nullptr) override;
  bool truncate(uint64_t length, Error *outError = nullptr) override;
  bool sync(Error *outError = nullptr) override;

private:
  detail::FileHandle file_;
};

// Read-only store over caller-owned memory
class MemoryView : public ReadableStore {
public:
  explicit MemoryView(std::span<const uint8_t> data) : data_(data) {}

  bool seek(uint64_t offset, Error *outError = nullptr) override;
  std::optional<size_t> read(std::span<uint8_t> buffer, Error *outError = nullptr) override;
  std::optional<uint64_t> size(Error *outError = nullptr) override;

private:
  std::span<const uint8_t> data_;
  uint64_t cursor_ = 0;
};

// Growable in-memory store
class MemoryStore : public WritableStore {
public:
  MemoryStore() = default;
  explicit MemoryStore(std::vector<uint8_t> bytes) : bytes_(std::move(bytes)) {}

  bool seek(uint64_t offset, Error *outError = nullptr) override;
  std::optional<size_t> read(std::span<uint8_t> buffer, Error *outError = nullptr) override;
  std::optional<uint64_t> size(Error *outError = nullptr) override;
  bool write(std::span<const uint8_t> data, Error *outError = nullptr) override;
  bool truncate(uint64_t length, Error *outError = nullptr) override;
  bool sync(Error *outError = nullptr) override;

  const std::vector<uint8_t> &bytes() const { return bytes_; }
  std::vector<uint8_t> &bytes() { return bytes_; }

private:
  std::vector<uint8_t> bytes_;
  uint64_t cursor_ = 0;
};

} // namespace pakx
