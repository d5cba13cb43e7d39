#include <algorithm>
#include <cstring>
#include <limits>

#include <fmt/format.h>

#include <pakx/store.hpp>

#ifdef _WIN32
#include <windows.h>
#else
#include <cerrno>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace pakx {

namespace detail {

FileHandle::~FileHandle() {
  close();
}

FileHandle::FileHandle(FileHandle &&other) noexcept
    :
#ifdef _WIN32
      handle_(other.handle_),
#else
      fd_(other.fd_),
#endif
      path_(std::move(other.path_)) {
#ifdef _WIN32
  other.handle_ = nullptr;
#else
  other.fd_ = -1;
#endif
}

FileHandle &FileHandle::operator=(FileHandle &&other) noexcept {
  if (this != &other) {
    close();

#ifdef _WIN32
    handle_ = other.handle_;
    other.handle_ = nullptr;
#else
    fd_ = other.fd_;
    other.fd_ = -1;
#endif
    path_ = std::move(other.path_);
  }
  return *this;
}

bool FileHandle::isOpen() const {
#ifdef _WIN32
  return handle_ != nullptr;
#else
  return fd_ >= 0;
#endif
}

void FileHandle::close() noexcept {
#ifdef _WIN32
  if (handle_) {
    CloseHandle(static_cast<HANDLE>(handle_));
    handle_ = nullptr;
  }
#else
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
#endif
}

#ifdef _WIN32

bool FileHandle::open(const std::filesystem::path &path, Mode mode, Error *outError) {
  close();
  path_ = path;

  DWORD access = mode == Mode::Read ? GENERIC_READ : GENERIC_READ | GENERIC_WRITE;
  DWORD disposition = mode == Mode::Create ? CREATE_ALWAYS : OPEN_EXISTING;
  HANDLE handle = CreateFileW(path.c_str(), access, FILE_SHARE_READ, nullptr, disposition,
                              FILE_ATTRIBUTE_NORMAL, nullptr);
  if (handle == INVALID_HANDLE_VALUE) {
    DWORD err = GetLastError();
    ErrorCode code = (mode == Mode::ReadWrite && err == ERROR_ACCESS_DENIED) ? ErrorCode::ReadOnly
                                                                              : ErrorCode::Io;
    return setError(outError, code,
                    fmt::format("Failed to open file: {} (error: {})", path.string(), err));
  }

  handle_ = handle;
  return true;
}

bool FileHandle::seek(uint64_t offset, Error *outError) {
  LARGE_INTEGER distance;
  distance.QuadPart = static_cast<LONGLONG>(offset);
  if (!SetFilePointerEx(static_cast<HANDLE>(handle_), distance, nullptr, FILE_BEGIN)) {
    return setError(outError, ErrorCode::Io,
                    fmt::format("Failed to seek to {} in {}", offset, path_.string()));
  }
  return true;
}

std::optional<size_t> FileHandle::read(std::span<uint8_t> buffer, Error *outError) {
  DWORD request = static_cast<DWORD>(
      std::min<size_t>(buffer.size(), std::numeric_limits<DWORD>::max()));
  DWORD got = 0;
  if (!ReadFile(static_cast<HANDLE>(handle_), buffer.data(), request, &got, nullptr)) {
    setError(outError, ErrorCode::Io, fmt::format("Failed to read from {}", path_.string()));
    return std::nullopt;
  }
  return static_cast<size_t>(got);
}

bool FileHandle::write(std::span<const uint8_t> data, Error *outError) {
  while (!data.empty()) {
    DWORD request = static_cast<DWORD>(
        std::min<size_t>(data.size(), std::numeric_limits<DWORD>::max()));
    DWORD put = 0;
    if (!WriteFile(static_cast<HANDLE>(handle_), data.data(), request, &put, nullptr) ||
        put == 0) {
      return setError(outError, ErrorCode::Io,
                      fmt::format("Failed to write to {}", path_.string()));
    }
    data = data.subspan(put);
  }
  return true;
}

std::optional<uint64_t> FileHandle::size(Error *outError) {
  LARGE_INTEGER fileSize;
  if (!GetFileSizeEx(static_cast<HANDLE>(handle_), &fileSize)) {
    setError(outError, ErrorCode::Io, fmt::format("Failed to get file size: {}", path_.string()));
    return std::nullopt;
  }
  return static_cast<uint64_t>(fileSize.QuadPart);
}

bool FileHandle::truncate(uint64_t length, Error *outError) {
  if (!seek(length, outError)) {
    return false;
  }
  if (!SetEndOfFile(static_cast<HANDLE>(handle_))) {
    return setError(outError, ErrorCode::Io,
                    fmt::format("Failed to truncate {} to {} bytes", path_.string(), length));
  }
  return true;
}

bool FileHandle::sync(Error *outError) {
  if (!FlushFileBuffers(static_cast<HANDLE>(handle_))) {
    return setError(outError, ErrorCode::Io, fmt::format("Failed to flush {}", path_.string()));
  }
  return true;
}

#else

bool FileHandle::open(const std::filesystem::path &path, Mode mode, Error *outError) {
  close();
  path_ = path;

  switch (mode) {
  case Mode::Read:
    fd_ = ::open(path.string().c_str(), O_RDONLY);
    break;
  case Mode::ReadWrite:
    fd_ = ::open(path.string().c_str(), O_RDWR);
    break;
  case Mode::Create:
    fd_ = ::open(path.string().c_str(), O_RDWR | O_CREAT | O_TRUNC, 0644);
    break;
  }

  if (fd_ < 0) {
    int err = errno;
    bool denied = err == EACCES || err == EROFS || err == EPERM;
    ErrorCode code = (mode == Mode::ReadWrite && denied) ? ErrorCode::ReadOnly : ErrorCode::Io;
    return setError(outError, code,
                    fmt::format("Failed to open file: {} (errno: {})", path.string(), err));
  }

  // Directories open fine for reading on POSIX; refuse them here
  struct stat st;
  if (fstat(fd_, &st) < 0 || !S_ISREG(st.st_mode)) {
    close();
    return setError(outError, ErrorCode::Io,
                    fmt::format("Not a regular file: {}", path.string()));
  }
  return true;
}

bool FileHandle::seek(uint64_t offset, Error *outError) {
  if (::lseek(fd_, static_cast<off_t>(offset), SEEK_SET) < 0) {
    return setError(outError, ErrorCode::Io,
                    fmt::format("Failed to seek to {} in {} (errno: {})", offset, path_.string(),
                                errno));
  }
  return true;
}

std::optional<size_t> FileHandle::read(std::span<uint8_t> buffer, Error *outError) {
  for (;;) {
    ssize_t got = ::read(fd_, buffer.data(), buffer.size());
    if (got >= 0) {
      return static_cast<size_t>(got);
    }
    if (errno != EINTR) {
      setError(outError, ErrorCode::Io,
               fmt::format("Failed to read from {} (errno: {})", path_.string(), errno));
      return std::nullopt;
    }
  }
}

bool FileHandle::write(std::span<const uint8_t> data, Error *outError) {
  while (!data.empty()) {
    ssize_t put = ::write(fd_, data.data(), data.size());
    if (put < 0) {
      if (errno == EINTR) {
        continue;
      }
      return setError(outError, ErrorCode::Io,
                      fmt::format("Failed to write to {} (errno: {})", path_.string(), errno));
    }
    data = data.subspan(static_cast<size_t>(put));
  }
  return true;
}

std::optional<uint64_t> FileHandle::size(Error *outError) {
  struct stat st;
  if (fstat(fd_, &st) < 0) {
    setError(outError, ErrorCode::Io,
             fmt::format("Failed to get file size: {} (errno: {})", path_.string(), errno));
    return std::nullopt;
  }
  return static_cast<uint64_t>(st.st_size);
}

bool FileHandle::truncate(uint64_t length, Error *outError) {
  if (::ftruncate(fd_, static_cast<off_t>(length)) < 0) {
    return setError(outError, ErrorCode::Io,
                    fmt::format("Failed to truncate {} to {} bytes (errno: {})", path_.string(),
                                length, errno));
  }
  return true;
}

bool FileHandle::sync(Error *outError) {
  if (::fsync(fd_) < 0) {
    return setError(outError, ErrorCode::Io,
                    fmt::format("Failed to sync {} (errno: {})", path_.string(), errno));
  }
  return true;
}

#endif

} // namespace detail

// ---------------------------------------------------------------------------
// FileSource

std::unique_ptr<FileSource> FileSource::open(const std::filesystem::path &path,
                                             Error *outError) {
  auto source = std::make_unique<FileSource>();
  if (!source->file_.open(path, detail::FileHandle::Mode::Read, outError)) {
    return nullptr;
  }
  return source;
}

bool FileSource::seek(uint64_t offset, Error *outError) {
  return file_.seek(offset, outError);
}

std::optional<size_t> FileSource::read(std::span<uint8_t> buffer, Error *outError) {
  return file_.read(buffer, outError);
}

std::optional<uint64_t> FileSource::size(Error *outError) {
  return file_.size(outError);
}

// ---------------------------------------------------------------------------
// FileStore

std::unique_ptr<FileStore> FileStore::open(const std::filesystem::path &path, Error *outError) {
  auto store = std::make_unique<FileStore>();
  if (!store->file_.open(path, detail::FileHandle::Mode::ReadWrite, outError)) {
    return nullptr;
  }
  return store;
}

std::unique_ptr<FileStore> FileStore::create(const std::filesystem::path &path,
                                             Error *outError) {
  auto store = std::make_unique<FileStore>();
  if (!store->file_.open(path, detail::FileHandle::Mode::Create, outError)) {
    return nullptr;
  }
  return store;
}

bool FileStore::seek(uint64_t offset, Error *outError) {
  return file_.seek(offset, outError);
}

std::optional<size_t> FileStore::read(std::span<uint8_t> buffer, Error *outError) {
  return file_.read(buffer, outError);
}

std::optional<uint64_t> FileStore::size(Error *outError) {
  return file_.size(outError);
}

bool FileStore::write(std::span<const uint8_t> data, Error *outError) {
  return file_.write(data, outError);
}

bool FileStore::truncate(uint64_t length, Error *outError) {
  return file_.truncate(length, outError);
}

bool FileStore::sync(Error *outError) {
  return file_.sync(outError);
}

// ---------------------------------------------------------------------------
// MemoryView

bool MemoryView::seek(uint64_t offset, Error *) {
  cursor_ = offset;
  return true;
}

std::optional<size_t> MemoryView::read(std::span<uint8_t> buffer, Error *) {
  if (cursor_ >= data_.size()) {
    return 0;
  }
  size_t count = static_cast<size_t>(std::min<uint64_t>(buffer.size(), data_.size() - cursor_));
  std::memcpy(buffer.data(), data_.data() + cursor_, count);
  cursor_ += count;
  return count;
}

std::optional<uint64_t> MemoryView::size(Error *) {
  return data_.size();
}

// ---------------------------------------------------------------------------
// MemoryStore

bool MemoryStore::seek(uint64_t offset, Error *) {
  cursor_ = offset;
  return true;
}

std::optional<size_t> MemoryStore::read(std::span<uint8_t> buffer, Error *) {
  if (cursor_ >= bytes_.size()) {
    return 0;
  }
  size_t count = static_cast<size_t>(std::min<uint64_t>(buffer.size(), bytes_.size() - cursor_));
  std::memcpy(buffer.data(), bytes_.data() + cursor_, count);
  cursor_ += count;
  return count;
}

std::optional<uint64_t> MemoryStore::size(Error *) {
  return bytes_.size();
}

bool MemoryStore::write(std::span<const uint8_t> data, Error *) {
  uint64_t end = cursor_ + data.size();
  if (end > bytes_.size()) {
    bytes_.resize(static_cast<size_t>(end), 0); // Gaps past the old end read back as zeros
  }
  if (!data.empty()) {
    std::memcpy(bytes_.data() + cursor_, data.data(), data.size());
  }
  cursor_ = end;
  return true;
}

bool MemoryStore::truncate(uint64_t length, Error *) {
  bytes_.resize(static_cast<size_t>(length), 0);
  return true;
}

bool MemoryStore::sync(Error *) {
  return true;
}

} // namespace pakx
