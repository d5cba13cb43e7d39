#include <fmt/format.h>

#include <pakx/types.hpp>

namespace pakx {

const char *toString(ErrorCode code) noexcept {
  switch (code) {
  case ErrorCode::Io:
    return "IoError";
  case ErrorCode::UnexpectedEof:
    return "UnexpectedEof";
  case ErrorCode::BadMagic:
    return "BadMagic";
  case ErrorCode::UnsupportedVersion:
    return "UnsupportedVersion";
  case ErrorCode::CorruptHeader:
    return "CorruptHeader";
  case ErrorCode::CorruptSlot:
    return "CorruptSlot";
  case ErrorCode::IntegrityMismatch:
    return "IntegrityMismatch";
  case ErrorCode::NotFound:
    return "NotFound";
  case ErrorCode::AlreadyExists:
    return "AlreadyExists";
  case ErrorCode::ReadOnly:
    return "ReadOnly";
  case ErrorCode::CompressionFailed:
    return "CompressionFailed";
  case ErrorCode::InvalidName:
    return "InvalidName";
  }
  return "Unknown";
}

std::string Error::describe() const {
  return fmt::format("{}: {}", toString(code), message);
}

bool setError(Error *outError, ErrorCode code, std::string message) {
  if (outError) {
    outError->code = code;
    outError->message = std::move(message);
  }
  return false;
}

} // namespace pakx
