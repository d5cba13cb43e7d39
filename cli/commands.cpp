#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <type_traits>
#include <variant>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <pakx/pakx.hpp>

#include "cli.hpp"

namespace fs = std::filesystem;

namespace pakx::cli {

namespace {

constexpr int exitFailure = 1;

int fail(const Error &error) {
  std::cerr << "error: " << error.describe() << "\n";
  return exitFailure;
}

int fail(ErrorCode code, const std::string &message) {
  return fail(Error{code, message});
}

// Entry name for a file on disk: relative, forward slashes, no "." or ".." parts
std::optional<std::string> entryNameFor(const fs::path &path) {
  fs::path normal = path.lexically_normal().relative_path();
  for (const auto &part : normal) {
    if (part == "..") {
      return std::nullopt;
    }
  }
  std::string name = normal.generic_string();
  if (name.empty() || name == ".") {
    return std::nullopt;
  }
  return name;
}

// Streams one file into the archive in ioChunkSize pieces
bool addFile(Archive &archive, const std::string &name, const fs::path &source,
             const InsertOptions &options, Error *outError) {
  std::ifstream in(source, std::ios::binary);
  if (!in) {
    return setError(outError, ErrorCode::Io,
                    fmt::format("Failed to open source file: {}", source.string()));
  }

  auto writer = archive.beginInsert(name, options, outError);
  if (!writer) {
    return false;
  }

  std::vector<uint8_t> buffer(archive.options().ioChunkSize);
  while (in) {
    in.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    auto got = static_cast<size_t>(in.gcount());
    if (got > 0 && !writer->write(std::span<const uint8_t>(buffer.data(), got), outError)) {
      return false;
    }
  }
  if (in.bad()) {
    return setError(outError, ErrorCode::Io,
                    fmt::format("Failed to read source file: {}", source.string()));
  }
  return writer->finish(outError);
}

int runList(const CmdList &cmd) {
  Error error;
  auto reader = Reader::open(fs::path(cmd.archive), &error);
  if (!reader) {
    return fail(error);
  }
  for (const auto &name : reader->list()) {
    std::cout << name << "\n";
  }
  return 0;
}

int runInfo(const CmdInfo &cmd) {
  Error error;
  auto reader = Reader::open(fs::path(cmd.archive), &error);
  if (!reader) {
    return fail(error);
  }

  ArchiveStats stats = reader->stats();
  std::cout << fmt::format("Archive:       {}\n", cmd.archive);
  std::cout << fmt::format("Size:          {} bytes\n", stats.fileSize);
  std::cout << fmt::format("Index:         {} / {} slots ({} tombstones)\n", stats.entryCount,
                           stats.capacity, stats.tombstoneCount);
  std::cout << fmt::format("Data offset:   {}\n", stats.dataOffset);
  std::cout << fmt::format("Stored bytes:  {}\n", stats.storedBytes);
  std::cout << fmt::format("Free bytes:    {} in {} regions\n", stats.freeBytes,
                           stats.freeRegionCount);
  std::cout << fmt::format("Fragmentation: {:.1f}%\n", stats.fragmentation() * 100.0);
  return 0;
}

int runExtract(const CmdExtract &cmd) {
  Error error;
  auto reader = Reader::open(fs::path(cmd.archive), &error);
  if (!reader) {
    return fail(error);
  }

  std::vector<std::string> names = cmd.names;
  if (names.empty()) {
    auto all = reader->list();
    names.assign(all.begin(), all.end());
  }

  fs::path outDir(cmd.outDir);
  std::error_code ec;
  if (fs::exists(outDir, ec) && !fs::is_directory(outDir, ec)) {
    return fail(ErrorCode::Io,
                fmt::format("Output path exists and is not a directory: {}", outDir.string()));
  }

  // Everything is checked before the first file is written
  std::set<std::string> seen;
  for (const auto &name : names) {
    if (!reader->contains(name)) {
      return fail(ErrorCode::NotFound, fmt::format("Entry not found: {}", name));
    }
    if (!isContainedPath(name)) {
      return fail(ErrorCode::InvalidName,
                  fmt::format("Refusing to extract outside the output directory: {}", name));
    }
    if (!seen.insert(name).second) {
      return fail(ErrorCode::AlreadyExists, fmt::format("Entry named twice: {}", name));
    }
    if (fs::exists(outDir / name, ec)) {
      return fail(ErrorCode::AlreadyExists,
                  fmt::format("Output file already exists: {}", (outDir / name).string()));
    }
  }

  for (const auto &name : names) {
    if (!reader->extract(name, outDir / name, &error)) {
      return fail(error);
    }
    spdlog::debug("Extracted {}", name);
  }

  spdlog::info("Extracted {} entries to {}", names.size(), outDir.string());
  return 0;
}

struct PendingInput {
  std::string name;
  fs::path source;
};

int runAdd(const CmdAdd &cmd) {
  // Collect and validate every input before touching the archive
  std::vector<PendingInput> inputs;
  std::error_code ec;
  fs::path archivePath(cmd.archive);
  fs::path archiveCanonical = fs::weakly_canonical(archivePath, ec);
  auto isArchive = [&](const fs::path &path) {
    std::error_code canonicalError;
    return fs::weakly_canonical(path, canonicalError) == archiveCanonical;
  };

  for (const auto &input : cmd.inputs) {
    fs::path path(input);
    auto status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
      return fail(ErrorCode::NotFound, fmt::format("Input not found: {}", input));
    }

    if (fs::is_directory(status)) {
      for (auto it = fs::recursive_directory_iterator(path, ec);
           !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_directory(ec)) {
          continue;
        }
        if (!it->is_regular_file(ec)) {
          spdlog::warn("Omitting {} as it is not a regular file or directory",
                       it->path().string());
          continue;
        }
        if (!isArchive(it->path())) {
          inputs.push_back(PendingInput{"", it->path()});
        }
      }
      if (ec) {
        return fail(ErrorCode::Io, fmt::format("Failed to walk {}: {}", input, ec.message()));
      }
    } else if (fs::is_regular_file(status)) {
      if (isArchive(path)) {
        return fail(ErrorCode::InvalidName,
                    fmt::format("Cannot add the archive to itself: {}", input));
      }
      inputs.push_back(PendingInput{"", path});
    } else {
      return fail(ErrorCode::Io, fmt::format("Not a regular file or directory: {}", input));
    }
  }

  std::set<std::string> seen;
  for (auto &input : inputs) {
    auto name = entryNameFor(input.source);
    if (!name) {
      return fail(ErrorCode::InvalidName,
                  fmt::format("Cannot derive an entry name from {}", input.source.string()));
    }
    Error error;
    if (!validateName(*name, &error)) {
      return fail(error);
    }
    if (!seen.insert(*name).second) {
      return fail(ErrorCode::AlreadyExists, fmt::format("Input given twice: {}", *name));
    }
    input.name = std::move(*name);
  }

  // Every input must be readable before the archive is touched
  for (const auto &input : inputs) {
    std::ifstream readable(input.source, std::ios::binary);
    if (!readable) {
      return fail(ErrorCode::Io,
                  fmt::format("Failed to open source file: {}", input.source.string()));
    }
  }

  Error error;
  std::optional<Archive> archive;
  if (fs::exists(archivePath, ec)) {
    archive = Archive::open(archivePath, &error);
  } else {
    spdlog::info("Creating {}", cmd.archive);
    archive = Archive::create(archivePath, &error);
  }
  if (!archive) {
    return fail(error);
  }

  if (!cmd.overwrite) {
    for (const auto &input : inputs) {
      if (archive->contains(input.name)) {
        return fail(ErrorCode::AlreadyExists,
                    fmt::format("Entry already exists: {} (use -o to overwrite)", input.name));
      }
    }
  }

  InsertOptions options;
  options.compress = cmd.level.has_value();
  options.compressionLevel = cmd.level;
  options.replace = cmd.overwrite;
  for (const auto &input : inputs) {
    if (!addFile(*archive, input.name, input.source, options, &error)) {
      return fail(error);
    }
    std::cout << input.name << "\n";
  }

  if (cmd.repack && !archive->repack(&error)) {
    return fail(error);
  }
  if (!archive->flush(&error)) {
    return fail(error);
  }

  spdlog::info("Added {} entries", inputs.size());
  return 0;
}

int runRemove(const CmdRemove &cmd) {
  Error error;
  auto archive = Archive::open(fs::path(cmd.archive), &error);
  if (!archive) {
    return fail(error);
  }

  std::set<std::string> seen;
  for (const auto &name : cmd.names) {
    if (!archive->contains(name)) {
      return fail(ErrorCode::NotFound, fmt::format("Entry not found: {}", name));
    }
    if (!seen.insert(name).second) {
      return fail(ErrorCode::AlreadyExists, fmt::format("Entry named twice: {}", name));
    }
  }

  for (const auto &name : cmd.names) {
    if (!archive->remove(name, &error)) {
      return fail(error);
    }
  }
  if (!archive->flush(&error)) {
    return fail(error);
  }

  spdlog::info("Removed {} entries", cmd.names.size());
  return 0;
}

int runRename(const CmdRename &cmd) {
  Error error;
  auto archive = Archive::open(fs::path(cmd.archive), &error);
  if (!archive) {
    return fail(error);
  }
  bool renamed = cmd.overwrite ? archive->replace(cmd.from, cmd.to, &error)
                               : archive->rename(cmd.from, cmd.to, &error);
  if (!renamed || !archive->flush(&error)) {
    return fail(error);
  }
  return 0;
}

int runRepack(const CmdRepack &cmd) {
  Error error;
  auto archive = Archive::open(fs::path(cmd.archive), &error);
  if (!archive) {
    return fail(error);
  }

  uint64_t before = archive->stats().fileSize;
  if (!archive->repack(&error)) {
    return fail(error);
  }
  spdlog::info("Repacked {}: {} -> {} bytes", cmd.archive, before, archive->stats().fileSize);
  return 0;
}

int runCompress(const CmdCompress &cmd) {
  Error error;
  auto archive = Archive::open(fs::path(cmd.archive), &error);
  if (!archive) {
    return fail(error);
  }

  auto all = archive->list();
  std::vector<std::string> names(all.begin(), all.end());

  // A damaged entry is found before the first one is rewritten
  ByteSink discard = [](std::span<const uint8_t>) {};
  for (const auto &name : names) {
    if (!archive->extract(name, discard, &error)) {
      return fail(error);
    }
  }

  InsertOptions options;
  options.compress = true;
  options.compressionLevel = cmd.level;
  options.replace = true;
  for (const auto &name : names) {
    auto data = archive->get(name, &error);
    if (!data || !archive->insert(name, *data, options, &error)) {
      return fail(error);
    }
    std::cout << name << "\n";
  }

  if (!archive->repack(&error)) {
    return fail(error);
  }
  spdlog::info("Compressed {} entries at level {}", names.size(), cmd.level);
  return 0;
}

} // namespace

int runCommand(const Command &cmd) {
  return std::visit(
      [](const auto &c) -> int {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, CmdList>) {
          return runList(c);
        } else if constexpr (std::is_same_v<T, CmdInfo>) {
          return runInfo(c);
        } else if constexpr (std::is_same_v<T, CmdExtract>) {
          return runExtract(c);
        } else if constexpr (std::is_same_v<T, CmdAdd>) {
          return runAdd(c);
        } else if constexpr (std::is_same_v<T, CmdRemove>) {
          return runRemove(c);
        } else if constexpr (std::is_same_v<T, CmdRename>) {
          return runRename(c);
        } else if constexpr (std::is_same_v<T, CmdRepack>) {
          return runRepack(c);
        } else if constexpr (std::is_same_v<T, CmdCompress>) {
          return runCompress(c);
        } else {
          printUsage();
          return 0;
        }
      },
      cmd);
}

} // namespace pakx::cli
