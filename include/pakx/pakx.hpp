#pragma once

// pakx Archive Library
// A C++20 library for reading and editing single-file archives of named,
// optionally deflated entries with an open-addressing on-disk index.

#include "archive.hpp"
#include "reader.hpp"
#include "store.hpp"
#include "types.hpp"

// The library provides three levels of abstraction:
//
// 1. Records: format.hpp
//    - Fixed-size header and index slot codecs, name hashing
//
// 2. Operations: resumable.hpp / transport.hpp
//    - Decoders and encoders that request IO instead of performing it
//    - A Transport runs them over any ReadableStore / WritableStore
//
// 3. Handles: Reader / Archive
//    - Reader::open() for read-only access over any store
//    - Archive::create() / Archive::open() for in-place edits
//
// Example usage:
//
//   // Reading an archive
//   auto reader = pakx::Reader::open("assets.pakx");
//   if (reader) {
//     for (const auto &name : reader->list()) {
//       std::cout << name << std::endl;
//     }
//     auto bytes = reader->get("data/file.txt");
//   }
//
//   // Editing an archive
//   pakx::Error error;
//   auto archive = pakx::Archive::create("assets.pakx", &error);
//   archive->insertOrReplace("data/file.txt", bytes, true);
//   archive->remove("old.txt");
//   archive->repack();

namespace pakx {}
