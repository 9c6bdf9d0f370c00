#pragma once

// MPQ Archive Library
// A modern C++20 library for reading the MPQ archive format used by
// Blizzard games (Diablo, StarCraft, Warcraft III and others).

#include "archive.hpp"
#include "block_index.hpp"
#include "compression.hpp"
#include "crypto.hpp"
#include "hash_index.hpp"
#include "header.hpp"
#include "sector_reader.hpp"
#include "types.hpp"

// The library provides two levels of abstraction:
//
// 1. Low-level: parseHeader, HashIndex, BlockIndex, SectorReader, CodecRegistry
//    - Direct access to the on-disk structures and the decode pipeline
//
// 2. High-level: Archive class
//    - Opens a file or memory buffer, resolves names and reads whole files
//
// Example usage:
//
//   mpqx::Error error;
//   auto archive = mpqx::Archive::open("patch.mpq", &error);
//   if (archive) {
//     auto handle = archive->openFile("units\\human\\footman.txt", &error);
//     if (handle) {
//       auto data = archive->extractToMemory(*handle, &error);
//     }
//   }

namespace mpqx {}
