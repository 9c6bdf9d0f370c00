#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace mpqx {

// Signatures of the archive header and the optional user-data header
inline constexpr uint32_t kHeaderSignature = 0x1A51504D;   // "MPQ\x1A"
inline constexpr uint32_t kUserDataSignature = 0x1B51504D; // "MPQ\x1B"

// Header sizes for format version 0 and 1
inline constexpr size_t kHeaderSizeV1 = 0x20;
inline constexpr size_t kHeaderSizeV2 = 0x2C;
inline constexpr size_t kUserDataHeaderSize = 0x10;

// The header is searched for at multiples of this value
inline constexpr size_t kHeaderAlignment = 0x200;

// Block table flags
inline constexpr uint32_t kFileImplode = 0x00000100;
inline constexpr uint32_t kFileCompress = 0x00000200;
inline constexpr uint32_t kFileEncrypted = 0x00010000;
inline constexpr uint32_t kFileFixKey = 0x00020000;
inline constexpr uint32_t kFilePatchFile = 0x00100000;
inline constexpr uint32_t kFileSingleUnit = 0x01000000;
inline constexpr uint32_t kFileDeleteMarker = 0x02000000;
inline constexpr uint32_t kFileSectorCrc = 0x04000000;
inline constexpr uint32_t kFileExists = 0x80000000;
inline constexpr uint32_t kFileCompressMask = kFileImplode | kFileCompress;

// Hash table sentinels stored in the block index field
inline constexpr uint32_t kHashEntryEmpty = 0xFFFFFFFF;
inline constexpr uint32_t kHashEntryDeleted = 0xFFFFFFFE;

// Neutral (default) locale
inline constexpr uint16_t kLocaleNeutral = 0;

// Parsed archive header (immutable after open)
struct Header {
  uint64_t archiveOffset = 0;      // Absolute position of the header in the stream
  uint64_t userDataOffset = 0;     // Absolute position of the user-data header, if any
  bool hasUserData = false;

  uint32_t headerSize = 0;
  uint32_t archiveSize = 0;
  uint16_t formatVersion = 0;      // 0 = original, 1 = extended
  uint16_t sectorSizeShift = 0;
  uint32_t hashTableOffset = 0;    // Low 32 bits, relative to archiveOffset
  uint32_t blockTableOffset = 0;   // Low 32 bits, relative to archiveOffset
  uint32_t hashTableSize = 0;      // Entries
  uint32_t blockTableSize = 0;     // Entries

  // Format version 1 only
  uint64_t hiBlockTableOffset = 0;
  uint16_t hashTableOffsetHigh = 0;
  uint16_t blockTableOffsetHigh = 0;

  uint32_t sectorSize() const { return 0x200u << sectorSizeShift; }

  uint64_t hashTablePos() const {
    return (static_cast<uint64_t>(hashTableOffsetHigh) << 32) | hashTableOffset;
  }

  uint64_t blockTablePos() const {
    return (static_cast<uint64_t>(blockTableOffsetHigh) << 32) | blockTableOffset;
  }
};

enum class SlotState { Empty, Deleted, Occupied };

// One 16-byte hash table record
struct HashEntry {
  uint32_t nameA = 0;
  uint32_t nameB = 0;
  uint16_t locale = 0;
  uint16_t platform = 0;
  uint32_t blockIndex = kHashEntryEmpty;

  static constexpr size_t entrySize = 16;

  SlotState state() const {
    if (blockIndex == kHashEntryEmpty) {
      return SlotState::Empty;
    }
    if (blockIndex == kHashEntryDeleted) {
      return SlotState::Deleted;
    }
    return SlotState::Occupied;
  }
};

// One 16-byte block table record, with the hi-block bits merged into offset
struct BlockEntry {
  uint64_t offset = 0;         // Relative to the archive start
  uint32_t compressedSize = 0;
  uint32_t fileSize = 0;
  uint32_t flags = 0;

  static constexpr size_t entrySize = 16;

  bool exists() const { return (flags & kFileExists) != 0; }
  bool isCompressed() const { return (flags & kFileCompressMask) != 0; }
  bool isEncrypted() const { return (flags & kFileEncrypted) != 0; }
  bool isSingleUnit() const { return (flags & kFileSingleUnit) != 0; }
};

enum class ErrorCode {
  None,
  // Format
  InvalidSignature,
  TruncatedHeader,
  UnsupportedVersion,
  CorruptIndex,
  // Lookup
  FileNotFound,
  LocaleNotFound,
  FileDeleted,
  IndexOutOfRange,
  // Integrity
  UnsupportedCompressionMethod,
  SectorSizeMismatch,
  DecompressionFailed,
  CorruptSectorTable,
  DecryptionKeyUnavailable,
  UnsupportedFileType,
  // Io
  Io,
  TruncatedArchive,
  // Usage
  BufferTooSmall,
  InvalidRange,
  NotOpen,
  UnsafePath,
};

enum class ErrorCategory { None, Format, Lookup, Integrity, Io, Usage };

struct Error {
  ErrorCode code = ErrorCode::None;
  std::string message;

  ErrorCategory category() const;
};

std::string_view toString(ErrorCode code);

// Options for Archive::open / Archive::openMemory
struct OpenOptions {
  bool searchForHeader = true;          // Scan past leading bytes for the header
  uint16_t defaultLocale = kLocaleNeutral; // Used by openFile(name)
};

class Archive;

// Resolved file. Only valid with the archive that produced it.
class FileHandle {
public:
  uint32_t blockIndex() const { return blockIndex_; }
  uint32_t hashIndex() const { return hashIndex_; }
  uint16_t locale() const { return locale_; }
  const BlockEntry &entry() const { return entry_; }

  // Name used to resolve the file; absent for handles opened by index
  const std::optional<std::string> &name() const { return name_; }

private:
  friend class Archive;

  uint32_t blockIndex_ = 0;
  uint32_t hashIndex_ = kHashEntryEmpty;
  uint16_t locale_ = kLocaleNeutral;
  BlockEntry entry_;
  std::optional<std::string> name_;
};

} // namespace mpqx
