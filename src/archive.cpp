#include <fstream>
#include <system_error>

#include <spdlog/spdlog.h>

#include <mpqx/archive.hpp>
#include <mpqx/crypto.hpp>
#include <mpqx/header.hpp>
#include <mpqx/sector_reader.hpp>

#include "error.hpp"

namespace mpqx {

namespace {

// Returns the table bytes starting at pos, or fails if pos is past the end
std::optional<std::span<const uint8_t>> tableBytes(std::span<const uint8_t> archive, uint64_t pos,
                                                   std::string_view table, Error *outError) {
  if (pos > archive.size()) {
    detail::setError(outError, ErrorCode::TruncatedArchive,
                     "{} at {:#x} starts past the end of the archive ({} bytes)", table, pos,
                     archive.size());
    return std::nullopt;
  }
  return archive.subspan(pos);
}

std::string describe(const FileHandle &handle) {
  if (handle.name()) {
    return *handle.name();
  }
  return fmt::format("block #{}", handle.blockIndex());
}

} // namespace

std::optional<std::filesystem::path> extractionPath(const std::filesystem::path &outputDir,
                                                    std::string_view name, Error *outError) {
  std::string relative(name);
  for (char &c : relative) {
    if (c == '\\') {
      c = '/';
    }
  }

  std::filesystem::path entry = std::filesystem::path(relative).lexically_normal();
  if (entry.empty() || entry == "." || entry.has_root_path() || *entry.begin() == "..") {
    detail::setError(outError, ErrorCode::UnsafePath,
                     "Refusing to extract {} outside of {}", name, outputDir.string());
    return std::nullopt;
  }

  return outputDir / entry;
}

Archive::Archive() = default;
Archive::~Archive() = default;
Archive::Archive(Archive &&) noexcept = default;
Archive &Archive::operator=(Archive &&) noexcept = default;

std::optional<Archive> Archive::open(const std::filesystem::path &path, Error *outError) {
  return open(path, OpenOptions{}, outError);
}

std::optional<Archive> Archive::open(const std::filesystem::path &path,
                                     const OpenOptions &options, Error *outError) {
  Archive archive;
  if (!archive.mappedFile_.open(path, outError)) {
    return std::nullopt;
  }
  archive.mapped_ = true;
  archive.options_ = options;

  if (!archive.load(outError)) {
    return std::nullopt;
  }

  spdlog::debug("Opened {}", path.string());
  return archive;
}

std::optional<Archive> Archive::openMemory(std::vector<uint8_t> bytes, Error *outError) {
  return openMemory(std::move(bytes), OpenOptions{}, outError);
}

std::optional<Archive> Archive::openMemory(std::vector<uint8_t> bytes, const OpenOptions &options,
                                           Error *outError) {
  Archive archive;
  archive.buffer_ = std::move(bytes);
  archive.options_ = options;

  if (!archive.load(outError)) {
    return std::nullopt;
  }
  return archive;
}

bool Archive::load(Error *outError) {
  auto header = parseHeader(bytes(), options_, outError);
  if (!header) {
    return false;
  }
  header_ = *header;

  auto archive = archiveBytes();

  auto hashBytes = tableBytes(archive, header_.hashTablePos(), "Hash table", outError);
  if (!hashBytes) {
    return false;
  }
  auto hashIndex = HashIndex::load(*hashBytes, header_.hashTableSize, outError);
  if (!hashIndex) {
    return false;
  }

  auto blockBytes = tableBytes(archive, header_.blockTablePos(), "Block table", outError);
  if (!blockBytes) {
    return false;
  }

  std::span<const uint8_t> hiBytes;
  if (header_.formatVersion >= 1 && header_.hiBlockTableOffset != 0) {
    auto hi = tableBytes(archive, header_.hiBlockTableOffset, "Hi-block table", outError);
    if (!hi) {
      return false;
    }
    hiBytes = *hi;
  }

  auto blockIndex = BlockIndex::load(*blockBytes, header_.blockTableSize, hiBytes, outError);
  if (!blockIndex) {
    return false;
  }

  hashIndex_ = std::move(*hashIndex);
  blockIndex_ = std::move(*blockIndex);
  codecs_ = CodecRegistry::withDefaults();
  open_ = true;

  spdlog::debug("MPQ archive at {:#x}: format {}, sector size {}, {} hash entries, {} blocks",
                header_.archiveOffset, header_.formatVersion, header_.sectorSize(),
                hashIndex_.size(), blockIndex_.size());
  return true;
}

std::span<const uint8_t> Archive::bytes() const {
  if (mapped_) {
    return mappedFile_.data();
  }
  return buffer_;
}

std::span<const uint8_t> Archive::archiveBytes() const {
  return bytes().subspan(header_.archiveOffset);
}

std::optional<FileHandle> Archive::resolve(uint32_t blockIndex, uint32_t hashIndex,
                                           uint16_t locale, std::optional<std::string> name,
                                           Error *outError) const {
  const BlockEntry *entry = blockIndex_.get(blockIndex, outError);
  if (!entry) {
    return std::nullopt;
  }

  if (!entry->exists()) {
    detail::setError(outError, ErrorCode::FileDeleted, "File {} has been deleted",
                     name ? *name : fmt::format("block #{}", blockIndex));
    return std::nullopt;
  }

  FileHandle handle;
  handle.blockIndex_ = blockIndex;
  handle.hashIndex_ = hashIndex;
  handle.locale_ = locale;
  handle.entry_ = *entry;
  handle.name_ = std::move(name);
  return handle;
}

std::optional<FileHandle> Archive::openFile(std::string_view name, Error *outError) const {
  return openFile(name, options_.defaultLocale, outError);
}

std::optional<FileHandle> Archive::openFile(std::string_view name, uint16_t locale,
                                            Error *outError) const {
  if (!open_) {
    detail::setError(outError, ErrorCode::NotOpen, "Archive is not open");
    return std::nullopt;
  }

  auto match = hashIndex_.find(name, locale, outError);
  if (!match) {
    return std::nullopt;
  }

  return resolve(match->blockIndex, match->hashIndex, match->locale, std::string(name), outError);
}

std::optional<FileHandle> Archive::openFileByIndex(uint32_t blockIndex, Error *outError) const {
  if (!open_) {
    detail::setError(outError, ErrorCode::NotOpen, "Archive is not open");
    return std::nullopt;
  }
  return resolve(blockIndex, kHashEntryEmpty, kLocaleNeutral, std::nullopt, outError);
}

bool Archive::hasFile(std::string_view name) const {
  return openFile(name).has_value();
}

uint64_t Archive::size(const FileHandle &handle) const {
  return handle.entry().fileSize;
}

std::optional<size_t> Archive::read(const FileHandle &handle, std::span<uint8_t> buffer,
                                    Error *outError) const {
  if (!open_) {
    detail::setError(outError, ErrorCode::NotOpen, "Archive is not open");
    return std::nullopt;
  }

  const BlockEntry *entry = blockIndex_.get(handle.blockIndex(), outError);
  if (!entry) {
    return std::nullopt;
  }

  if (buffer.size() < entry->fileSize) {
    detail::setError(outError, ErrorCode::BufferTooSmall,
                     "Buffer holds {} bytes, {} needs {}", buffer.size(), describe(handle),
                     entry->fileSize);
    return std::nullopt;
  }

  std::optional<uint32_t> key;
  if (handle.name()) {
    key = fileKey(*handle.name(), entry->offset, entry->fileSize, entry->flags);
  }

  SectorReader reader(archiveBytes(), header_.sectorSize(), codecs_);

  Error error;
  if (!reader.read(*entry, key, 0, buffer.first(entry->fileSize), &error)) {
    spdlog::warn("Failed to read {}: {}", describe(handle), error.message);
    if (outError) {
      *outError = std::move(error);
    }
    return std::nullopt;
  }

  return entry->fileSize;
}

std::optional<std::vector<uint8_t>> Archive::extractToMemory(const FileHandle &handle,
                                                             Error *outError) const {
  std::vector<uint8_t> result(size(handle));
  auto bytesRead = read(handle, result, outError);
  if (!bytesRead) {
    return std::nullopt;
  }
  result.resize(*bytesRead);
  return result;
}

bool Archive::extract(const FileHandle &handle, const std::filesystem::path &destPath,
                      Error *outError) const {
  auto data = extractToMemory(handle, outError);
  if (!data) {
    return false;
  }

  std::error_code ec;
  if (destPath.has_parent_path()) {
    std::filesystem::create_directories(destPath.parent_path(), ec);
    if (ec) {
      detail::setError(outError, ErrorCode::Io, "Failed to create directory {}: {}",
                       destPath.parent_path().string(), ec.message());
      return false;
    }
  }

  std::ofstream out(destPath, std::ios::binary);
  if (!out) {
    detail::setError(outError, ErrorCode::Io, "Failed to create output file: {}",
                     destPath.string());
    return false;
  }

  out.write(reinterpret_cast<const char *>(data->data()),
            static_cast<std::streamsize>(data->size()));
  if (!out) {
    detail::setError(outError, ErrorCode::Io, "Failed to write to output file: {}",
                     destPath.string());
    return false;
  }

  return true;
}

std::optional<std::vector<std::string>> Archive::listFile(Error *outError) const {
  auto handle = openFile(kListFileName, outError);
  if (!handle) {
    return std::nullopt;
  }

  auto data = extractToMemory(*handle, outError);
  if (!data) {
    return std::nullopt;
  }

  // Names are separated by ';', CR or LF
  std::vector<std::string> names;
  std::string current;
  for (uint8_t c : *data) {
    if (c == ';' || c == '\r' || c == '\n') {
      if (!current.empty()) {
        names.push_back(std::move(current));
        current.clear();
      }
      continue;
    }
    current += static_cast<char>(c);
  }
  if (!current.empty()) {
    names.push_back(std::move(current));
  }

  return names;
}

void Archive::close() {
  mappedFile_.close();
  buffer_.clear();
  mapped_ = false;
  open_ = false;
  header_ = Header{};
  hashIndex_ = HashIndex{};
  blockIndex_ = BlockIndex{};
  codecs_ = CodecRegistry{};
}

} // namespace mpqx
