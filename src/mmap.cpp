#include <mpqx/mmap.hpp>

#include "error.hpp"

#ifdef _WIN32
#include <windows.h>
#else
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace mpqx {

MappedFile::MappedFile() = default;

MappedFile::~MappedFile() {
  cleanup();
}

MappedFile::MappedFile(MappedFile &&other) noexcept
    :
#ifdef _WIN32
      fileHandle_(other.fileHandle_), mappingHandle_(other.mappingHandle_),
#else
      fd_(other.fd_),
#endif
      data_(other.data_), size_(other.size_) {
#ifdef _WIN32
  other.fileHandle_ = nullptr;
  other.mappingHandle_ = nullptr;
#else
  other.fd_ = -1;
#endif
  other.data_ = nullptr;
  other.size_ = 0;
}

MappedFile &MappedFile::operator=(MappedFile &&other) noexcept {
  if (this != &other) {
    cleanup();

#ifdef _WIN32
    fileHandle_ = other.fileHandle_;
    mappingHandle_ = other.mappingHandle_;
    other.fileHandle_ = nullptr;
    other.mappingHandle_ = nullptr;
#else
    fd_ = other.fd_;
    other.fd_ = -1;
#endif
    data_ = other.data_;
    size_ = other.size_;
    other.data_ = nullptr;
    other.size_ = 0;
  }
  return *this;
}

bool MappedFile::open(const std::filesystem::path &path, Error *outError) {
  close();

#ifdef _WIN32
  fileHandle_ = CreateFileW(path.c_str(), GENERIC_READ, FILE_SHARE_READ, nullptr, OPEN_EXISTING,
                            FILE_ATTRIBUTE_NORMAL, nullptr);
  if (fileHandle_ == INVALID_HANDLE_VALUE) {
    fileHandle_ = nullptr;
    detail::setError(outError, ErrorCode::Io, "Failed to open {} (error: {})", path.string(),
                     GetLastError());
    return false;
  }

  LARGE_INTEGER fileSize;
  if (!GetFileSizeEx(static_cast<HANDLE>(fileHandle_), &fileSize)) {
    detail::setError(outError, ErrorCode::Io, "Failed to get size of {} (error: {})",
                     path.string(), GetLastError());
    close();
    return false;
  }

  if (fileSize.QuadPart == 0) {
    detail::setError(outError, ErrorCode::Io, "File is empty: {}", path.string());
    close();
    return false;
  }

  size_ = static_cast<size_t>(fileSize.QuadPart);

  mappingHandle_ =
      CreateFileMappingW(static_cast<HANDLE>(fileHandle_), nullptr, PAGE_READONLY, 0, 0, nullptr);
  if (!mappingHandle_) {
    detail::setError(outError, ErrorCode::Io, "Failed to create mapping of {} (error: {})",
                     path.string(), GetLastError());
    close();
    return false;
  }

  data_ = MapViewOfFile(static_cast<HANDLE>(mappingHandle_), FILE_MAP_READ, 0, 0, 0);
  if (!data_) {
    detail::setError(outError, ErrorCode::Io, "Failed to map {} (error: {})", path.string(),
                     GetLastError());
    close();
    return false;
  }
  return true;

#else
  fd_ = ::open(path.string().c_str(), O_RDONLY);
  if (fd_ < 0) {
    detail::setError(outError, ErrorCode::Io, "Failed to open {}: {}", path.string(),
                     std::strerror(errno));
    return false;
  }

  struct stat st;
  if (fstat(fd_, &st) < 0) {
    detail::setError(outError, ErrorCode::Io, "Failed to get size of {}: {}", path.string(),
                     std::strerror(errno));
    close();
    return false;
  }

  if (!S_ISREG(st.st_mode)) {
    detail::setError(outError, ErrorCode::Io, "Not a regular file: {}", path.string());
    close();
    return false;
  }

  if (st.st_size == 0) {
    detail::setError(outError, ErrorCode::Io, "File is empty: {}", path.string());
    close();
    return false;
  }

  size_ = static_cast<size_t>(st.st_size);

  void *mapped = mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd_, 0);
  if (mapped == MAP_FAILED) {
    detail::setError(outError, ErrorCode::Io, "Failed to map {}: {}", path.string(),
                     std::strerror(errno));
    close();
    return false;
  }
  data_ = mapped;
  return true;
#endif
}

void MappedFile::close() {
  cleanup();
}

void MappedFile::cleanup() noexcept {
  if (data_) {
#ifdef _WIN32
    UnmapViewOfFile(data_);
#else
    munmap(data_, size_);
#endif
    data_ = nullptr;
  }

#ifdef _WIN32
  if (mappingHandle_) {
    CloseHandle(static_cast<HANDLE>(mappingHandle_));
    mappingHandle_ = nullptr;
  }
  if (fileHandle_) {
    CloseHandle(static_cast<HANDLE>(fileHandle_));
    fileHandle_ = nullptr;
  }
#else
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
#endif

  size_ = 0;
}

} // namespace mpqx
