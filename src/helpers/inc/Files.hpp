#ifndef MODELBENCH_HELPERS_FILES_HPP
#define MODELBENCH_HELPERS_FILES_HPP
/**
 * @file Files.hpp
 * @brief Whole-file read/write helpers using C-style I/O.
 *
 * Reads are bounded; writes go to a sibling temporary file that is renamed
 * over the destination so a failed write never leaves a truncated report.
 *
 * @note Cold-path: Functions allocate std::string.
 */

#include <fcntl.h>    // open, O_RDONLY, O_CLOEXEC
#include <unistd.h>   // read, write, close, getpid

#include <cerrno>
#include <cstddef>
#include <cstdio> // std::rename, std::remove
#include <cstring>
#include <string>
#include <string_view>

#include <fmt/core.h>

namespace modelbench {
namespace helpers {
namespace files {

/* ----------------------------- Constants ----------------------------- */

/// Upper bound for readFileToString() (procfs files are far smaller).
inline constexpr std::size_t MAX_READ_BYTES = 4 * 1024 * 1024;

/// Chunk size for read loops.
inline constexpr std::size_t READ_CHUNK_SIZE = 4096;

/* ----------------------------- Reading ----------------------------- */

/**
 * @brief Read an entire file into a string.
 * @param path File path (procfs files report size 0, so no stat sizing).
 * @param out Output contents (cleared first).
 * @return true if the file was opened and read without error.
 */
[[nodiscard]] inline bool readFileToString(const char* path, std::string& out) noexcept {
  out.clear();
  if (path == nullptr) {
    return false;
  }

  const int FD = ::open(path, O_RDONLY | O_CLOEXEC);
  if (FD < 0) {
    return false;
  }

  char buf[READ_CHUNK_SIZE];
  bool ok = true;
  while (out.size() < MAX_READ_BYTES) {
    const ssize_t N = ::read(FD, buf, sizeof(buf));
    if (N < 0) {
      if (errno == EINTR) {
        continue;
      }
      ok = false;
      break;
    }
    if (N == 0) {
      break;
    }
    out.append(buf, static_cast<std::size_t>(N));
  }

  ::close(FD);
  return ok;
}

/* ----------------------------- Writing ----------------------------- */

/**
 * @brief Write content to path, replacing any existing file.
 * @param path Destination path.
 * @param content Bytes to write.
 * @param error Set to a diagnostic on failure.
 * @return true on success.
 */
[[nodiscard]] inline bool writeFileAtomic(const std::string& path, std::string_view content,
                                          std::string& error) noexcept {
  if (path.empty()) {
    error = "empty output path";
    return false;
  }

  const std::string TMP = fmt::format("{}.tmp.{}", path, static_cast<int>(::getpid()));
  const int FD = ::open(TMP.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (FD < 0) {
    error = fmt::format("cannot open '{}': {}", TMP, std::strerror(errno));
    return false;
  }

  std::size_t written = 0;
  while (written < content.size()) {
    const ssize_t N = ::write(FD, content.data() + written, content.size() - written);
    if (N < 0) {
      if (errno == EINTR) {
        continue;
      }
      error = fmt::format("write to '{}' failed: {}", TMP, std::strerror(errno));
      ::close(FD);
      std::remove(TMP.c_str());
      return false;
    }
    written += static_cast<std::size_t>(N);
  }

  if (::close(FD) != 0) {
    error = fmt::format("close of '{}' failed: {}", TMP, std::strerror(errno));
    std::remove(TMP.c_str());
    return false;
  }

  if (std::rename(TMP.c_str(), path.c_str()) != 0) {
    error = fmt::format("cannot rename '{}' to '{}': {}", TMP, path, std::strerror(errno));
    std::remove(TMP.c_str());
    return false;
  }

  return true;
}

} // namespace files
} // namespace helpers
} // namespace modelbench

#endif // MODELBENCH_HELPERS_FILES_HPP
