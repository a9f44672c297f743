#include "platform_fs.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <string>

namespace clipsync::platform::fs {

namespace {

constexpr int kMaxTempAttempts = 16;

std::error_code LastError() {
  return std::error_code(errno, std::generic_category());
}

class ScopedFd {
 public:
  explicit ScopedFd(int fd) : fd_(fd) {}
  ~ScopedFd() { Close(); }

  ScopedFd(const ScopedFd&) = delete;
  ScopedFd& operator=(const ScopedFd&) = delete;

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }

  // Returns false (errno set) if close(2) reports a failure.
  bool Close() {
    if (fd_ < 0) {
      return true;
    }
    const int rc = ::close(fd_);
    fd_ = -1;
    return rc == 0;
  }

 private:
  int fd_;
};

// Removes the temp file unless the write is committed.
class TempFileGuard {
 public:
  explicit TempFileGuard(std::filesystem::path path) : path_(std::move(path)) {}
  ~TempFileGuard() {
    if (!committed_) {
      std::error_code ignored;
      std::filesystem::remove(path_, ignored);
    }
  }

  TempFileGuard(const TempFileGuard&) = delete;
  TempFileGuard& operator=(const TempFileGuard&) = delete;

  void Commit() { committed_ = true; }

 private:
  std::filesystem::path path_;
  bool committed_{false};
};

bool WriteFully(int fd, const std::uint8_t* data, std::size_t len,
                std::error_code& ec) {
  while (len > 0) {
    const ssize_t n = ::write(fd, data, len);
    if (n < 0) {
      if (errno == EINTR) continue;
      ec = LastError();
      return false;
    }
    data += n;
    len -= static_cast<std::size_t>(n);
  }
  return true;
}

std::filesystem::path SiblingTempPath(const std::filesystem::path& target,
                                      int attempt) {
  std::string name = target.filename().string();
  if (name.empty()) {
    name = "clipsync";
  }
  name += ".tmp." + std::to_string(static_cast<long>(::getpid())) + "." +
          std::to_string(attempt);
  return target.has_parent_path() ? target.parent_path() / name
                                  : std::filesystem::path(name);
}

void SyncParentDirectory(const std::filesystem::path& target) {
  const std::filesystem::path dir =
      target.has_parent_path() ? target.parent_path() : std::filesystem::path(".");
  ScopedFd dfd(::open(dir.c_str(), O_RDONLY | O_CLOEXEC));
  if (dfd.valid()) {
    ::fsync(dfd.get());
  }
}

}  // namespace

bool Exists(const std::filesystem::path& path, std::error_code& ec) {
  return std::filesystem::exists(path, ec);
}

bool CreateDirectories(const std::filesystem::path& path,
                       std::error_code& ec) {
  std::filesystem::create_directories(path, ec);
  return !ec;
}

bool ReadFileBytes(const std::filesystem::path& path,
                   std::size_t max_bytes,
                   std::vector<std::uint8_t>& out,
                   std::error_code& ec) {
  ec.clear();
  out.clear();
  ScopedFd fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
  if (!fd.valid()) {
    ec = LastError();
    return false;
  }
  struct stat st {};
  if (::fstat(fd.get(), &st) != 0) {
    ec = LastError();
    return false;
  }
  if (!S_ISREG(st.st_mode)) {
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  }
  if (static_cast<std::uint64_t>(st.st_size) > max_bytes) {
    ec = std::make_error_code(std::errc::file_too_large);
    return false;
  }
  out.resize(static_cast<std::size_t>(st.st_size));
  std::size_t filled = 0;
  while (filled < out.size()) {
    const ssize_t n = ::read(fd.get(), out.data() + filled, out.size() - filled);
    if (n == 0) break;
    if (n < 0) {
      if (errno == EINTR) continue;
      ec = LastError();
      out.clear();
      return false;
    }
    filled += static_cast<std::size_t>(n);
  }
  out.resize(filled);
  return true;
}

bool AtomicWrite(const std::filesystem::path& path,
                 const std::uint8_t* data,
                 std::size_t len,
                 std::error_code& ec) {
  ec.clear();
  if (path.empty() || (len > 0 && !data)) {
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  }

  for (int attempt = 0; attempt < kMaxTempAttempts; ++attempt) {
    const std::filesystem::path tmp = SiblingTempPath(path, attempt);
    ScopedFd fd(::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC,
                       0600));
    if (!fd.valid()) {
      if (errno == EEXIST) continue;
      ec = LastError();
      return false;
    }
    TempFileGuard guard(tmp);
    if (!WriteFully(fd.get(), data, len, ec)) {
      return false;
    }
    if (::fsync(fd.get()) != 0 || !fd.Close()) {
      ec = LastError();
      return false;
    }
    if (::rename(tmp.c_str(), path.c_str()) != 0) {
      ec = LastError();
      return false;
    }
    guard.Commit();
    SyncParentDirectory(path);
    return true;
  }
  ec = std::make_error_code(std::errc::file_exists);
  return false;
}

}  // namespace clipsync::platform::fs
