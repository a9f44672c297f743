#ifndef CLIPSYNC_PLATFORM_FS_H
#define CLIPSYNC_PLATFORM_FS_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <system_error>
#include <vector>

namespace clipsync::platform::fs {

bool Exists(const std::filesystem::path& path, std::error_code& ec);
bool CreateDirectories(const std::filesystem::path& path,
                       std::error_code& ec);

// Reads a whole regular file. Fails with errc::file_too_large when the file
// exceeds `max_bytes`.
bool ReadFileBytes(const std::filesystem::path& path,
                   std::size_t max_bytes,
                   std::vector<std::uint8_t>& out,
                   std::error_code& ec);

// Writes to a sibling temp file (mode 0600), fsyncs it, renames it over
// `path` and fsyncs the directory.
bool AtomicWrite(const std::filesystem::path& path,
                 const std::uint8_t* data,
                 std::size_t len,
                 std::error_code& ec);

}  // namespace clipsync::platform::fs

#endif  // CLIPSYNC_PLATFORM_FS_H
