#ifndef CLIPSYNC_PLATFORM_RANDOM_H
#define CLIPSYNC_PLATFORM_RANDOM_H

#include <cstddef>
#include <cstdint>

namespace clipsync::platform {

// Fills `out` from the OS CSPRNG. Returns false if fewer than `len` bytes
// could be produced; `out` contents are unspecified in that case.
bool RandomBytes(std::uint8_t* out, std::size_t len);

}  // namespace clipsync::platform

#endif  // CLIPSYNC_PLATFORM_RANDOM_H
