#ifndef CLIPSYNC_PLATFORM_TIME_H
#define CLIPSYNC_PLATFORM_TIME_H

#include <cstdint>
#include <string>

namespace clipsync::platform {

std::uint64_t NowUnixMs();

// "YYYY-MM-DD HH:MM:SS" in local time; empty for 0.
std::string FormatLocalTime(std::uint64_t unix_ms);

}  // namespace clipsync::platform

#endif  // CLIPSYNC_PLATFORM_TIME_H
