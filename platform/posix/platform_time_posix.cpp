#include "platform_time.h"

#include <chrono>
#include <ctime>

namespace clipsync::platform {

std::uint64_t NowUnixMs() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  const auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
  return ms <= 0 ? 0 : static_cast<std::uint64_t>(ms);
}

std::string FormatLocalTime(std::uint64_t unix_ms) {
  if (unix_ms == 0) {
    return {};
  }
  const std::time_t secs = static_cast<std::time_t>(unix_ms / 1000);
  std::tm tm{};
  if (!::localtime_r(&secs, &tm)) {
    return {};
  }
  char buf[32] = {};
  const std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
  return std::string(buf, n);
}

}  // namespace clipsync::platform
