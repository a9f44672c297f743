#ifndef CLIPSYNC_CONFIG_H
#define CLIPSYNC_CONFIG_H

#include <cstdint>
#include <string>

#include "platform_log.h"

namespace clipsync {

enum class CredentialBackend : std::uint8_t { kPlatform = 0, kMemory = 1 };

struct AppConfig {
  // Overrides the platform-reported packaged identity when set.
  std::string bundle_id;
};

struct SyncConfig {
  // Re-run Enable() at start when the persisted intent says so.
  bool resume_on_start{true};
  std::uint32_t probe_timeout_ms{5000};
  std::uint32_t account_timeout_ms{10000};
  std::uint32_t flush_timeout_ms{15000};
  // Wait after flushing before a cycle is reported successful.
  std::uint32_t propagation_grace_ms{1000};
  std::uint32_t worker_threads{2};
};

struct StorageConfig {
  std::string preferences_path{"clipsync_prefs.ini"};
  CredentialBackend credential_backend{CredentialBackend::kPlatform};
};

struct LogConfig {
  platform::log::Level level{platform::log::Level::kInfo};
};

struct ClipsyncConfig {
  AppConfig app;
  SyncConfig sync;
  StorageConfig storage;
  LogConfig log;
};

// Missing keys keep their defaults. Zero timeouts fall back to the default,
// large ones are clamped.
bool LoadClipsyncConfig(const std::string& path, ClipsyncConfig& out_cfg,
                        std::string& error);

}  // namespace clipsync

#endif  // CLIPSYNC_CONFIG_H
