#include "clipsync_config.h"

#include <algorithm>
#include <fstream>
#include <string>

#include "ini_text.h"

namespace clipsync {

namespace {

constexpr std::uint32_t kMaxStepTimeoutMs = 120000;
constexpr std::uint32_t kMaxGraceMs = 60000;
constexpr std::uint32_t kMaxWorkerThreads = 8;

bool ParseCredentialBackend(const std::string& text, CredentialBackend& out) {
  const std::string t = common::ToLower(common::Trim(text));
  if (t.empty() || t == "platform" || t == "keychain" || t == "secret_service") {
    out = CredentialBackend::kPlatform;
    return true;
  }
  if (t == "memory") {
    out = CredentialBackend::kMemory;
    return true;
  }
  return false;
}

void ClampTimeout(std::uint32_t& value, std::uint32_t fallback) {
  if (value == 0) {
    value = fallback;
  }
  value = std::min(value, kMaxStepTimeoutMs);
}

}  // namespace

bool LoadClipsyncConfig(const std::string& path, ClipsyncConfig& out_cfg,
                        std::string& error) {
  out_cfg = ClipsyncConfig{};
  error.clear();
  std::ifstream f(path);
  if (!f.is_open()) {
    error = "clipsync config not found: " + path;
    return false;
  }
  std::string section;
  std::string line;
  std::size_t line_no = 0;
  const auto bad_value = [&error, &line_no](const std::string& key) {
    error = "invalid " + key + " at line " + std::to_string(line_no);
    return false;
  };
  while (std::getline(f, line)) {
    ++line_no;
    const std::string t = common::StripInlineComment(common::Trim(line));
    if (t.empty()) continue;
    if (t.front() == '[' && t.back() == ']') {
      section = common::Trim(t.substr(1, t.size() - 2));
      continue;
    }
    std::string key;
    std::string val;
    if (!common::SplitKeyValue(t, key, val)) {
      error = "invalid line " + std::to_string(line_no);
      return false;
    }
    if (section == "app") {
      if (key == "bundle_id") {
        out_cfg.app.bundle_id = val;
      }
    } else if (section == "sync") {
      if (key == "resume_on_start") {
        if (!common::ParseBool(val, out_cfg.sync.resume_on_start)) {
          return bad_value(key);
        }
      } else if (key == "probe_timeout_ms") {
        if (!common::ParseUint32(val, out_cfg.sync.probe_timeout_ms)) {
          return bad_value(key);
        }
      } else if (key == "account_timeout_ms") {
        if (!common::ParseUint32(val, out_cfg.sync.account_timeout_ms)) {
          return bad_value(key);
        }
      } else if (key == "flush_timeout_ms") {
        if (!common::ParseUint32(val, out_cfg.sync.flush_timeout_ms)) {
          return bad_value(key);
        }
      } else if (key == "propagation_grace_ms") {
        if (!common::ParseUint32(val, out_cfg.sync.propagation_grace_ms)) {
          return bad_value(key);
        }
      } else if (key == "worker_threads") {
        if (!common::ParseUint32(val, out_cfg.sync.worker_threads)) {
          return bad_value(key);
        }
      }
    } else if (section == "storage") {
      if (key == "preferences_path") {
        out_cfg.storage.preferences_path = val;
      } else if (key == "credential_backend") {
        if (!ParseCredentialBackend(val, out_cfg.storage.credential_backend)) {
          return bad_value(key);
        }
      }
    } else if (section == "log") {
      if (key == "level") {
        if (!platform::log::ParseLevel(val, out_cfg.log.level)) {
          return bad_value(key);
        }
      }
    }
  }

  const SyncConfig defaults;
  ClampTimeout(out_cfg.sync.probe_timeout_ms, defaults.probe_timeout_ms);
  ClampTimeout(out_cfg.sync.account_timeout_ms, defaults.account_timeout_ms);
  ClampTimeout(out_cfg.sync.flush_timeout_ms, defaults.flush_timeout_ms);
  out_cfg.sync.propagation_grace_ms =
      std::min(out_cfg.sync.propagation_grace_ms, kMaxGraceMs);
  out_cfg.sync.worker_threads =
      std::clamp<std::uint32_t>(out_cfg.sync.worker_threads, 1, kMaxWorkerThreads);
  if (out_cfg.storage.preferences_path.empty()) {
    error = "preferences_path empty";
    return false;
  }
  return true;
}

}  // namespace clipsync
