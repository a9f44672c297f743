#include "preference_store.h"

#include <sstream>
#include <utility>
#include <vector>

#include "ini_text.h"
#include "platform_fs.h"
#include "platform_log.h"

namespace clipsync {

namespace pfs = clipsync::platform::fs;
namespace plog = clipsync::platform::log;

namespace {

constexpr char kSection[] = "preferences";
constexpr std::size_t kMaxPreferenceFileBytes = 64u * 1024u;

}  // namespace

FilePreferenceStore::FilePreferenceStore(std::filesystem::path path)
    : path_(std::move(path)) {}

bool FilePreferenceStore::ReadAll(std::map<std::string, std::string>& out,
                                  std::string& error) {
  out.clear();
  std::error_code ec;
  if (!pfs::Exists(path_, ec)) {
    if (ec) {
      error = "preferences stat failed: " + ec.message();
      return false;
    }
    return true;
  }
  std::vector<std::uint8_t> raw;
  if (!pfs::ReadFileBytes(path_, kMaxPreferenceFileBytes, raw, ec)) {
    error = "preferences read failed: " + ec.message();
    return false;
  }
  std::istringstream in(std::string(raw.begin(), raw.end()));
  std::string line;
  std::string section;
  while (std::getline(in, line)) {
    const std::string t = common::StripInlineComment(common::Trim(line));
    if (t.empty()) continue;
    if (t.front() == '[' && t.back() == ']') {
      section = t.substr(1, t.size() - 2);
      continue;
    }
    std::string key;
    std::string value;
    if (section != kSection || !common::SplitKeyValue(t, key, value)) {
      continue;
    }
    out[key] = value;
  }
  return true;
}

bool FilePreferenceStore::WriteAll(
    const std::map<std::string, std::string>& values, std::string& error) {
  std::string text = "[";
  text.append(kSection);
  text.append("]\n");
  for (const auto& kv : values) {
    text.append(kv.first);
    text.push_back('=');
    text.append(kv.second);
    text.push_back('\n');
  }
  std::error_code ec;
  if (path_.has_parent_path() &&
      !pfs::CreateDirectories(path_.parent_path(), ec)) {
    error = "preferences dir create failed: " + ec.message();
    return false;
  }
  if (!pfs::AtomicWrite(path_, reinterpret_cast<const std::uint8_t*>(text.data()),
                        text.size(), ec)) {
    error = "preferences write failed: " + ec.message();
    return false;
  }
  return true;
}

bool FilePreferenceStore::LoadBool(const std::string& key, bool& out,
                                   bool& found, std::string& error) {
  error.clear();
  found = false;
  std::lock_guard<std::mutex> lock(mutex_);
  std::map<std::string, std::string> values;
  if (!ReadAll(values, error)) {
    return false;
  }
  const auto it = values.find(key);
  if (it == values.end()) {
    return true;
  }
  if (!common::ParseBool(it->second, out)) {
    plog::Log(plog::Level::kWarn, "preferences", "ignoring malformed value",
              {{"pref", key}, {"value", it->second}});
    return true;
  }
  found = true;
  return true;
}

bool FilePreferenceStore::SaveBool(const std::string& key, bool value,
                                   std::string& error) {
  error.clear();
  std::lock_guard<std::mutex> lock(mutex_);
  std::map<std::string, std::string> values;
  if (!ReadAll(values, error)) {
    // A corrupt file must not block persisting the user's choice.
    plog::Log(plog::Level::kWarn, "preferences", "rewriting unreadable file",
              {{"error", error}});
    values.clear();
    error.clear();
  }
  values[key] = value ? "1" : "0";
  return WriteAll(values, error);
}

bool MemoryPreferenceStore::LoadBool(const std::string& key, bool& out,
                                     bool& found, std::string& error) {
  error.clear();
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = values_.find(key);
  found = it != values_.end();
  if (found) {
    out = it->second;
  }
  return true;
}

bool MemoryPreferenceStore::SaveBool(const std::string& key, bool value,
                                     std::string& error) {
  error.clear();
  std::lock_guard<std::mutex> lock(mutex_);
  ++save_count_;
  if (fail_saves_) {
    error = "memory preferences save disabled";
    return false;
  }
  values_[key] = value;
  return true;
}

void MemoryPreferenceStore::SetFailSaves(bool fail) {
  std::lock_guard<std::mutex> lock(mutex_);
  fail_saves_ = fail;
}

std::size_t MemoryPreferenceStore::save_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return save_count_;
}

}  // namespace clipsync
