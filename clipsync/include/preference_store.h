#ifndef CLIPSYNC_PREFERENCE_STORE_H
#define CLIPSYNC_PREFERENCE_STORE_H

#include <filesystem>
#include <map>
#include <mutex>
#include <string>

namespace clipsync {

// Preference key under which the user's sync opt-in is persisted.
inline constexpr char kSyncIntentPreferenceKey[] = "CloudKitSyncEnabled";

class PreferenceStore {
 public:
  virtual ~PreferenceStore() = default;

  // Missing keys succeed with `found == false`.
  virtual bool LoadBool(const std::string& key, bool& out, bool& found,
                        std::string& error) = 0;
  virtual bool SaveBool(const std::string& key, bool value,
                        std::string& error) = 0;
};

// Key/value file with a single [preferences] section:
//
//   [preferences]
//   CloudKitSyncEnabled=1
//
// Each save rewrites the file atomically.
class FilePreferenceStore : public PreferenceStore {
 public:
  explicit FilePreferenceStore(std::filesystem::path path);

  bool LoadBool(const std::string& key, bool& out, bool& found,
                std::string& error) override;
  bool SaveBool(const std::string& key, bool value,
                std::string& error) override;

  const std::filesystem::path& path() const { return path_; }

 private:
  bool ReadAll(std::map<std::string, std::string>& out, std::string& error);
  bool WriteAll(const std::map<std::string, std::string>& values,
                std::string& error);

  const std::filesystem::path path_;
  std::mutex mutex_;
};

class MemoryPreferenceStore : public PreferenceStore {
 public:
  bool LoadBool(const std::string& key, bool& out, bool& found,
                std::string& error) override;
  bool SaveBool(const std::string& key, bool value,
                std::string& error) override;

  void SetFailSaves(bool fail);
  std::size_t save_count() const;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, bool> values_;
  bool fail_saves_{false};
  std::size_t save_count_{0};
};

}  // namespace clipsync

#endif  // CLIPSYNC_PREFERENCE_STORE_H
