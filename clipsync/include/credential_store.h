#ifndef CLIPSYNC_CREDENTIAL_STORE_H
#define CLIPSYNC_CREDENTIAL_STORE_H

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace clipsync {

inline constexpr char kEncryptionKeyIdentifier[] =
    "com.clipboardmanager.encryption.key";

struct CredentialLoadResult {
  bool found{false};
  std::vector<std::uint8_t> data;
};

// Secret storage keyed by identifier. Entries must be device-local and only
// readable while the device is unlocked, whatever the backend.
class CredentialStore {
 public:
  virtual ~CredentialStore() = default;

  // Delete-then-insert; repeated saves for one identifier never conflict.
  virtual bool Save(const std::string& identifier,
                    const std::vector<std::uint8_t>& bytes,
                    std::string& error) = 0;
  // Returns false only on a store failure; a missing entry is
  // `out.found == false`.
  virtual bool Load(const std::string& identifier, CredentialLoadResult& out,
                    std::string& error) = 0;
  virtual bool Remove(const std::string& identifier, std::string& error) = 0;
};

// OS credential store (Keychain / Secret Service).
class PlatformCredentialStore : public CredentialStore {
 public:
  explicit PlatformCredentialStore(std::string service = "clipsync");

  bool Save(const std::string& identifier,
            const std::vector<std::uint8_t>& bytes,
            std::string& error) override;
  bool Load(const std::string& identifier, CredentialLoadResult& out,
            std::string& error) override;
  bool Remove(const std::string& identifier, std::string& error) override;

 private:
  std::string service_;
};

// Process-local store. Used by tests and on hosts without a credential
// store; entries vanish with the process.
class MemoryCredentialStore : public CredentialStore {
 public:
  MemoryCredentialStore() = default;
  ~MemoryCredentialStore() override;

  bool Save(const std::string& identifier,
            const std::vector<std::uint8_t>& bytes,
            std::string& error) override;
  bool Load(const std::string& identifier, CredentialLoadResult& out,
            std::string& error) override;
  bool Remove(const std::string& identifier, std::string& error) override;

  void SetFailSaves(bool fail);
  void SetFailLoads(bool fail);

  std::size_t entry_count() const;
  std::size_t save_count() const;
  std::size_t load_count() const;

 private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::vector<std::uint8_t>> entries_;
  bool fail_saves_{false};
  bool fail_loads_{false};
  std::size_t save_count_{0};
  std::size_t load_count_{0};
};

}  // namespace clipsync

#endif  // CLIPSYNC_CREDENTIAL_STORE_H
