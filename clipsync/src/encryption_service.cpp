#include "encryption_service.h"

#include <cstring>
#include <limits>
#include <mutex>
#include <utility>

#include "byte_codec.h"
#include "monocypher.h"
#include "platform_log.h"
#include "platform_random.h"

namespace clipsync {

namespace plog = clipsync::platform::log;

namespace {

constexpr char kLogTag[] = "encryption";
constexpr char kKeyIdContext[] = "clipsync key id v1";
constexpr std::size_t kKeyIdBytes = 8;

}  // namespace

EncryptionService::EncryptionService(CredentialStore& store,
                                     std::string key_identifier)
    : store_(store), key_identifier_(std::move(key_identifier)) {
  plog::Log(plog::Level::kDebug, kLogTag,
            "created; encryption disabled until initialized");
}

EncryptionService::~EncryptionService() = default;

EncryptionService::KeyLoad EncryptionService::LoadPersistedKey(
    common::SecureBuffer& out) {
  CredentialLoadResult loaded;
  std::string error;
  if (!store_.Load(key_identifier_, loaded, error)) {
    plog::Log(plog::Level::kWarn, kLogTag, "key load failed",
              {{"error", error}});
    return KeyLoad::kUnreadable;
  }
  if (!loaded.found) {
    return KeyLoad::kAbsent;
  }
  if (loaded.data.size() != kKeyBytes) {
    plog::Log(plog::Level::kWarn, kLogTag, "persisted key has wrong length",
              {{"length", std::to_string(loaded.data.size())}});
    common::SecureWipe(loaded.data);
    return KeyLoad::kAbsent;
  }
  out.Assign(loaded.data.data(), loaded.data.size());
  common::SecureWipe(loaded.data);
  return KeyLoad::kLoaded;
}

bool EncryptionService::GenerateKey(bool persist, common::SecureBuffer& out) {
  std::vector<std::uint8_t> fresh(kKeyBytes);
  common::ScopedWipe wipe_fresh(fresh);
  if (!platform::RandomBytes(fresh.data(), fresh.size())) {
    plog::Log(plog::Level::kError, kLogTag, "key generation failed: rng");
    return false;
  }
  std::string error;
  if (persist && !store_.Save(key_identifier_, fresh, error)) {
    plog::Log(plog::Level::kWarn, kLogTag,
              "key not persisted; using session-only key",
              {{"error", error}});
  }
  out.Assign(fresh.data(), fresh.size());
  return true;
}

void EncryptionService::Initialize() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (initialized_) {
    plog::Log(plog::Level::kDebug, kLogTag, "already initialized");
    return;
  }
  common::SecureBuffer key;
  switch (LoadPersistedKey(key)) {
    case KeyLoad::kLoaded:
      plog::Log(plog::Level::kInfo, kLogTag, "loaded persisted key");
      break;
    case KeyLoad::kAbsent:
      if (!GenerateKey(true, key)) {
        return;
      }
      plog::Log(plog::Level::kInfo, kLogTag, "generated new key");
      break;
    case KeyLoad::kUnreadable:
      // The stored key may still be valid; leave it in place.
      if (!GenerateKey(false, key)) {
        return;
      }
      plog::Log(plog::Level::kWarn, kLogTag,
                "credential store unreadable; using session-only key");
      break;
  }
  key_ = std::move(key);
  initialized_ = true;
}

void EncryptionService::Disable() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  key_.Reset();
  initialized_ = false;
  plog::Log(plog::Level::kInfo, kLogTag, "disabled");
}

bool EncryptionService::IsEnabled() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return initialized_ && !key_.empty();
}

std::string EncryptionService::KeyId() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  if (!initialized_ || key_.empty()) {
    return {};
  }
  std::uint8_t digest[kKeyIdBytes] = {};
  crypto_blake2b_keyed(digest, sizeof(digest), key_.data(), key_.size(),
                       reinterpret_cast<const std::uint8_t*>(kKeyIdContext),
                       sizeof(kKeyIdContext) - 1);
  return common::BytesToHexLower(digest, sizeof(digest));
}

bool EncryptionService::Seal(const std::vector<std::uint8_t>& plain,
                             std::vector<std::uint8_t>& out_blob,
                             std::string& error) const {
  out_blob.clear();
  if (plain.size() > std::numeric_limits<std::size_t>::max() - kOverheadBytes) {
    error = "payload too large";
    return false;
  }
  out_blob.resize(kNonceBytes + plain.size() + kTagBytes);
  std::uint8_t* nonce = out_blob.data();
  std::uint8_t* cipher = nonce + kNonceBytes;
  std::uint8_t* mac = cipher + plain.size();
  if (!platform::RandomBytes(nonce, kNonceBytes)) {
    out_blob.clear();
    error = "nonce generation failed";
    return false;
  }
  crypto_aead_lock(cipher, mac, key_.data(), nonce, nullptr, 0, plain.data(),
                   plain.size());
  return true;
}

bool EncryptionService::Open(const std::vector<std::uint8_t>& blob,
                             std::vector<std::uint8_t>& out_plain,
                             std::string& error) const {
  out_plain.clear();
  if (blob.size() < kOverheadBytes) {
    error = "blob too short";
    return false;
  }
  const std::size_t text_len = blob.size() - kOverheadBytes;
  const std::uint8_t* nonce = blob.data();
  const std::uint8_t* cipher = nonce + kNonceBytes;
  const std::uint8_t* mac = cipher + text_len;
  out_plain.resize(text_len);
  if (crypto_aead_unlock(out_plain.data(), mac, key_.data(), nonce, nullptr, 0,
                         cipher, text_len) != 0) {
    out_plain.clear();
    error = "authentication failed";
    return false;
  }
  return true;
}

std::vector<std::uint8_t> EncryptionService::Encrypt(
    const std::vector<std::uint8_t>& bytes) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  if (!initialized_ || key_.empty()) {
    return bytes;
  }
  std::vector<std::uint8_t> blob;
  std::string error;
  if (!Seal(bytes, blob, error)) {
    plog::Log(plog::Level::kWarn, kLogTag,
              "encrypt failed; storing payload unencrypted",
              {{"error", error}});
    return bytes;
  }
  return blob;
}

std::vector<std::uint8_t> EncryptionService::Decrypt(
    const std::vector<std::uint8_t>& bytes) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  if (!initialized_ || key_.empty()) {
    return bytes;
  }
  std::vector<std::uint8_t> plain;
  std::string error;
  if (!Open(bytes, plain, error)) {
    plog::Log(plog::Level::kDebug, kLogTag,
              "decrypt failed; treating payload as plaintext",
              {{"error", error}});
    return bytes;
  }
  return plain;
}

std::string EncryptionService::EncryptString(const std::string& text) const {
  const std::vector<std::uint8_t> plain(text.begin(), text.end());
  return common::Base64Encode(Encrypt(plain));
}

std::string EncryptionService::DecryptString(const std::string& encoded) const {
  std::vector<std::uint8_t> blob;
  if (!common::Base64Decode(encoded, blob)) {
    plog::Log(plog::Level::kDebug, kLogTag,
              "decrypt input is not base64; returning unchanged");
    return encoded;
  }
  const std::vector<std::uint8_t> plain = Decrypt(blob);
  return std::string(plain.begin(), plain.end());
}

}  // namespace clipsync
