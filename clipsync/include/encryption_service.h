#ifndef CLIPSYNC_ENCRYPTION_SERVICE_H
#define CLIPSYNC_ENCRYPTION_SERVICE_H

#include <cstddef>
#include <cstdint>
#include <shared_mutex>
#include <string>
#include <vector>

#include "credential_store.h"
#include "secure_buffer.h"

namespace clipsync {

// Owns the symmetric key protecting stored clipboard payloads.
//
// Encrypt/Decrypt are total: while uninitialized they return their input
// unchanged, and while initialized any failure also returns the input
// unchanged. Decrypt therefore cannot tell corrupted ciphertext from legacy
// plaintext.
//
// Blob layout: nonce(24) || ciphertext || tag(16), XChaCha20-Poly1305.
//
// Thread-safety: Encrypt/Decrypt may run concurrently; Initialize/Disable
// exclude them.
class EncryptionService {
 public:
  static constexpr std::size_t kKeyBytes = 32;
  static constexpr std::size_t kNonceBytes = 24;
  static constexpr std::size_t kTagBytes = 16;
  static constexpr std::size_t kOverheadBytes = kNonceBytes + kTagBytes;

  // Does not touch `store`; key material is only loaded by Initialize().
  explicit EncryptionService(CredentialStore& store,
                             std::string key_identifier = kEncryptionKeyIdentifier);
  ~EncryptionService();

  EncryptionService(const EncryptionService&) = delete;
  EncryptionService& operator=(const EncryptionService&) = delete;

  // No-op when already initialized. Loads the persisted key, or generates and
  // persists a new one when none (or a malformed one) is stored. A failed
  // save, or a store that cannot be read, leaves a session-only key; an
  // unreadable store is never written to.
  void Initialize();
  // Drops the in-memory key. The persisted copy is kept.
  void Disable();

  bool IsEnabled() const;
  // Short fingerprint of the current key, empty while disabled.
  std::string KeyId() const;

  std::vector<std::uint8_t> Encrypt(const std::vector<std::uint8_t>& bytes) const;
  std::vector<std::uint8_t> Decrypt(const std::vector<std::uint8_t>& bytes) const;

  // Base64 of Encrypt(text).
  std::string EncryptString(const std::string& text) const;
  // Input that is not base64 comes back unchanged. Valid base64 is decoded
  // and run through Decrypt, so stored text that happens to be valid base64
  // (e.g. "test") comes back as its decoded bytes.
  std::string DecryptString(const std::string& encoded) const;

  std::vector<std::uint8_t> EncryptImage(const std::vector<std::uint8_t>& image) const {
    return Encrypt(image);
  }
  std::vector<std::uint8_t> DecryptImage(const std::vector<std::uint8_t>& blob) const {
    return Decrypt(blob);
  }

 private:
  enum class KeyLoad { kLoaded, kAbsent, kUnreadable };

  KeyLoad LoadPersistedKey(common::SecureBuffer& out);
  bool GenerateKey(bool persist, common::SecureBuffer& out);

  bool Seal(const std::vector<std::uint8_t>& plain,
            std::vector<std::uint8_t>& out_blob,
            std::string& error) const;
  bool Open(const std::vector<std::uint8_t>& blob,
            std::vector<std::uint8_t>& out_plain,
            std::string& error) const;

  CredentialStore& store_;
  const std::string key_identifier_;
  mutable std::shared_mutex mutex_;
  common::SecureBuffer key_;
  bool initialized_{false};
};

}  // namespace clipsync

#endif  // CLIPSYNC_ENCRYPTION_SERVICE_H
