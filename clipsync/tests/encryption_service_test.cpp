#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "byte_codec.h"
#include "credential_store.h"
#include "encryption_service.h"

using clipsync::CredentialLoadResult;
using clipsync::EncryptionService;
using clipsync::MemoryCredentialStore;

namespace {

#define FAIL()                                                          \
  do {                                                                  \
    std::cerr << "encryption_service_test failed at " << __FILE__ << ":" \
              << __LINE__ << "\n";                                      \
    return 1;                                                           \
  } while (false)

std::vector<std::uint8_t> Bytes(const std::string& s) {
  return std::vector<std::uint8_t>(s.begin(), s.end());
}

std::vector<std::uint8_t> StoredKey(MemoryCredentialStore& store) {
  CredentialLoadResult loaded;
  std::string error;
  const bool ok = store.Load(clipsync::kEncryptionKeyIdentifier, loaded, error);
  assert(ok);
  return loaded.found ? loaded.data : std::vector<std::uint8_t>{};
}

}  // namespace

int main() {
  // Fresh install: construction is inert, Initialize creates and persists.
  {
    MemoryCredentialStore store;
    EncryptionService svc(store);
    if (svc.IsEnabled() || store.load_count() != 0 || store.save_count() != 0) {
      FAIL();
    }
    assert(svc.KeyId().empty());

    const std::vector<std::uint8_t> image = {0x89, 'P', 'N', 'G', 0, 1, 2};
    assert(svc.Encrypt(Bytes("hello")) == Bytes("hello"));
    assert(svc.DecryptImage(image) == image);
    assert(svc.EncryptString("plain") == clipsync::common::Base64Encode(Bytes("plain")));

    svc.Initialize();
    if (!svc.IsEnabled()) {
      FAIL();
    }
    assert(store.entry_count() == 1);
    assert(StoredKey(store).size() == EncryptionService::kKeyBytes);
    const std::string key_id = svc.KeyId();
    assert(key_id.size() == 16);

    svc.Initialize();
    assert(store.save_count() == 1);
    assert(svc.KeyId() == key_id);

    const std::vector<std::uint8_t> blob = svc.Encrypt(Bytes("hello"));
    assert(blob.size() == 5 + EncryptionService::kOverheadBytes);
    assert(svc.Decrypt(blob) == Bytes("hello"));
    assert(svc.Encrypt(Bytes("hello")) != blob);

    const std::vector<std::uint8_t> empty_blob = svc.Encrypt({});
    assert(empty_blob.size() == EncryptionService::kOverheadBytes);
    assert(svc.Decrypt(empty_blob).empty());

    assert(svc.DecryptImage(svc.EncryptImage(image)) == image);

    const std::string text = "clipboard entry \xE2\x9C\x93";
    const std::string encoded = svc.EncryptString(text);
    assert(encoded != text);
    assert(svc.DecryptString(encoded) == text);

    // A second service over the same store adopts the persisted key.
    EncryptionService other(store);
    other.Initialize();
    assert(other.KeyId() == key_id);
    assert(other.Decrypt(blob) == Bytes("hello"));
    assert(other.DecryptString(encoded) == text);
    assert(store.save_count() == 1);
  }

  // Malformed input passes through unchanged.
  {
    MemoryCredentialStore store;
    EncryptionService svc(store);
    svc.Initialize();
    const std::vector<std::uint8_t> short_blob(EncryptionService::kOverheadBytes - 1, 7);
    assert(svc.Decrypt(short_blob) == short_blob);
    const std::vector<std::uint8_t> legacy = Bytes("legacy plaintext that is long enough to parse");
    assert(svc.Decrypt(legacy) == legacy);

    std::vector<std::uint8_t> tampered = svc.Encrypt(Bytes("secret payload"));
    tampered[EncryptionService::kNonceBytes] ^= 0x01;
    assert(svc.Decrypt(tampered) == tampered);

    assert(svc.DecryptString("not base64!!") == "not base64!!");
    assert(svc.DecryptString("") == "");
    const std::string plain_b64 = clipsync::common::Base64Encode(Bytes("plain"));
    assert(svc.DecryptString(plain_b64) == "plain");
    // Legacy text that is itself valid base64 is decoded, not returned as is.
    assert(svc.DecryptString("test") == std::string("\xb5\xeb\x2d", 3));

    // Ciphertext from a different key is indistinguishable from plaintext.
    MemoryCredentialStore other_store;
    EncryptionService stranger(other_store);
    stranger.Initialize();
    const std::vector<std::uint8_t> foreign = stranger.Encrypt(Bytes("theirs"));
    assert(svc.Decrypt(foreign) == foreign);
  }

  // Save failure leaves a session-only key.
  {
    MemoryCredentialStore store;
    store.SetFailSaves(true);
    EncryptionService svc(store);
    svc.Initialize();
    if (!svc.IsEnabled()) {
      FAIL();
    }
    assert(store.entry_count() == 0);
    const auto blob = svc.Encrypt(Bytes("session"));
    assert(svc.Decrypt(blob) == Bytes("session"));
  }

  // Wrong-length keys are replaced.
  {
    MemoryCredentialStore store;
    std::string error;
    const bool saved = store.Save(clipsync::kEncryptionKeyIdentifier,
                                  std::vector<std::uint8_t>(16, 0xAB), error);
    assert(saved);
    EncryptionService svc(store);
    svc.Initialize();
    assert(svc.IsEnabled());
    assert(StoredKey(store).size() == EncryptionService::kKeyBytes);
    assert(store.entry_count() == 1);
  }

  // An unreadable store keeps its key; this session runs on a temporary one.
  {
    MemoryCredentialStore store;
    std::string error;
    const std::vector<std::uint8_t> original(EncryptionService::kKeyBytes, 0xAB);
    const bool saved =
        store.Save(clipsync::kEncryptionKeyIdentifier, original, error);
    assert(saved);
    EncryptionService reference(store);
    reference.Initialize();
    const std::string original_id = reference.KeyId();
    const auto old_blob = reference.Encrypt(Bytes("written last week"));

    store.SetFailLoads(true);
    EncryptionService svc(store);
    svc.Initialize();
    if (!svc.IsEnabled()) {
      FAIL();
    }
    assert(svc.KeyId() != original_id);
    assert(store.save_count() == 1);
    const auto blob = svc.Encrypt(Bytes("session"));
    assert(svc.Decrypt(blob) == Bytes("session"));

    store.SetFailLoads(false);
    if (StoredKey(store) != original) {
      FAIL();
    }
    EncryptionService recovered(store);
    recovered.Initialize();
    assert(recovered.KeyId() == original_id);
    assert(recovered.Decrypt(old_blob) == Bytes("written last week"));
  }

  // Disable drops the in-memory key only.
  {
    MemoryCredentialStore store;
    EncryptionService svc(store);
    svc.Initialize();
    const std::string key_id = svc.KeyId();
    const auto blob = svc.Encrypt(Bytes("before disable"));
    svc.Disable();
    assert(!svc.IsEnabled());
    assert(svc.KeyId().empty());
    assert(svc.Decrypt(blob) == blob);
    assert(svc.Encrypt(Bytes("x")) == Bytes("x"));
    svc.Disable();
    assert(store.entry_count() == 1);
    svc.Initialize();
    assert(svc.KeyId() == key_id);
    assert(svc.Decrypt(blob) == Bytes("before disable"));
  }

  // Custom identifier keeps keys apart.
  {
    MemoryCredentialStore store;
    EncryptionService a(store);
    EncryptionService b(store, "com.clipboardmanager.test.other");
    a.Initialize();
    b.Initialize();
    assert(store.entry_count() == 2);
    assert(a.KeyId() != b.KeyId());
  }

  // Concurrent readers.
  {
    MemoryCredentialStore store;
    EncryptionService svc(store);
    svc.Initialize();
    std::vector<std::thread> threads;
    std::vector<int> ok(4, 0);
    for (int t = 0; t < 4; ++t) {
      threads.emplace_back([&svc, &ok, t] {
        int good = 0;
        for (int i = 0; i < 200; ++i) {
          const auto plain = Bytes("t" + std::to_string(t) + "-" + std::to_string(i));
          if (svc.Decrypt(svc.Encrypt(plain)) == plain) {
            ++good;
          }
        }
        ok[t] = good;
      });
    }
    for (auto& th : threads) {
      th.join();
    }
    for (int good : ok) {
      assert(good == 200);
    }
  }

  std::cout << "encryption_service_test ok\n";
  return 0;
}
