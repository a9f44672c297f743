#ifndef CLIPSYNC_PLATFORM_SECURE_STORE_H
#define CLIPSYNC_PLATFORM_SECURE_STORE_H

#include <cstdint>
#include <string>
#include <vector>

namespace clipsync::platform {

// Items live in the OS credential store (Keychain on macOS, Secret Service on
// Linux). They are bound to this device, readable only while the user
// session is unlocked, and never exported or synced.
bool SecureStoreSupported();

// Delete-then-insert: any item for (service, account) is removed first, so a
// repeated call never fails with a duplicate-item error.
bool SecureItemReplace(const std::string& service,
                       const std::string& account,
                       const std::vector<std::uint8_t>& value,
                       std::string& error);

// `found` is false (and the call succeeds) when no item exists.
bool SecureItemLoad(const std::string& service,
                    const std::string& account,
                    std::vector<std::uint8_t>& out,
                    bool& found,
                    std::string& error);

// Deleting an absent item succeeds.
bool SecureItemDelete(const std::string& service,
                      const std::string& account,
                      std::string& error);

}  // namespace clipsync::platform

#endif  // CLIPSYNC_PLATFORM_SECURE_STORE_H
