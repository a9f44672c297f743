#include "platform_secure_store.h"

#include <cstring>
#include <string>
#include <vector>

#include "byte_codec.h"
#include "secure_buffer.h"

#if defined(__APPLE__)
#include <CoreFoundation/CoreFoundation.h>
#include <Security/Security.h>
#elif defined(__linux__)
#include <libsecret/secret.h>
#include <unistd.h>
#endif

namespace clipsync::platform {

namespace {

constexpr char kItemLabelPrefix[] = "clipsync: ";

#if defined(__APPLE__)

std::string OsStatusToString(OSStatus status) {
  CFStringRef msg = SecCopyErrorMessageString(status, nullptr);
  if (!msg) {
    return "keychain error " + std::to_string(static_cast<int>(status));
  }
  char buf[256] = {};
  std::string out;
  if (CFStringGetCString(msg, buf, sizeof(buf), kCFStringEncodingUTF8)) {
    out = buf;
  } else {
    out = "keychain error " + std::to_string(static_cast<int>(status));
  }
  CFRelease(msg);
  return out;
}

CFStringRef MakeCFString(const std::string& text) {
  return CFStringCreateWithCString(nullptr, text.c_str(),
                                   kCFStringEncodingUTF8);
}

// Base query identifying one generic-password item. Caller releases.
CFMutableDictionaryRef MakeItemQuery(const std::string& service,
                                     const std::string& account) {
  CFMutableDictionaryRef query = CFDictionaryCreateMutable(
      nullptr, 0, &kCFTypeDictionaryKeyCallBacks,
      &kCFTypeDictionaryValueCallBacks);
  if (!query) {
    return nullptr;
  }
  CFStringRef cf_service = MakeCFString(service);
  CFStringRef cf_account = MakeCFString(account);
  if (!cf_service || !cf_account) {
    if (cf_service) {
      CFRelease(cf_service);
    }
    if (cf_account) {
      CFRelease(cf_account);
    }
    CFRelease(query);
    return nullptr;
  }
  CFDictionarySetValue(query, kSecClass, kSecClassGenericPassword);
  CFDictionarySetValue(query, kSecAttrService, cf_service);
  CFDictionarySetValue(query, kSecAttrAccount, cf_account);
  CFRelease(cf_service);
  CFRelease(cf_account);
  return query;
}

#elif defined(__linux__)

const SecretSchema& ClipsyncSchema() {
  static const SecretSchema kSchema = {
      "com.clipboardmanager.clipsync",
      SECRET_SCHEMA_NONE,
      {{"service", SECRET_SCHEMA_ATTRIBUTE_STRING},
       {"account", SECRET_SCHEMA_ATTRIBUTE_STRING},
       {"uid", SECRET_SCHEMA_ATTRIBUTE_STRING},
       {nullptr, SECRET_SCHEMA_ATTRIBUTE_STRING}}};
  return kSchema;
}

std::string CurrentUidString() {
  return std::to_string(static_cast<unsigned long>(getuid()));
}

std::string TakeGError(GError* gerr, const char* fallback) {
  std::string out = (gerr && gerr->message) ? gerr->message : fallback;
  if (gerr) {
    g_error_free(gerr);
  }
  return out;
}

#endif

}  // namespace

bool SecureStoreSupported() {
#if defined(__APPLE__) || defined(__linux__)
  return true;
#else
  return false;
#endif
}

bool SecureItemDelete(const std::string& service,
                      const std::string& account,
                      std::string& error) {
  error.clear();
#if defined(__APPLE__)
  CFMutableDictionaryRef query = MakeItemQuery(service, account);
  if (!query) {
    error = "keychain query failed";
    return false;
  }
  const OSStatus status = SecItemDelete(query);
  CFRelease(query);
  if (status != errSecSuccess && status != errSecItemNotFound) {
    error = OsStatusToString(status);
    return false;
  }
  return true;
#elif defined(__linux__)
  GError* gerr = nullptr;
  const std::string uid = CurrentUidString();
  secret_password_clear_sync(&ClipsyncSchema(), nullptr, &gerr, "service",
                             service.c_str(), "account", account.c_str(),
                             "uid", uid.c_str(), nullptr);
  if (gerr) {
    error = TakeGError(gerr, "secret service clear failed");
    return false;
  }
  return true;
#else
  (void)service;
  (void)account;
  error = "secure store unsupported";
  return false;
#endif
}

bool SecureItemReplace(const std::string& service,
                       const std::string& account,
                       const std::vector<std::uint8_t>& value,
                       std::string& error) {
  error.clear();
  if (value.empty()) {
    error = "secure store value empty";
    return false;
  }
  if (!SecureItemDelete(service, account, error)) {
    return false;
  }
#if defined(__APPLE__)
  CFMutableDictionaryRef add = MakeItemQuery(service, account);
  if (!add) {
    error = "keychain query failed";
    return false;
  }
  CFDataRef data = CFDataCreate(nullptr, value.data(),
                                static_cast<CFIndex>(value.size()));
  CFStringRef label = MakeCFString(kItemLabelPrefix + account);
  if (!data || !label) {
    if (data) {
      CFRelease(data);
    }
    if (label) {
      CFRelease(label);
    }
    CFRelease(add);
    error = "keychain value encode failed";
    return false;
  }
  CFDictionarySetValue(add, kSecValueData, data);
  CFDictionarySetValue(add, kSecAttrLabel, label);
  CFDictionarySetValue(add, kSecAttrAccessible,
                       kSecAttrAccessibleWhenUnlockedThisDeviceOnly);
  const OSStatus status = SecItemAdd(add, nullptr);
  CFRelease(label);
  CFRelease(data);
  CFRelease(add);
  if (status != errSecSuccess) {
    error = OsStatusToString(status);
    return false;
  }
  return true;
#elif defined(__linux__)
  std::string hex = common::BytesToHexLower(value.data(), value.size());
  common::ScopedWipe wipe_hex(hex);
  const std::string label = kItemLabelPrefix + account;
  const std::string uid = CurrentUidString();
  GError* gerr = nullptr;
  const gboolean ok = secret_password_store_sync(
      &ClipsyncSchema(), SECRET_COLLECTION_DEFAULT, label.c_str(), hex.c_str(),
      nullptr, &gerr, "service", service.c_str(), "account", account.c_str(),
      "uid", uid.c_str(), nullptr);
  if (!ok || gerr) {
    error = TakeGError(gerr, "secret service store failed");
    return false;
  }
  return true;
#else
  return false;
#endif
}

bool SecureItemLoad(const std::string& service,
                    const std::string& account,
                    std::vector<std::uint8_t>& out,
                    bool& found,
                    std::string& error) {
  error.clear();
  out.clear();
  found = false;
#if defined(__APPLE__)
  CFMutableDictionaryRef query = MakeItemQuery(service, account);
  if (!query) {
    error = "keychain query failed";
    return false;
  }
  CFDictionarySetValue(query, kSecReturnData, kCFBooleanTrue);
  CFDictionarySetValue(query, kSecMatchLimit, kSecMatchLimitOne);
  CFTypeRef result = nullptr;
  const OSStatus status = SecItemCopyMatching(query, &result);
  CFRelease(query);
  if (status == errSecItemNotFound) {
    return true;
  }
  if (status != errSecSuccess) {
    error = OsStatusToString(status);
    return false;
  }
  if (!result || CFGetTypeID(result) != CFDataGetTypeID()) {
    if (result) {
      CFRelease(result);
    }
    error = "keychain item invalid";
    return false;
  }
  auto* data = static_cast<CFDataRef>(result);
  const CFIndex len = CFDataGetLength(data);
  out.resize(static_cast<std::size_t>(len));
  if (len > 0) {
    std::memcpy(out.data(), CFDataGetBytePtr(data), out.size());
  }
  CFRelease(result);
  found = true;
  return true;
#elif defined(__linux__)
  const std::string uid = CurrentUidString();
  GError* gerr = nullptr;
  gchar* secret = secret_password_lookup_sync(
      &ClipsyncSchema(), nullptr, &gerr, "service", service.c_str(),
      "account", account.c_str(), "uid", uid.c_str(), nullptr);
  if (gerr) {
    if (secret) {
      secret_password_free(secret);
    }
    error = TakeGError(gerr, "secret service lookup failed");
    return false;
  }
  if (!secret) {
    return true;
  }
  const bool ok = common::HexToBytes(secret, out);
  secret_password_free(secret);
  if (!ok) {
    error = "secret service item invalid";
    return false;
  }
  found = true;
  return true;
#else
  (void)service;
  (void)account;
  error = "secure store unsupported";
  return false;
#endif
}

}  // namespace clipsync::platform
