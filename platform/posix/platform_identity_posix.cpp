#include "platform_identity.h"

#include <sys/utsname.h>
#include <unistd.h>

#include <cstdlib>

#if defined(__APPLE__)
#include <CoreFoundation/CoreFoundation.h>
#endif

namespace clipsync::platform {

#if !defined(__APPLE__)
namespace {

std::string EnvOrEmpty(const char* name) {
  const char* env = std::getenv(name);
  return (env && *env != '\0') ? std::string(env) : std::string();
}

}  // namespace
#endif

std::string PackagedAppIdentity() {
#if defined(__APPLE__)
  CFBundleRef bundle = CFBundleGetMainBundle();
  if (!bundle) {
    return {};
  }
  CFStringRef id = CFBundleGetIdentifier(bundle);
  if (!id) {
    return {};
  }
  char buf[256] = {};
  if (!CFStringGetCString(id, buf, sizeof(buf), kCFStringEncodingUTF8)) {
    return {};
  }
  return buf;
#else
  std::string id = EnvOrEmpty("FLATPAK_ID");
  if (id.empty()) {
    id = EnvOrEmpty("SNAP_INSTANCE_NAME");
  }
  return id;
#endif
}

std::string HostName() {
  char buf[256] = {};
  if (::gethostname(buf, sizeof(buf) - 1) != 0) {
    return "unknown";
  }
  return buf;
}

std::string OsDescription() {
  struct utsname info {};
  if (::uname(&info) != 0) {
    return "unknown";
  }
  std::string out = info.sysname;
  out.push_back(' ');
  out.append(info.release);
  out.push_back(' ');
  out.append(info.machine);
  return out;
}

}  // namespace clipsync::platform
