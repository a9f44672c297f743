#ifndef CLIPSYNC_PLATFORM_IDENTITY_H
#define CLIPSYNC_PLATFORM_IDENTITY_H

#include <string>

namespace clipsync::platform {

// Identifier of the packaged application the process runs as: the main
// bundle identifier on macOS, the Flatpak/Snap application id on Linux.
// Empty when running unpackaged (e.g. from a build tree).
std::string PackagedAppIdentity();

std::string HostName();
std::string OsDescription();

}  // namespace clipsync::platform

#endif  // CLIPSYNC_PLATFORM_IDENTITY_H
