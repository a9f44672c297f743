#ifndef CLIPSYNC_SYNC_BACKEND_H
#define CLIPSYNC_SYNC_BACKEND_H

#include <string>

#include "sync_state.h"

namespace clipsync {

// Identity a development build reports; never entitled to the backend.
inline constexpr char kDevelopmentAppIdentity[] = "ClipboardManager";

struct BackendProbe {
  bool available{false};
  std::string message;
};

// Remote, eventually-consistent replicated store. Calls may block; the
// orchestrator only invokes them from worker threads and bounds them with
// timeouts.
class SyncBackend {
 public:
  virtual ~SyncBackend() = default;

  virtual BackendProbe Probe() = 0;
  virtual bool QueryAccountStatus(AccountStatus& out, std::string& error) = 0;
};

// Refuses service unless the process runs as a packaged, entitled
// application. Decisions are made locally and immediately, so an unpackaged
// build never reaches (or waits on) the real backend.
class EntitlementGatedBackend : public SyncBackend {
 public:
  // `inner` may be null: the gate then reports unavailable for every
  // identity. Not owned; must outlive this object.
  EntitlementGatedBackend(std::string app_identity, SyncBackend* inner);

  BackendProbe Probe() override;
  bool QueryAccountStatus(AccountStatus& out, std::string& error) override;

  const std::string& app_identity() const { return app_identity_; }

 private:
  bool Admit(std::string& message) const;

  const std::string app_identity_;
  SyncBackend* inner_;
};

// Configured identity when set, otherwise the platform's packaged identity.
std::string ResolveAppIdentity(const std::string& configured);

}  // namespace clipsync

#endif  // CLIPSYNC_SYNC_BACKEND_H
