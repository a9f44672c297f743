#include "sync_backend.h"

#include <utility>

#include "platform_identity.h"
#include "platform_log.h"

namespace clipsync {

namespace plog = clipsync::platform::log;

namespace {

constexpr char kLogTag[] = "sync_backend";

}  // namespace

EntitlementGatedBackend::EntitlementGatedBackend(std::string app_identity,
                                                 SyncBackend* inner)
    : app_identity_(std::move(app_identity)), inner_(inner) {}

bool EntitlementGatedBackend::Admit(std::string& message) const {
  if (app_identity_.empty() || app_identity_ == kDevelopmentAppIdentity) {
    message =
        "Sync backend not available in development environment: "
        "requires a packaged application identity";
    return false;
  }
  if (!inner_) {
    message = "Sync backend requires an entitled application build (" +
              app_identity_ + ")";
    return false;
  }
  return true;
}

BackendProbe EntitlementGatedBackend::Probe() {
  BackendProbe probe;
  if (!Admit(probe.message)) {
    plog::Log(plog::Level::kWarn, kLogTag, "backend unavailable",
              {{"app_identity", app_identity_.empty() ? "<none>" : app_identity_},
               {"reason", probe.message}});
    return probe;
  }
  return inner_->Probe();
}

bool EntitlementGatedBackend::QueryAccountStatus(AccountStatus& out,
                                                 std::string& error) {
  error.clear();
  if (!Admit(error)) {
    out = AccountStatus::kUnknown;
    return false;
  }
  return inner_->QueryAccountStatus(out, error);
}

std::string ResolveAppIdentity(const std::string& configured) {
  if (!configured.empty()) {
    return configured;
  }
  return platform::PackagedAppIdentity();
}

}  // namespace clipsync
