#include "credential_store.h"

#include <utility>

#include "platform_log.h"
#include "platform_secure_store.h"
#include "secure_buffer.h"

namespace clipsync {

namespace plog = clipsync::platform::log;

namespace {

constexpr char kLogTag[] = "credential_store";

}  // namespace

PlatformCredentialStore::PlatformCredentialStore(std::string service)
    : service_(std::move(service)) {}

bool PlatformCredentialStore::Save(const std::string& identifier,
                                   const std::vector<std::uint8_t>& bytes,
                                   std::string& error) {
  if (!platform::SecureItemReplace(service_, identifier, bytes, error)) {
    plog::Log(plog::Level::kWarn, kLogTag, "save failed",
              {{"identifier", identifier}, {"error", error}});
    return false;
  }
  plog::Log(plog::Level::kDebug, kLogTag, "saved",
            {{"identifier", identifier}});
  return true;
}

bool PlatformCredentialStore::Load(const std::string& identifier,
                                   CredentialLoadResult& out,
                                   std::string& error) {
  out = CredentialLoadResult{};
  if (!platform::SecureItemLoad(service_, identifier, out.data, out.found,
                                error)) {
    plog::Log(plog::Level::kWarn, kLogTag, "load failed",
              {{"identifier", identifier}, {"error", error}});
    return false;
  }
  return true;
}

bool PlatformCredentialStore::Remove(const std::string& identifier,
                                     std::string& error) {
  return platform::SecureItemDelete(service_, identifier, error);
}

MemoryCredentialStore::~MemoryCredentialStore() {
  for (auto& entry : entries_) {
    common::SecureWipe(entry.second);
  }
}

bool MemoryCredentialStore::Save(const std::string& identifier,
                                 const std::vector<std::uint8_t>& bytes,
                                 std::string& error) {
  error.clear();
  std::lock_guard<std::mutex> lock(mutex_);
  ++save_count_;
  if (fail_saves_) {
    error = "memory store save disabled";
    return false;
  }
  auto it = entries_.find(identifier);
  if (it != entries_.end()) {
    common::SecureWipe(it->second);
    entries_.erase(it);
  }
  entries_.emplace(identifier, bytes);
  return true;
}

bool MemoryCredentialStore::Load(const std::string& identifier,
                                 CredentialLoadResult& out,
                                 std::string& error) {
  error.clear();
  out = CredentialLoadResult{};
  std::lock_guard<std::mutex> lock(mutex_);
  ++load_count_;
  if (fail_loads_) {
    error = "memory store load disabled";
    return false;
  }
  const auto it = entries_.find(identifier);
  if (it != entries_.end()) {
    out.found = true;
    out.data = it->second;
  }
  return true;
}

bool MemoryCredentialStore::Remove(const std::string& identifier,
                                   std::string& error) {
  error.clear();
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(identifier);
  if (it != entries_.end()) {
    common::SecureWipe(it->second);
    entries_.erase(it);
  }
  return true;
}

void MemoryCredentialStore::SetFailSaves(bool fail) {
  std::lock_guard<std::mutex> lock(mutex_);
  fail_saves_ = fail;
}

void MemoryCredentialStore::SetFailLoads(bool fail) {
  std::lock_guard<std::mutex> lock(mutex_);
  fail_loads_ = fail;
}

std::size_t MemoryCredentialStore::entry_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

std::size_t MemoryCredentialStore::save_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return save_count_;
}

std::size_t MemoryCredentialStore::load_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return load_count_;
}

}  // namespace clipsync
