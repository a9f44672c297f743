#include <cassert>
#include <fstream>
#include <iostream>
#include <string>

#include "clipsync_config.h"
#include "test_support.h"

using clipsync::ClipsyncConfig;
using clipsync::CredentialBackend;
using clipsync::LoadClipsyncConfig;

namespace plog = clipsync::platform::log;

static void WriteFile(const std::string& path, const std::string& content) {
  std::ofstream f(path, std::ios::binary);
  f << content;
}

int main() {
  const auto dir = clipsync::testing::TempDir("clipsync_config_test");

  {
    const std::string path = (dir / "full.ini").string();
    WriteFile(path,
              "# clipsync\n"
              "[app]\nbundle_id = com.example.clipboard  ; packaged id\n"
              "[sync]\nresume_on_start=off\nprobe_timeout_ms=2500\n"
              "account_timeout_ms=0\nflush_timeout_ms=999999\n"
              "propagation_grace_ms=250\nworker_threads=64\n"
              "[storage]\npreferences_path=/tmp/prefs.ini\ncredential_backend=memory\n"
              "[log]\nlevel=debug\n"
              "[unknown]\nwhatever=1\n");
    ClipsyncConfig cfg;
    std::string err;
    bool ok = LoadClipsyncConfig(path, cfg, err);
    assert(ok);
    assert(cfg.app.bundle_id == "com.example.clipboard");
    assert(!cfg.sync.resume_on_start);
    assert(cfg.sync.probe_timeout_ms == 2500);
    assert(cfg.sync.account_timeout_ms == 10000);
    assert(cfg.sync.flush_timeout_ms == 120000);
    assert(cfg.sync.propagation_grace_ms == 250);
    assert(cfg.sync.worker_threads == 8);
    assert(cfg.storage.preferences_path == "/tmp/prefs.ini");
    assert(cfg.storage.credential_backend == CredentialBackend::kMemory);
    assert(cfg.log.level == plog::Level::kDebug);
  }

  {
    const std::string path = (dir / "empty.ini").string();
    WriteFile(path, "\n");
    ClipsyncConfig cfg;
    std::string err;
    bool ok = LoadClipsyncConfig(path, cfg, err);
    assert(ok);
    assert(cfg.sync.resume_on_start);
    assert(cfg.sync.probe_timeout_ms == 5000);
    assert(cfg.sync.propagation_grace_ms == 1000);
    assert(cfg.sync.worker_threads == 2);
    assert(cfg.storage.credential_backend == CredentialBackend::kPlatform);
    assert(cfg.log.level == plog::Level::kInfo);
  }

  {
    const std::string path = (dir / "bad_timeout.ini").string();
    WriteFile(path, "[sync]\n\nprobe_timeout_ms=5s\n");
    ClipsyncConfig cfg;
    std::string err;
    bool ok = LoadClipsyncConfig(path, cfg, err);
    assert(!ok);
    assert(err == "invalid probe_timeout_ms at line 3");
  }

  {
    const std::string path = (dir / "bad_backend.ini").string();
    WriteFile(path, "[storage]\ncredential_backend=floppy\n");
    ClipsyncConfig cfg;
    std::string err;
    assert(!LoadClipsyncConfig(path, cfg, err));
    assert(err.find("credential_backend") != std::string::npos);
  }

  {
    const std::string path = (dir / "bad_line.ini").string();
    WriteFile(path, "[log]\nlevel\n");
    ClipsyncConfig cfg;
    std::string err;
    assert(!LoadClipsyncConfig(path, cfg, err));
    assert(err == "invalid line 2");
  }

  {
    const std::string path = (dir / "empty_prefs.ini").string();
    WriteFile(path, "[storage]\npreferences_path=\n");
    ClipsyncConfig cfg;
    std::string err;
    assert(!LoadClipsyncConfig(path, cfg, err));
  }

  {
    ClipsyncConfig cfg;
    std::string err;
    assert(!LoadClipsyncConfig((dir / "missing.ini").string(), cfg, err));
    assert(err.find("not found") != std::string::npos);
  }

  std::cout << "clipsync_config_test ok\n";
  return 0;
}
