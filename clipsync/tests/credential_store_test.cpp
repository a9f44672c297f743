#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "credential_store.h"

using clipsync::CredentialLoadResult;
using clipsync::MemoryCredentialStore;

int main() {
  const std::string id = clipsync::kEncryptionKeyIdentifier;
  const std::vector<std::uint8_t> first(32, 0x11);
  const std::vector<std::uint8_t> second(32, 0x22);

  MemoryCredentialStore store;
  std::string err;
  CredentialLoadResult loaded;

  assert(store.Load(id, loaded, err));
  assert(err.empty());
  assert(!loaded.found);
  assert(loaded.data.empty());

  // Repeated saves replace the entry instead of failing as duplicates.
  assert(store.Save(id, first, err));
  assert(store.Save(id, second, err));
  assert(store.entry_count() == 1);
  assert(store.Load(id, loaded, err));
  assert(loaded.found);
  assert(loaded.data == second);

  assert(store.Save("other", first, err));
  assert(store.entry_count() == 2);

  assert(store.Remove(id, err));
  assert(store.Remove(id, err));
  assert(store.Load(id, loaded, err));
  assert(!loaded.found);
  assert(store.entry_count() == 1);

  store.SetFailSaves(true);
  assert(!store.Save(id, first, err));
  assert(!err.empty());
  store.SetFailSaves(false);
  assert(store.Save(id, first, err));
  assert(err.empty());

  store.SetFailLoads(true);
  loaded.found = true;
  assert(!store.Load(id, loaded, err));
  assert(!loaded.found);
  assert(!err.empty());
  store.SetFailLoads(false);

  assert(store.save_count() == 5);
  assert(store.load_count() == 4);

  std::cout << "credential_store_test ok\n";
  return 0;
}
