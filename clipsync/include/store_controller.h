#ifndef CLIPSYNC_STORE_CONTROLLER_H
#define CLIPSYNC_STORE_CONTROLLER_H

#include <string>

namespace clipsync {

// Local persistent store of clipboard entries, as seen by sync. Saving it is
// what hands pending writes to the replication backend.
class StoreController {
 public:
  virtual ~StoreController() = default;

  virtual bool HasPendingChanges() = 0;
  virtual bool Flush(std::string& error) = 0;
};

}  // namespace clipsync

#endif  // CLIPSYNC_STORE_CONTROLLER_H
