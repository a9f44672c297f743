#ifndef CLIPSYNC_EVENT_BUS_H
#define CLIPSYNC_EVENT_BUS_H

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace clipsync {

enum class EventKind : std::uint8_t {
  // Backend push: another device wrote to the replicated store.
  kRemoteStoreChanged = 0,
  // Backend signal: the device's sync account credentials changed.
  kAccountChanged = 1,
  // Local broadcast: clipboard history should be reloaded.
  kClipboardDataChanged = 2
};

const char* EventKindName(EventKind kind);

struct Event {
  EventKind kind{EventKind::kRemoteStoreChanged};
  std::string source;
  std::uint64_t unix_ms{0};
};

// Explicitly wired publish/subscribe channel. Handlers run synchronously on
// the publishing thread, in subscription order; a handler may publish or
// unsubscribe without deadlocking.
class EventBus {
 public:
  using Handler = std::function<void(const Event&)>;
  using Token = std::uint64_t;

  EventBus() = default;
  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  Token Subscribe(EventKind kind, Handler handler);
  void Unsubscribe(Token token);
  // Returns the number of handlers invoked.
  std::size_t Publish(const Event& event);

  std::size_t subscriber_count(EventKind kind) const;

 private:
  struct Entry {
    Token token;
    EventKind kind;
    Handler handler;
  };

  mutable std::mutex mutex_;
  std::vector<Entry> entries_;
  Token next_token_{1};
};

}  // namespace clipsync

#endif  // CLIPSYNC_EVENT_BUS_H
