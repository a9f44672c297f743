#include "event_bus.h"

#include <algorithm>
#include <utility>

namespace clipsync {

const char* EventKindName(EventKind kind) {
  switch (kind) {
    case EventKind::kRemoteStoreChanged:
      return "remote_store_changed";
    case EventKind::kAccountChanged:
      return "account_changed";
    case EventKind::kClipboardDataChanged:
      return "clipboard_data_changed";
  }
  return "unknown";
}

EventBus::Token EventBus::Subscribe(EventKind kind, Handler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  const Token token = next_token_++;
  entries_.push_back(Entry{token, kind, std::move(handler)});
  return token;
}

void EventBus::Unsubscribe(Token token) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                [token](const Entry& e) {
                                  return e.token == token;
                                }),
                 entries_.end());
}

std::size_t EventBus::Publish(const Event& event) {
  std::vector<Handler> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : entries_) {
      if (entry.kind == event.kind && entry.handler) {
        targets.push_back(entry.handler);
      }
    }
  }
  for (const auto& handler : targets) {
    handler(event);
  }
  return targets.size();
}

std::size_t EventBus::subscriber_count(EventKind kind) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<std::size_t>(
      std::count_if(entries_.begin(), entries_.end(),
                    [kind](const Entry& e) { return e.kind == kind; }));
}

}  // namespace clipsync
