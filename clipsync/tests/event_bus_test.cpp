#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "event_bus.h"

using clipsync::Event;
using clipsync::EventBus;
using clipsync::EventKind;

int main() {
  EventBus bus;
  std::vector<std::string> order;

  const auto a = bus.Subscribe(EventKind::kRemoteStoreChanged,
                               [&order](const Event& e) { order.push_back("a:" + e.source); });
  const auto b = bus.Subscribe(EventKind::kRemoteStoreChanged,
                               [&order](const Event& e) { order.push_back("b:" + e.source); });
  bus.Subscribe(EventKind::kAccountChanged,
                [&order](const Event&) { order.push_back("account"); });
  assert(bus.subscriber_count(EventKind::kRemoteStoreChanged) == 2);
  assert(bus.subscriber_count(EventKind::kClipboardDataChanged) == 0);

  Event remote;
  remote.kind = EventKind::kRemoteStoreChanged;
  remote.source = "peer";
  assert(bus.Publish(remote) == 2);
  assert(order.size() == 2);
  assert(order[0] == "a:peer");
  assert(order[1] == "b:peer");

  Event reload;
  reload.kind = EventKind::kClipboardDataChanged;
  assert(bus.Publish(reload) == 0);

  bus.Unsubscribe(a);
  bus.Unsubscribe(a);
  order.clear();
  assert(bus.Publish(remote) == 1);
  assert(order.size() == 1 && order[0] == "b:peer");

  // Handlers may publish and unsubscribe themselves.
  int reloads = 0;
  bus.Subscribe(EventKind::kClipboardDataChanged, [&reloads](const Event&) { ++reloads; });
  EventBus::Token self = 0;
  self = bus.Subscribe(EventKind::kAccountChanged, [&bus, &self](const Event&) {
    Event out;
    out.kind = EventKind::kClipboardDataChanged;
    bus.Publish(out);
    bus.Unsubscribe(self);
  });
  Event account;
  account.kind = EventKind::kAccountChanged;
  assert(bus.Publish(account) == 2);
  assert(reloads == 1);
  assert(bus.Publish(account) == 1);
  assert(reloads == 1);

  bus.Unsubscribe(b);
  assert(bus.subscriber_count(EventKind::kRemoteStoreChanged) == 0);
  assert(std::string(clipsync::EventKindName(EventKind::kClipboardDataChanged)) ==
         "clipboard_data_changed");

  std::cout << "event_bus_test ok\n";
  return 0;
}
