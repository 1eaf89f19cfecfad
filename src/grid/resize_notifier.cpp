#include "grid/resize_notifier.h"

#include <vector>

#include "logger.h"

SubscriptionId ContainerResizeNotifier::subscribe(ResizeCallback callback) {
  if (!callback) {
    LOG_WARN("[ResizeNotifier] subscribe() without callback");
    return 0;
  }
  SubscriptionId id = next_id_++;
  Subscriber subscriber;
  subscriber.callback = std::move(callback);
  subscribers_.emplace(id, std::move(subscriber));
  return id;
}

void ContainerResizeNotifier::unsubscribe(SubscriptionId id) {
  subscribers_.erase(id);
}

bool ContainerResizeNotifier::notify(const ContainerSize& size) {
  bool changed = !last_size_.has_value() || *last_size_ != size;
  last_size_ = size;

  std::vector<SubscriptionId> ids;
  ids.reserve(subscribers_.size());
  for (const auto& [id, subscriber] : subscribers_) {
    if (changed || subscriber.needs_initial) {
      ids.push_back(id);
    }
  }

  for (SubscriptionId id : ids) {
    auto it = subscribers_.find(id);
    if (it == subscribers_.end()) {
      continue;
    }
    it->second.needs_initial = false;
    ResizeCallback callback = it->second.callback;
    callback(size);
  }

  if (changed) {
    LOG_TRACE("[ResizeNotifier] Container {}x{} -> {} subscriber(s)", size.width, size.height, ids.size());
  }
  return !ids.empty();
}
