#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>

#include "grid/grid_types.h"

using SubscriptionId = uint64_t;
using ResizeCallback = std::function<void(const ContainerSize&)>;

// Resize notification service for the scroll container
class ResizeNotifier {
public:
  virtual ~ResizeNotifier() = default;

  virtual SubscriptionId subscribe(ResizeCallback callback) = 0;
  virtual void unsubscribe(SubscriptionId id) = 0;
};

// RAII handle that unsubscribes when reset or destroyed
class ResizeSubscription {
public:
  ResizeSubscription() = default;
  ResizeSubscription(ResizeNotifier* notifier, SubscriptionId id) : notifier_(notifier), id_(id) {}
  ~ResizeSubscription() { reset(); }

  ResizeSubscription(const ResizeSubscription&) = delete;
  ResizeSubscription& operator=(const ResizeSubscription&) = delete;

  ResizeSubscription(ResizeSubscription&& other) noexcept : notifier_(other.notifier_), id_(other.id_) {
    other.notifier_ = nullptr;
    other.id_ = 0;
  }

  ResizeSubscription& operator=(ResizeSubscription&& other) noexcept {
    if (this != &other) {
      reset();
      notifier_ = other.notifier_;
      id_ = other.id_;
      other.notifier_ = nullptr;
      other.id_ = 0;
    }
    return *this;
  }

  void reset() {
    if (notifier_ && id_ != 0) {
      notifier_->unsubscribe(id_);
    }
    notifier_ = nullptr;
    id_ = 0;
  }

  bool active() const { return notifier_ != nullptr && id_ != 0; }

private:
  ResizeNotifier* notifier_ = nullptr;
  SubscriptionId id_ = 0;
};

// Host-driven notifier: the host reports the container size every frame and subscribers only hear
// about actual changes. New subscribers receive the last known size on the next notify().
class ContainerResizeNotifier : public ResizeNotifier {
public:
  ContainerResizeNotifier() = default;

  SubscriptionId subscribe(ResizeCallback callback) override;
  void unsubscribe(SubscriptionId id) override;

  // Returns true when subscribers were notified
  bool notify(const ContainerSize& size);

  const std::optional<ContainerSize>& last_size() const { return last_size_; }
  size_t subscriber_count() const { return subscribers_.size(); }

private:
  struct Subscriber {
    ResizeCallback callback;
    bool needs_initial = true;
  };

  SubscriptionId next_id_ = 1;
  std::map<SubscriptionId, Subscriber> subscribers_;
  std::optional<ContainerSize> last_size_;
};
