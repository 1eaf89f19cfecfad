#pragma once

#include <cstdint>
#include <functional>
#include <map>

#include "grid/grid_types.h"

using ObservationId = uint64_t;
constexpr ObservationId INVALID_OBSERVATION = 0;

struct VisibilityOptions {
  float root_margin = 100.0f;  // Pre-trigger margin around the viewport, in pixels
  float threshold = 0.01f;     // Minimum intersection ratio that counts as visible
};

// The observed node: an item and its box in grid content coordinates
struct VisibilityTarget {
  ItemId id;
  GridRect bounds;
};

struct VisibilityEntry {
  ItemId id;
  bool is_intersecting = false;
  float intersection_ratio = 0.0f;
};

using VisibilityCallback = std::function<void(const VisibilityEntry&)>;

// Visibility detection service (intersection observer). Signals are delivered asynchronously:
// observe() never invokes the callback directly.
class VisibilityMonitor {
public:
  virtual ~VisibilityMonitor() = default;

  virtual ObservationId observe(const VisibilityTarget& target, const VisibilityOptions& options,
    VisibilityCallback callback) = 0;

  // Target box moved (relayout after resize or list mutation)
  virtual void update_target(ObservationId id, const GridRect& bounds) = 0;

  // Stops delivering signals for an observation. Unknown ids are ignored.
  virtual void disconnect(ObservationId id) = 0;
};

// RAII handle that disconnects its observation when reset or destroyed
class Observation {
public:
  Observation() = default;
  Observation(VisibilityMonitor* monitor, ObservationId id) : monitor_(monitor), id_(id) {}
  ~Observation() { disconnect(); }

  Observation(const Observation&) = delete;
  Observation& operator=(const Observation&) = delete;

  Observation(Observation&& other) noexcept : monitor_(other.monitor_), id_(other.id_) {
    other.monitor_ = nullptr;
    other.id_ = INVALID_OBSERVATION;
  }

  Observation& operator=(Observation&& other) noexcept {
    if (this != &other) {
      disconnect();
      monitor_ = other.monitor_;
      id_ = other.id_;
      other.monitor_ = nullptr;
      other.id_ = INVALID_OBSERVATION;
    }
    return *this;
  }

  void disconnect() {
    if (monitor_ && id_ != INVALID_OBSERVATION) {
      monitor_->disconnect(id_);
    }
    monitor_ = nullptr;
    id_ = INVALID_OBSERVATION;
  }

  void update_target(const GridRect& bounds) {
    if (monitor_ && id_ != INVALID_OBSERVATION) {
      monitor_->update_target(id_, bounds);
    }
  }

  bool active() const { return monitor_ != nullptr && id_ != INVALID_OBSERVATION; }
  ObservationId id() const { return id_; }

private:
  VisibilityMonitor* monitor_ = nullptr;
  ObservationId id_ = INVALID_OBSERVATION;
};

// Viewport-driven implementation for immediate-mode hosts. The host reports item boxes through
// update_target() during layout and calls process() once per frame with the visible content rect;
// callbacks fire for the first pass after observe() and whenever the intersecting state flips.
class ViewportVisibilityMonitor : public VisibilityMonitor {
public:
  ViewportVisibilityMonitor() = default;

  ObservationId observe(const VisibilityTarget& target, const VisibilityOptions& options,
    VisibilityCallback callback) override;
  void update_target(ObservationId id, const GridRect& bounds) override;
  void disconnect(ObservationId id) override;

  // Delivers pending signals; returns the number of callbacks invoked
  size_t process(const GridRect& viewport);

  size_t observation_count() const { return observations_.size(); }

  // Intersection ratio of target inside viewport grown by margin
  static float intersection_ratio(const GridRect& target, const GridRect& viewport, float margin);

private:
  struct ObservationRecord {
    VisibilityTarget target;
    VisibilityOptions options;
    VisibilityCallback callback;
    bool delivered = false;
    bool last_intersecting = false;
  };

  ObservationId next_id_ = 1;
  std::map<ObservationId, ObservationRecord> observations_;
};
