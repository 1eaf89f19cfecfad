#include "grid/visibility_monitor.h"

#include <algorithm>
#include <vector>

#include "logger.h"

ObservationId ViewportVisibilityMonitor::observe(const VisibilityTarget& target,
    const VisibilityOptions& options, VisibilityCallback callback) {
  if (!callback) {
    LOG_WARN("[VisibilityMonitor] observe() without callback for '{}'", target.id);
    return INVALID_OBSERVATION;
  }
  ObservationId id = next_id_++;
  ObservationRecord record;
  record.target = target;
  record.options = options;
  record.callback = std::move(callback);
  observations_.emplace(id, std::move(record));
  return id;
}

void ViewportVisibilityMonitor::update_target(ObservationId id, const GridRect& bounds) {
  auto it = observations_.find(id);
  if (it != observations_.end()) {
    it->second.target.bounds = bounds;
  }
}

void ViewportVisibilityMonitor::disconnect(ObservationId id) {
  observations_.erase(id);
}

float ViewportVisibilityMonitor::intersection_ratio(const GridRect& target, const GridRect& viewport,
    float margin) {
  GridRect root = viewport.expanded(margin);
  GridRect overlap = intersect_rects(target, root);

  float target_area = target.area();
  if (target_area <= 0.0f) {
    // Degenerate boxes count as fully visible when they touch the root
    bool touches = target.x <= root.right() && target.right() >= root.x &&
      target.y <= root.bottom() && target.bottom() >= root.y;
    return touches ? 1.0f : 0.0f;
  }
  return std::clamp(overlap.area() / target_area, 0.0f, 1.0f);
}

size_t ViewportVisibilityMonitor::process(const GridRect& viewport) {
  // Snapshot ids: callbacks may disconnect any observation, including their own
  std::vector<ObservationId> ids;
  ids.reserve(observations_.size());
  for (const auto& [id, record] : observations_) {
    ids.push_back(id);
  }

  size_t delivered = 0;
  for (ObservationId id : ids) {
    auto it = observations_.find(id);
    if (it == observations_.end()) {
      continue;
    }
    ObservationRecord& record = it->second;
    float ratio = intersection_ratio(record.target.bounds, viewport, record.options.root_margin);
    bool intersecting = ratio > 0.0f && ratio >= record.options.threshold;
    if (record.delivered && intersecting == record.last_intersecting) {
      continue;
    }
    record.delivered = true;
    record.last_intersecting = intersecting;

    VisibilityEntry entry;
    entry.id = record.target.id;
    entry.is_intersecting = intersecting;
    entry.intersection_ratio = ratio;

    // Copy: the record (and its callback) may be erased while the callback runs
    VisibilityCallback callback = record.callback;
    callback(entry);
    ++delivered;
  }
  return delivered;
}
