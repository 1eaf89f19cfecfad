#include "grid/lazy_reveal_item.h"

#include <algorithm>

#include "logger.h"

const char* reveal_state_to_string(RevealState state) {
  switch (state) {
    case RevealState::NotObserved:
      return "NotObserved";
    case RevealState::Observing:
      return "Observing";
    case RevealState::Visible:
      return "Visible";
    default:
      return "Unknown";
  }
}

LazyRevealItem::LazyRevealItem(ItemId id, VisibilityMonitor& monitor, const VisibilityOptions& options,
    float fade_ms)
  : id_(std::move(id)), monitor_(monitor), options_(options), fade_ms_(std::max(0.0f, fade_ms)) {}

void LazyRevealItem::mount(const GridRect& bounds) {
  bounds_ = bounds;
  if (mounted_) {
    return;
  }
  mounted_ = true;
  if (state_ == RevealState::Visible) {
    return;
  }

  VisibilityTarget target;
  target.id = id_;
  target.bounds = bounds_;
  ObservationId observation_id = monitor_.observe(target, options_,
    [this](const VisibilityEntry& entry) { handle_visibility(entry); });
  if (observation_id == INVALID_OBSERVATION) {
    LOG_WARN("[LazyReveal] Monitor refused observation for '{}', revealing immediately", id_);
    reveal();
    return;
  }
  observation_ = Observation(&monitor_, observation_id);
  state_ = RevealState::Observing;
}

void LazyRevealItem::mount_revealed(const GridRect& bounds) {
  bounds_ = bounds;
  mounted_ = true;
  if (state_ != RevealState::Visible) {
    observation_.disconnect();
    state_ = RevealState::Visible;
    animate_ = false;
  }
}

void LazyRevealItem::unmount() {
  observation_.disconnect();
  mounted_ = false;
  if (state_ == RevealState::Observing) {
    state_ = RevealState::NotObserved;
  }
}

void LazyRevealItem::set_bounds(const GridRect& bounds) {
  if (bounds == bounds_) {
    return;
  }
  bounds_ = bounds;
  observation_.update_target(bounds_);
}

bool LazyRevealItem::reveal(Clock::time_point now) {
  if (state_ == RevealState::Visible) {
    return false;
  }
  observation_.disconnect();
  state_ = RevealState::Visible;
  revealed_at_ = now;
  animate_ = true;

  if (on_revealed_) {
    on_revealed_(id_);
  }
  return true;
}

float LazyRevealItem::reveal_progress(Clock::time_point now) const {
  if (state_ != RevealState::Visible) {
    return 0.0f;
  }
  if (!animate_ || fade_ms_ <= 0.0f) {
    return 1.0f;
  }
  float elapsed_ms = std::chrono::duration<float, std::milli>(now - revealed_at_).count();
  float t = std::clamp(elapsed_ms / fade_ms_, 0.0f, 1.0f);
  float inverse = 1.0f - t;
  return 1.0f - inverse * inverse * inverse;
}

void LazyRevealItem::handle_visibility(const VisibilityEntry& entry) {
  // Late signal after teardown
  if (state_ != RevealState::Observing) {
    return;
  }
  if (entry.is_intersecting) {
    reveal();
  }
}
