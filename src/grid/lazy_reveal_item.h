#pragma once

#include <chrono>
#include <functional>

#include "grid/grid_types.h"
#include "grid/visibility_monitor.h"

enum class RevealState {
  NotObserved,
  Observing,
  Visible  // Terminal
};

const char* reveal_state_to_string(RevealState state);

// Per-item shell that defers the real content until the item nears the viewport.
// While not Visible the host draws a placeholder with the same box so row sizes never shift.
// The observation is disconnected the moment the item becomes Visible and on unmount or destruction.
class LazyRevealItem {
public:
  using Clock = std::chrono::steady_clock;
  using RevealedCallback = std::function<void(const ItemId&)>;

  LazyRevealItem(ItemId id, VisibilityMonitor& monitor, const VisibilityOptions& options,
    float fade_ms = 300.0f);
  ~LazyRevealItem() = default;

  // Observation callbacks capture this
  LazyRevealItem(const LazyRevealItem&) = delete;
  LazyRevealItem& operator=(const LazyRevealItem&) = delete;

  // NotObserved -> Observing. No-op when already mounted or Visible.
  void mount(const GridRect& bounds);

  // Mounts directly in the Visible state (item was revealed before); no fade
  void mount_revealed(const GridRect& bounds);

  // Tears down the observation. A Visible item stays Visible.
  void unmount();

  // Box moved after a relayout
  void set_bounds(const GridRect& bounds);

  // Transition to Visible. Returns false when already Visible.
  bool reveal(Clock::time_point now = Clock::now());

  // Fade-in progress in [0, 1] with ease-out; 0 while not Visible
  float reveal_progress(Clock::time_point now = Clock::now()) const;

  void set_on_revealed(RevealedCallback callback) { on_revealed_ = std::move(callback); }

  const ItemId& id() const { return id_; }
  RevealState state() const { return state_; }
  bool is_visible() const { return state_ == RevealState::Visible; }
  bool is_mounted() const { return mounted_; }
  bool is_observing() const { return observation_.active(); }
  const GridRect& bounds() const { return bounds_; }

private:
  void handle_visibility(const VisibilityEntry& entry);

  ItemId id_;
  VisibilityMonitor& monitor_;
  VisibilityOptions options_;
  float fade_ms_;

  RevealState state_ = RevealState::NotObserved;
  bool mounted_ = false;
  bool animate_ = true;
  GridRect bounds_;
  Clock::time_point revealed_at_;
  RevealedCallback on_revealed_;

  // Declared last so it disconnects before the rest of the item is torn down
  Observation observation_;
};
