#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <list>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "grid/grid_types.h"
#include "image_data.h"

struct ThumbnailRequest {
  ItemId id;
  std::string path;  // Empty for synthetic items
};

struct ThumbnailResult {
  ItemId id;
  ImageData image;
  bool success = false;
};

using DecodeFunction = std::function<ImageData(const ThumbnailRequest&)>;

// Decodes thumbnails on worker threads. Bounded: at most max_outstanding requests may be queued,
// decoding or waiting to be taken at any time. The newest request is decoded first so the rows the
// user is looking at win over rows already scrolled past.
class ThumbnailLoader {
public:
  ThumbnailLoader(DecodeFunction decode, int worker_count, size_t max_outstanding);
  ~ThumbnailLoader();

  ThumbnailLoader(const ThumbnailLoader&) = delete;
  ThumbnailLoader& operator=(const ThumbnailLoader&) = delete;

  bool start();
  void stop();
  bool is_running() const { return running_; }

  // Returns false when the id is already outstanding or the loader is full
  bool request(const ThumbnailRequest& request);

  bool is_outstanding(const ItemId& id) const;

  // Drops a request that has not started decoding. Returns true when it was removed.
  bool cancel(const ItemId& id);

  // Drops every queued request whose id is not in keep; returns the number dropped
  size_t cancel_except(const std::unordered_set<ItemId>& keep);

  // Finished decodes, oldest first, at most max_count
  std::vector<ThumbnailResult> take_completed(size_t max_count);

  size_t outstanding_count() const;
  size_t queued_count() const;
  size_t max_outstanding() const { return max_outstanding_; }

private:
  void worker_loop();

  DecodeFunction decode_;
  int worker_count_;
  size_t max_outstanding_;

  std::vector<std::thread> workers_;
  std::atomic<bool> running_;

  mutable std::mutex mutex_;
  std::condition_variable queue_condition_;
  std::deque<ThumbnailRequest> queue_;  // Back is newest
  std::deque<ThumbnailResult> completed_;
  std::unordered_set<ItemId> outstanding_;
};

// Failed decode attempts per item id, kept after the item leaves the screen so a broken file is not
// decoded again on every scroll back. Bounded; the least recently failed id is forgotten first.
class ThumbnailRetryTracker {
public:
  ThumbnailRetryTracker(int max_attempts, size_t capacity);

  // Counts one failed attempt; returns true once the retry budget is spent
  bool record_failure(const ItemId& id);

  bool has_given_up(const ItemId& id) const;
  int attempts(const ItemId& id) const;

  // Called after a successful decode
  void forget(const ItemId& id);
  void clear();

  size_t size() const { return index_.size(); }
  int max_attempts() const { return max_attempts_; }

private:
  struct FailureRecord {
    ItemId id;
    int attempts = 0;
  };

  int max_attempts_;
  size_t capacity_;
  std::list<FailureRecord> order_;  // Front is most recent
  std::unordered_map<ItemId, std::list<FailureRecord>::iterator> index_;
};
