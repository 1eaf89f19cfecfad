#include "thumbnail_loader.h"

#include <algorithm>

#include "logger.h"

ThumbnailLoader::ThumbnailLoader(DecodeFunction decode, int worker_count, size_t max_outstanding)
  : decode_(std::move(decode)), worker_count_(std::max(1, worker_count)),
  max_outstanding_(std::max<size_t>(1, max_outstanding)), running_(false) {
}

ThumbnailLoader::~ThumbnailLoader() {
  stop();
}

bool ThumbnailLoader::start() {
  if (running_) {
    return true;
  }
  if (!decode_) {
    LOG_ERROR("[Thumbnails] Cannot start without a decode function");
    return false;
  }

  running_ = true;
  for (int i = 0; i < worker_count_; ++i) {
    workers_.emplace_back(&ThumbnailLoader::worker_loop, this);
  }
  LOG_INFO("[Thumbnails] Started {} workers, at most {} outstanding", worker_count_, max_outstanding_);
  return true;
}

void ThumbnailLoader::stop() {
  if (!running_) {
    return;
  }

  {
    // Must change under the lock or a worker about to wait misses the wakeup
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  queue_condition_.notify_all();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();

  std::lock_guard<std::mutex> lock(mutex_);
  queue_.clear();
  completed_.clear();
  outstanding_.clear();
  LOG_DEBUG("[Thumbnails] Stopped");
}

bool ThumbnailLoader::request(const ThumbnailRequest& request) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (outstanding_.count(request.id) > 0 || outstanding_.size() >= max_outstanding_) {
      return false;
    }
    outstanding_.insert(request.id);
    queue_.push_back(request);
  }
  queue_condition_.notify_one();
  return true;
}

bool ThumbnailLoader::is_outstanding(const ItemId& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return outstanding_.count(id) > 0;
}

bool ThumbnailLoader::cancel(const ItemId& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::find_if(queue_.begin(), queue_.end(),
    [&id](const ThumbnailRequest& queued) { return queued.id == id; });
  if (it == queue_.end()) {
    return false;
  }
  queue_.erase(it);
  outstanding_.erase(id);
  return true;
}

size_t ThumbnailLoader::cancel_except(const std::unordered_set<ItemId>& keep) {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t before = queue_.size();
  auto first_removed = std::remove_if(queue_.begin(), queue_.end(),
    [this, &keep](const ThumbnailRequest& queued) {
      if (keep.count(queued.id) > 0) {
        return false;
      }
      outstanding_.erase(queued.id);
      return true;
    });
  queue_.erase(first_removed, queue_.end());
  size_t dropped = before - queue_.size();
  if (dropped > 0) {
    LOG_TRACE("[Thumbnails] Cancelled {} stale requests", dropped);
  }
  return dropped;
}

std::vector<ThumbnailResult> ThumbnailLoader::take_completed(size_t max_count) {
  std::vector<ThumbnailResult> results;
  std::lock_guard<std::mutex> lock(mutex_);
  while (!completed_.empty() && results.size() < max_count) {
    outstanding_.erase(completed_.front().id);
    results.push_back(std::move(completed_.front()));
    completed_.pop_front();
  }
  return results;
}

size_t ThumbnailLoader::outstanding_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return outstanding_.size();
}

size_t ThumbnailLoader::queued_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

void ThumbnailLoader::worker_loop() {
  while (true) {
    ThumbnailRequest request;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      queue_condition_.wait(lock, [this]() { return !running_ || !queue_.empty(); });
      if (!running_) {
        return;
      }
      request = std::move(queue_.back());
      queue_.pop_back();
    }

    ThumbnailResult result;
    result.id = request.id;
    result.image = decode_(request);
    result.success = result.image.is_valid();
    if (!result.success) {
      LOG_WARN("[Thumbnails] Failed to decode '{}'", request.path.empty() ? request.id : request.path);
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (running_) {
        completed_.push_back(std::move(result));
      }
    }
  }
}

ThumbnailRetryTracker::ThumbnailRetryTracker(int max_attempts, size_t capacity)
  : max_attempts_(std::max(1, max_attempts)), capacity_(std::max<size_t>(1, capacity)) {
}

bool ThumbnailRetryTracker::record_failure(const ItemId& id) {
  auto it = index_.find(id);
  if (it == index_.end()) {
    order_.push_front(FailureRecord{ id, 0 });
    it = index_.emplace(id, order_.begin()).first;
    if (order_.size() > capacity_) {
      index_.erase(order_.back().id);
      order_.pop_back();
    }
  } else {
    order_.splice(order_.begin(), order_, it->second);
  }

  FailureRecord& record = *it->second;
  record.attempts = std::min(record.attempts + 1, max_attempts_);
  return record.attempts >= max_attempts_;
}

bool ThumbnailRetryTracker::has_given_up(const ItemId& id) const {
  return attempts(id) >= max_attempts_;
}

int ThumbnailRetryTracker::attempts(const ItemId& id) const {
  auto it = index_.find(id);
  return it == index_.end() ? 0 : it->second->attempts;
}

void ThumbnailRetryTracker::forget(const ItemId& id) {
  auto it = index_.find(id);
  if (it == index_.end()) {
    return;
  }
  order_.erase(it->second);
  index_.erase(it);
}

void ThumbnailRetryTracker::clear() {
  order_.clear();
  index_.clear();
}
