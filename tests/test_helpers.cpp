#include "test_helpers.h"
#include <atomic>
#include <fstream>
#include <random>
#include <thread>

namespace fs = std::filesystem;

std::vector<ItemId> make_ids(int count, const std::string& prefix) {
    std::vector<ItemId> ids;
    ids.reserve(static_cast<size_t>(count > 0 ? count : 0));
    for (int i = 0; i < count; ++i) {
        ids.push_back(prefix + std::to_string(i));
    }
    return ids;
}

bool wait_until(const std::function<bool()>& predicate, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

TempDirectory::TempDirectory(const std::string& label) {
    static std::atomic<int> counter{ 0 };
    std::random_device device;
    path_ = fs::temp_directory_path() /
        (label + "_" + std::to_string(device()) + "_" + std::to_string(counter++));
    fs::create_directories(path_);
}

TempDirectory::~TempDirectory() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

fs::path TempDirectory::write_file(const std::string& relative_path, const std::string& contents) {
    fs::path file_path = path_ / fs::u8path(relative_path);
    fs::create_directories(file_path.parent_path());
    std::ofstream out(file_path, std::ios::binary);
    out << contents;
    return file_path;
}

// MockVisibilityMonitor implementation

ObservationId MockVisibilityMonitor::observe(const VisibilityTarget& target, const VisibilityOptions& options,
    VisibilityCallback callback) {
    observe_calls++;
    if (refuse || !callback) {
        return INVALID_OBSERVATION;
    }
    ObservationId id = next_id_++;
    Record record;
    record.target = target;
    record.options = options;
    record.callback = std::move(callback);
    records.emplace(id, std::move(record));
    return id;
}

void MockVisibilityMonitor::update_target(ObservationId id, const GridRect& bounds) {
    auto it = records.find(id);
    if (it != records.end() && it->second.connected) {
        it->second.target.bounds = bounds;
        update_calls++;
    }
}

void MockVisibilityMonitor::disconnect(ObservationId id) {
    auto it = records.find(id);
    if (it != records.end() && it->second.connected) {
        it->second.connected = false;
        disconnect_calls++;
    }
}

bool MockVisibilityMonitor::fire(ObservationId id, bool intersecting) {
    auto it = records.find(id);
    if (it == records.end() || !it->second.connected) {
        return false;
    }
    return fire_stale(id, intersecting);
}

bool MockVisibilityMonitor::fire_stale(ObservationId id, bool intersecting) {
    auto it = records.find(id);
    if (it == records.end()) {
        return false;
    }
    VisibilityEntry entry;
    entry.id = it->second.target.id;
    entry.is_intersecting = intersecting;
    entry.intersection_ratio = intersecting ? 1.0f : 0.0f;
    VisibilityCallback callback = it->second.callback;
    callback(entry);
    return true;
}

bool MockVisibilityMonitor::fire_for(const ItemId& item, bool intersecting) {
    std::vector<ObservationId> ids;
    for (const auto& [id, record] : records) {
        if (record.connected && record.target.id == item) {
            ids.push_back(id);
        }
    }
    for (ObservationId id : ids) {
        fire(id, intersecting);
    }
    return !ids.empty();
}

size_t MockVisibilityMonitor::connected_count() const {
    size_t count = 0;
    for (const auto& [id, record] : records) {
        if (record.connected) {
            count++;
        }
    }
    return count;
}

ObservationId MockVisibilityMonitor::last_observation_for(const ItemId& item) const {
    ObservationId last = INVALID_OBSERVATION;
    for (const auto& [id, record] : records) {
        if (record.target.id == item) {
            last = id;
        }
    }
    return last;
}

// MockResizeNotifier implementation

SubscriptionId MockResizeNotifier::subscribe(ResizeCallback callback) {
    SubscriptionId id = next_id_++;
    callbacks_.emplace(id, std::move(callback));
    return id;
}

void MockResizeNotifier::unsubscribe(SubscriptionId id) {
    callbacks_.erase(id);
}

void MockResizeNotifier::resize(float width, float height) {
    ContainerSize size;
    size.width = width;
    size.height = height;
    auto snapshot = callbacks_;
    for (auto& [id, callback] : snapshot) {
        callback(size);
    }
}
