#include <mandi/SnapshotCache.hpp>
#include <mandi/error.hpp>
#include <mandi/debug.hpp>
#include <stdexcept>

namespace mandi {

SnapshotCache::SnapshotCache(std::shared_ptr<const SnapshotRepository> repository)
    : repository_(std::move(repository)), current_(std::make_shared<const SnapshotSet>())
{
    if (not repository_) throw InvalidInput("SnapshotCache requires a snapshot repository");
}

SnapshotCache::~SnapshotCache() {
    stopRefreshing();
}

std::shared_ptr<const SnapshotSet> SnapshotCache::current() const {
    boost::shared_lock<boost::shared_mutex> lock(current_mutex_);
    return current_;
}

uint64_t SnapshotCache::generation() const {
    return current()->generation();
}

uint64_t SnapshotCache::refresh() {
    std::lock_guard<std::mutex> refresh_lock(refresh_mutex_);

    // Build the new generation without blocking readers
    auto fresh = std::make_shared<const SnapshotSet>(repository_->fetchAll(), next_generation_);
    const uint64_t gen = next_generation_++;

    {
        boost::unique_lock<boost::shared_mutex> lock(current_mutex_);
        current_ = std::move(fresh);
    }
    MANDI_DBG("swapped in snapshot generation " << gen);
    return gen;
}

uint64_t SnapshotCache::invalidate() {
    MANDI_DBG("invalidating snapshot generation " << generation());
    return refresh();
}

void SnapshotCache::refreshEvery(std::chrono::milliseconds interval) {
    if (interval.count() <= 0) throw InvalidInput("Refresh interval must be positive");
    std::lock_guard<std::mutex> control(control_mutex_);
    stopRefresher();
    {
        std::lock_guard<std::mutex> lock(refresher_mutex_);
        stop_ = false;
        running_ = true;
    }
    refresher_ = std::thread(&SnapshotCache::refresherLoop, this, interval);
}

void SnapshotCache::stopRefreshing() {
    std::lock_guard<std::mutex> control(control_mutex_);
    stopRefresher();
}

void SnapshotCache::stopRefresher() {
    {
        std::lock_guard<std::mutex> lock(refresher_mutex_);
        stop_ = true;
        running_ = false;
    }
    refresher_cv_.notify_all();
    if (refresher_.joinable()) refresher_.join();
}

bool SnapshotCache::refreshing() const {
    std::lock_guard<std::mutex> lock(refresher_mutex_);
    return running_;
}

boost::optional<std::string> SnapshotCache::lastRefreshError() const {
    std::lock_guard<std::mutex> lock(refresher_mutex_);
    return last_error_;
}

void SnapshotCache::refresherLoop(std::chrono::milliseconds interval) {
    std::unique_lock<std::mutex> lock(refresher_mutex_);
    while (not stop_) {
        if (refresher_cv_.wait_for(lock, interval, [this] { return stop_; }))
            break;

        lock.unlock();
        boost::optional<std::string> error;
        try {
            refresh();
        }
        catch (const std::exception &e) {
            MANDI_TDBG("scheduled refresh failed, keeping generation " << generation() << ": " << e.what());
            error = std::string(e.what());
        }
        lock.lock();
        last_error_ = std::move(error);
    }
}

}
