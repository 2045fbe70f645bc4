#include "src/server/rate_limiter.h"
#include "src/server/logger.h"

#include <algorithm>
#include <vector>

namespace jsgate {

RateLimiter::RateLimiter(RateLimitOptions options, Clock clock)
    : options_(options), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::steady_clock::now(); };
    }
}

RateLimiter::~RateLimiter() {
    StopCleanup();
}

bool RateLimiter::IsAllowed(const std::string& id) {
    for (;;) {
        auto record = FindOrCreateRecord(id);
        std::lock_guard<std::mutex> lock(record->mutex);
        if (record->retired) continue;
        return Admit(*record, id);
    }
}

bool RateLimiter::Admit(Record& record, const std::string& id) {
    TimePoint now = clock_();
    Prune(record, now);

    if (static_cast<int>(record.timestamps.size()) >= options_.max_requests) {
        Logger::Debug("Rate limit reached for ", id);
        return false;
    }
    record.timestamps.push_back(now);
    return true;
}

int RateLimiter::GetRemaining(const std::string& id) {
    auto record = FindRecord(id);
    if (!record) {
        return std::max(0, options_.max_requests);
    }
    std::lock_guard<std::mutex> lock(record->mutex);
    TimePoint now = clock_();
    int live = static_cast<int>(std::count_if(record->timestamps.begin(), record->timestamps.end(),
                                              [&](TimePoint ts) { return now - ts < options_.window; }));
    return std::max(0, options_.max_requests - live);
}

void RateLimiter::Reset(const std::string& id) {
    std::lock_guard<std::mutex> lock(records_mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) return;
    std::lock_guard<std::mutex> record_lock(it->second->mutex);
    it->second->retired = true;
    records_.erase(it);
}

void RateLimiter::Cleanup() {
    std::vector<std::pair<std::string, std::shared_ptr<Record>>> snapshot;
    {
        std::lock_guard<std::mutex> lock(records_mutex_);
        snapshot.assign(records_.begin(), records_.end());
    }

    TimePoint now = clock_();
    size_t removed = 0;
    for (auto& [id, record] : snapshot) {
        bool empty;
        {
            std::lock_guard<std::mutex> record_lock(record->mutex);
            Prune(*record, now);
            empty = record->timestamps.empty();
        }
        if (!empty) continue;

        std::lock_guard<std::mutex> lock(records_mutex_);
        auto it = records_.find(id);
        if (it == records_.end() || it->second != record) continue;
        // Re-check under both locks: a concurrent IsAllowed may have refilled it.
        std::lock_guard<std::mutex> record_lock(record->mutex);
        if (record->timestamps.empty()) {
            record->retired = true;
            records_.erase(it);
            ++removed;
        }
    }
    if (removed > 0) {
        Logger::Debug("Rate limiter cleanup removed ", removed, " idle identifiers");
    }
}

void RateLimiter::StartCleanup(std::chrono::milliseconds interval) {
    std::lock_guard<std::mutex> lock(cleanup_mutex_);
    if (cleanup_running_) return;
    cleanup_running_ = true;
    cleanup_thread_ = std::thread([this, interval]() {
        std::unique_lock<std::mutex> lock(cleanup_mutex_);
        while (cleanup_running_) {
            if (cleanup_cv_.wait_for(lock, interval, [this] { return !cleanup_running_; })) {
                break;
            }
            lock.unlock();
            Cleanup();
            lock.lock();
        }
    });
    Logger::Info("Rate limiter cleanup scheduled every ", interval.count(), " ms");
}

void RateLimiter::StopCleanup() {
    {
        std::lock_guard<std::mutex> lock(cleanup_mutex_);
        if (!cleanup_running_) return;
        cleanup_running_ = false;
    }
    cleanup_cv_.notify_all();
    if (cleanup_thread_.joinable()) {
        cleanup_thread_.join();
    }
}

size_t RateLimiter::TrackedIdentifiers() const {
    std::lock_guard<std::mutex> lock(records_mutex_);
    return records_.size();
}

std::shared_ptr<RateLimiter::Record> RateLimiter::FindRecord(const std::string& id) const {
    std::lock_guard<std::mutex> lock(records_mutex_);
    auto it = records_.find(id);
    return it == records_.end() ? nullptr : it->second;
}

std::shared_ptr<RateLimiter::Record> RateLimiter::FindOrCreateRecord(const std::string& id) {
    std::lock_guard<std::mutex> lock(records_mutex_);
    auto& record = records_[id];
    if (!record) {
        record = std::make_shared<Record>();
    }
    return record;
}

void RateLimiter::Prune(Record& record, TimePoint now) const {
    while (!record.timestamps.empty() && now - record.timestamps.front() >= options_.window) {
        record.timestamps.pop_front();
    }
}

} // namespace jsgate
