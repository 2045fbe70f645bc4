#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace jsgate {

struct RateLimitOptions {
    int max_requests = 10;
    std::chrono::milliseconds window{60000};
};

// Sliding-window admission control keyed by an opaque caller identifier.
// Never throws; denial is a normal return value.
class RateLimiter {
public:
    using TimePoint = std::chrono::steady_clock::time_point;
    using Clock = std::function<TimePoint()>;

    explicit RateLimiter(RateLimitOptions options = {}, Clock clock = nullptr);
    ~RateLimiter();

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    // Records the request and returns true when the identifier is under its cap.
    bool IsAllowed(const std::string& id);
    int GetRemaining(const std::string& id);
    void Reset(const std::string& id);

    // Prunes every record and forgets identifiers with nothing left in the window.
    void Cleanup();

    // Runs Cleanup() every |interval| on a background thread until StopCleanup().
    void StartCleanup(std::chrono::milliseconds interval);
    void StopCleanup();

    size_t TrackedIdentifiers() const;
    const RateLimitOptions& options() const { return options_; }

private:
    struct Record {
        std::mutex mutex;
        std::deque<TimePoint> timestamps;
        // Set once the record is unlinked from the map; holders must look it up again.
        bool retired = false;
    };

    bool Admit(Record& record, const std::string& id);
    std::shared_ptr<Record> FindRecord(const std::string& id) const;
    std::shared_ptr<Record> FindOrCreateRecord(const std::string& id);
    void Prune(Record& record, TimePoint now) const;

    RateLimitOptions options_;
    Clock clock_;

    mutable std::mutex records_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Record>> records_;

    std::mutex cleanup_mutex_;
    std::condition_variable cleanup_cv_;
    std::thread cleanup_thread_;
    bool cleanup_running_ = false;
};

} // namespace jsgate
