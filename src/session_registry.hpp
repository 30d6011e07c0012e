#ifndef SESSION_REGISTRY_HPP
#define SESSION_REGISTRY_HPP

#include "interview_models.hpp"
#include <opencv2/opencv.hpp>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

// Runtime state of one live session.
struct SessionRuntime {
    explicit SessionRuntime(int64_t id) : session_id(id) {}

    const int64_t session_id;

    // Serializes phase, timer and history updates of the session record.
    std::mutex mutex;

    // Guards the proctoring caches below.
    std::mutex frame_mutex;
    cv::Mat last_small_frame;
    std::optional<TimePoint> last_periodic_save;
};

// Fixed-capacity arena of SessionRuntime slots with an id index.
//
// At capacity the least recently used idle entry is evicted. An entry is
// idle when no caller holds its shared_ptr. When every entry is held,
// acquire throws ServiceBusyError.
class SessionRegistry {
public:
    static constexpr size_t DEFAULT_CAPACITY = 1024;

    explicit SessionRegistry(size_t capacity = DEFAULT_CAPACITY);

    // Returns the runtime for the session, creating it when absent.
    std::shared_ptr<SessionRuntime> acquire(int64_t session_id);

    std::shared_ptr<SessionRuntime> find(int64_t session_id) const;

    // Drops the session's caches. Returns false if nothing was held.
    bool evict(int64_t session_id);

    bool contains(int64_t session_id) const;
    size_t size() const;
    size_t capacity() const { return capacity_; }

private:
    struct Slot {
        int64_t session_id = 0;
        std::shared_ptr<SessionRuntime> runtime;
        uint64_t last_used = 0;
    };

    size_t capacity_;
    std::vector<Slot> slots_;
    std::vector<size_t> free_slots_;
    std::unordered_map<int64_t, size_t> index_;
    uint64_t tick_;
    mutable std::mutex mutex_;

    // Oldest idle slot, or slots_.size() when none is idle.
    size_t victimSlot() const;
    void releaseSlot(size_t slot);
};

#endif // SESSION_REGISTRY_HPP
