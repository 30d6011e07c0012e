#include "session_registry.hpp"
#include "interview_errors.hpp"
#include <iostream>
#include <limits>

SessionRegistry::SessionRegistry(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity), slots_(capacity_), tick_(0) {
    free_slots_.reserve(capacity_);
    for (size_t i = capacity_; i > 0; --i) {
        free_slots_.push_back(i - 1);
    }
}

std::shared_ptr<SessionRuntime> SessionRegistry::acquire(int64_t session_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = index_.find(session_id);
    if (it != index_.end()) {
        Slot& slot = slots_[it->second];
        slot.last_used = ++tick_;
        return slot.runtime;
    }

    if (free_slots_.empty()) {
        size_t victim = victimSlot();
        if (victim == slots_.size()) {
            std::cerr << "Warning: session registry full and every runtime is in use" << std::endl;
            throw ServiceBusyError("Too many active sessions, retry shortly");
        }
        std::cout << "Session registry full, evicting session " << slots_[victim].session_id << std::endl;
        releaseSlot(victim);
    }

    size_t slot_index = free_slots_.back();
    free_slots_.pop_back();

    Slot& slot = slots_[slot_index];
    slot.session_id = session_id;
    slot.runtime = std::make_shared<SessionRuntime>(session_id);
    slot.last_used = ++tick_;
    index_[session_id] = slot_index;
    return slot.runtime;
}

std::shared_ptr<SessionRuntime> SessionRegistry::find(int64_t session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(session_id);
    if (it == index_.end()) {
        return nullptr;
    }
    return slots_[it->second].runtime;
}

bool SessionRegistry::evict(int64_t session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(session_id);
    if (it == index_.end()) {
        return false;
    }
    releaseSlot(it->second);
    return true;
}

bool SessionRegistry::contains(int64_t session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.count(session_id) > 0;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.size();
}

size_t SessionRegistry::victimSlot() const {
    // Only idle entries are evicted; a held runtime owns the session's locks.
    size_t oldest_idle = slots_.size();
    uint64_t idle_tick = std::numeric_limits<uint64_t>::max();

    for (size_t i = 0; i < slots_.size(); ++i) {
        const Slot& slot = slots_[i];
        if (slot.runtime && slot.runtime.use_count() == 1 && slot.last_used < idle_tick) {
            idle_tick = slot.last_used;
            oldest_idle = i;
        }
    }
    return oldest_idle;
}

void SessionRegistry::releaseSlot(size_t slot_index) {
    Slot& slot = slots_[slot_index];
    index_.erase(slot.session_id);
    slot.runtime.reset();
    slot.session_id = 0;
    slot.last_used = 0;
    free_slots_.push_back(slot_index);
}
