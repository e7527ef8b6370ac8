#include "codepair/execution_slots.h"
#include "codepair/constants.h"

namespace codepair {

ExecutionSlots::Config::Config()
    : max_concurrent(DEFAULT_MAX_CONCURRENT_EXECUTIONS),
      queue_timeout(DEFAULT_QUEUE_TIMEOUT_MS) {}

ExecutionSlots::Lease& ExecutionSlots::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        if (owner_) owner_->release();
        owner_ = other.owner_;
        other.owner_ = nullptr;
    }
    return *this;
}

ExecutionSlots::Lease::~Lease() {
    if (owner_) owner_->release();
}

ExecutionSlots::ExecutionSlots(const Config& config) : config_(config) {
    if (config_.max_concurrent < 1) {
        config_.max_concurrent = 1;
    }
}

ExecutionSlots::Lease ExecutionSlots::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);

    ++waiting_;
    bool got_slot = slot_freed_.wait_for(lock, config_.queue_timeout, [this]() {
        return active_ < config_.max_concurrent;
    });
    --waiting_;

    if (!got_slot) {
        return Lease();
    }

    ++active_;
    return Lease(this);
}

void ExecutionSlots::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --active_;
    }
    slot_freed_.notify_one();
}

int ExecutionSlots::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

int ExecutionSlots::waiting() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return waiting_;
}

} // namespace codepair
