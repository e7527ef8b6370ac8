#pragma once

#include <mutex>
#include <chrono>
#include <condition_variable>

namespace codepair {

// Global cap on concurrently running executions. Callers queue for a slot up
// to a bounded wait instead of being rejected outright.
class ExecutionSlots {
public:
    struct Config {
        int max_concurrent;
        std::chrono::milliseconds queue_timeout;

        Config();
    };

    // Held slot; released on destruction
    class Lease {
    public:
        Lease() = default;
        explicit Lease(ExecutionSlots* owner) : owner_(owner) {}
        Lease(Lease&& other) noexcept : owner_(other.owner_) { other.owner_ = nullptr; }
        Lease& operator=(Lease&& other) noexcept;
        ~Lease();

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        explicit operator bool() const { return owner_ != nullptr; }

    private:
        ExecutionSlots* owner_ = nullptr;
    };

    explicit ExecutionSlots(const Config& config = Config());

    // Empty lease when no slot freed within the queue timeout
    Lease acquire();

    int active() const;
    int waiting() const;
    int capacity() const { return config_.max_concurrent; }

private:
    void release();

    Config config_;
    mutable std::mutex mutex_;
    std::condition_variable slot_freed_;
    int active_ = 0;
    int waiting_ = 0;
};

} // namespace codepair
