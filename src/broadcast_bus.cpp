#include "codepair/broadcast_bus.h"
#include <iostream>

namespace codepair {

InProcessBus::InProcessBus() {
    dispatcher_ = std::thread([this]() { dispatch_loop(); });
}

InProcessBus::~InProcessBus() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = true;
    }
    queue_cv_.notify_all();
    if (dispatcher_.joinable()) {
        dispatcher_.join();
    }
}

void InProcessBus::publish(const BusMessage& message) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.push_back(message);
    }
    queue_cv_.notify_one();
}

BroadcastBus::SubscriptionId InProcessBus::subscribe(Handler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    SubscriptionId id = next_id_++;
    handlers_[id] = std::move(handler);
    return id;
}

void InProcessBus::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    handlers_.erase(id);
}

void InProcessBus::flush() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    drained_cv_.wait(lock, [this]() { return (queue_.empty() && !dispatching_) || stopping_; });
}

void InProcessBus::dispatch_loop() {
    while (true) {
        BusMessage message;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            if (stopping_) {
                drained_cv_.notify_all();
                return;
            }
            message = std::move(queue_.front());
            queue_.pop_front();
            dispatching_ = true;
        }

        {
            // Held across calls so unsubscribe() waits for in-flight handlers
            std::lock_guard<std::mutex> lock(handlers_mutex_);
            for (auto& [id, handler] : handlers_) {
                try {
                    handler(message);
                } catch (const std::exception& e) {
                    std::cerr << "[Bus] Handler " << id << " failed: " << e.what() << std::endl;
                }
            }
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            dispatching_ = false;
            if (queue_.empty()) {
                drained_cv_.notify_all();
            }
        }
    }
}

} // namespace codepair
