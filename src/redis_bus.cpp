#include "codepair/redis_bus.h"
#include "codepair/event_codec.h"
#include <chrono>
#include <iostream>
#include <thread>

namespace codepair {

RedisBus::RedisBus(const std::string& url, const std::string& channel,
                   std::chrono::milliseconds reconnect_delay)
    : channel_(channel), reconnect_delay_(reconnect_delay) {
    sw::redis::ConnectionOptions opts(url);
    pub_ = std::make_unique<sw::redis::Redis>(opts);

    // Bounded reads so the consumer notices shutdown
    opts.socket_timeout = std::chrono::milliseconds(500);
    sub_ = std::make_unique<sw::redis::Redis>(opts);

    auto subscriber = open_subscriber();

    consumer_ = std::thread([this, subscriber = std::move(subscriber)]() mutable {
        consume_loop(std::move(subscriber));
    });

    std::cout << "[Bus] Redis bus on channel " << channel_ << std::endl;
}

RedisBus::~RedisBus() {
    running_ = false;
    if (consumer_.joinable()) {
        consumer_.join();
    }
}

void RedisBus::publish(const BusMessage& message) {
    pub_->publish(channel_, encode_bus_message(message));
}

BroadcastBus::SubscriptionId RedisBus::subscribe(Handler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    SubscriptionId id = next_id_++;
    handlers_[id] = std::move(handler);
    return id;
}

void RedisBus::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    handlers_.erase(id);
}

sw::redis::Subscriber RedisBus::open_subscriber() {
    // Each call takes a fresh connection
    auto subscriber = sub_->subscriber();
    subscriber.on_message([this](std::string, std::string payload) {
        dispatch(payload);
    });
    subscriber.subscribe(channel_);
    return subscriber;
}

std::optional<sw::redis::Subscriber> RedisBus::resubscribe() {
    for (int attempt = 1; running_; ++attempt) {
        auto wake = std::chrono::steady_clock::now() + reconnect_delay_;
        while (running_ && std::chrono::steady_clock::now() < wake) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        if (!running_) break;

        try {
            auto subscriber = open_subscriber();
            std::cout << "[Bus] Resubscribed to " << channel_ << " after " << attempt
                      << " attempt(s)" << std::endl;
            return subscriber;
        } catch (const sw::redis::Error& e) {
            std::cerr << "[Bus] Resubscribe attempt " << attempt << " failed: " << e.what()
                      << std::endl;
        }
    }
    return std::nullopt;
}

void RedisBus::consume_loop(sw::redis::Subscriber subscriber) {
    while (running_) {
        try {
            subscriber.consume();
        } catch (const sw::redis::TimeoutError&) {
            continue;
        } catch (const sw::redis::Error& e) {
            std::cerr << "[Bus] Redis subscriber failed: " << e.what()
                      << "; resubscribing every " << reconnect_delay_.count() << "ms" << std::endl;
            auto fresh = resubscribe();
            if (!fresh) return;
            subscriber = std::move(*fresh);
        }
    }
}

void RedisBus::dispatch(const std::string& payload) {
    auto message = decode_bus_message(payload);
    if (!message) {
        std::cerr << "[Bus] Ignoring malformed message on " << channel_ << std::endl;
        return;
    }

    std::lock_guard<std::mutex> lock(handlers_mutex_);
    for (auto& [id, handler] : handlers_) {
        try {
            handler(*message);
        } catch (const std::exception& e) {
            std::cerr << "[Bus] Handler " << id << " failed: " << e.what() << std::endl;
        }
    }
}

} // namespace codepair
