#pragma once

#include <string>
#include <map>
#include <mutex>
#include <atomic>
#include <memory>
#include <thread>
#include <chrono>
#include <optional>
#include <sw/redis++/redis++.h>
#include "codepair/broadcast_bus.h"
#include "codepair/constants.h"

namespace codepair {

// Redis pub/sub between hub instances on different hosts. One connection
// publishes; a subscriber thread consumes the channel and dispatches. A lost
// subscription is re-established every `reconnect_delay` until it succeeds;
// messages published in between are not replayed.
class RedisBus : public BroadcastBus {
public:
    static constexpr const char* DEFAULT_CHANNEL = "codepair:presence";

    // Throws sw::redis::Error if the server cannot be reached
    explicit RedisBus(const std::string& url, const std::string& channel = DEFAULT_CHANNEL,
                      std::chrono::milliseconds reconnect_delay =
                          std::chrono::milliseconds(BUS_RECONNECT_DELAY_MS));
    ~RedisBus() override;

    void publish(const BusMessage& message) override;
    SubscriptionId subscribe(Handler handler) override;
    void unsubscribe(SubscriptionId id) override;

    const std::string& channel() const { return channel_; }

private:
    sw::redis::Subscriber open_subscriber();
    std::optional<sw::redis::Subscriber> resubscribe();
    void consume_loop(sw::redis::Subscriber subscriber);
    void dispatch(const std::string& payload);

    std::string channel_;
    std::chrono::milliseconds reconnect_delay_;
    std::unique_ptr<sw::redis::Redis> pub_;
    std::unique_ptr<sw::redis::Redis> sub_;
    std::atomic<bool> running_{true};
    std::thread consumer_;

    std::mutex handlers_mutex_;
    std::map<SubscriptionId, Handler> handlers_;
    SubscriptionId next_id_ = 1;
};

} // namespace codepair
