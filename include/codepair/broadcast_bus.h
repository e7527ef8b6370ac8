#pragma once

#include <string>
#include <map>
#include <deque>
#include <mutex>
#include <thread>
#include <functional>
#include <condition_variable>
#include "codepair/presence_event.h"

namespace codepair {

// One presence mutation fanned out between hub instances
struct BusMessage {
    std::string origin_node;
    PresenceEvent event;                   // event.session_id names the session
};

// Cross-node pub/sub. publish() must never invoke handlers on the calling
// thread: hubs publish while holding a session lock.
class BroadcastBus {
public:
    using Handler = std::function<void(const BusMessage&)>;
    using SubscriptionId = int;

    virtual ~BroadcastBus() = default;

    virtual void publish(const BusMessage& message) = 0;

    virtual SubscriptionId subscribe(Handler handler) = 0;

    // Blocks until no handler call for this subscription is in flight
    virtual void unsubscribe(SubscriptionId id) = 0;
};

// Fan-out between hubs living in one process, delivered in publish order by
// a dispatcher thread
class InProcessBus : public BroadcastBus {
public:
    InProcessBus();
    ~InProcessBus() override;

    void publish(const BusMessage& message) override;
    SubscriptionId subscribe(Handler handler) override;
    void unsubscribe(SubscriptionId id) override;

    // Wait until every message published so far has been dispatched
    void flush();

private:
    void dispatch_loop();

    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable drained_cv_;
    std::deque<BusMessage> queue_;
    bool dispatching_ = false;
    bool stopping_ = false;

    std::mutex handlers_mutex_;
    std::map<SubscriptionId, Handler> handlers_;
    SubscriptionId next_id_ = 1;

    std::thread dispatcher_;
};

} // namespace codepair
