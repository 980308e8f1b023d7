// include/channels/pubsub_channel.hh
#ifndef PUBSUB_CHANNEL_HH
#define PUBSUB_CHANNEL_HH

#include "../channel_stats.hh"
#include "../message.hh"
#include <functional>
#include <string>
#include <vector>

class EventQueue;

/**
 * Fan-out router: every publish reaches all current subscribers.
 *
 * publish() copies the subscriber list when it schedules the delivery, so
 * (un)subscribing from inside a handler only affects later publishes.
 * Subscribers run in subscription order, each in its own try block.
 */
class PubSubChannel {
public:
    using Callback = std::function<void(const Message& msg, const std::string& origin)>;

private:
    struct Subscriber {
        std::string id;
        Callback callback;
        uint64_t received = 0;
    };

    std::string name;
    EventQueue* event_queue;
    std::vector<Subscriber> subscribers;
    ChannelStats stats;
    uint64_t next_seq = 0;

    void deliver(const Message& msg, const std::vector<Subscriber>& snapshot);
    Subscriber* findSubscriber(const std::string& id);

public:
    PubSubChannel(const std::string& n, EventQueue* eq) : name(n), event_queue(eq) {}

    PubSubChannel(const PubSubChannel&) = delete;
    PubSubChannel& operator=(const PubSubChannel&) = delete;

    bool subscribe(const std::string& id, Callback cb);
    bool unsubscribe(const std::string& id);
    bool isSubscribed(const std::string& id) const;

    void publish(Message msg, const std::string& origin);
    void publishAfter(SimTime delay, Message msg, const std::string& origin);

    std::vector<std::string> getSubscriberIds() const;
    size_t subscriberCount() const { return subscribers.size(); }
    uint64_t getReceivedCount(const std::string& id) const;

    const std::string& getName() const { return name; }
    const ChannelStats& getStats() const { return stats; }
    void resetStats() { stats.reset(); }
};

#endif // PUBSUB_CHANNEL_HH
