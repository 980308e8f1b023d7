// src/channels/pubsub_channel.cc
#include "channels/pubsub_channel.hh"
#include "event_queue.hh"

#include <algorithm>
#include <exception>

PubSubChannel::Subscriber* PubSubChannel::findSubscriber(const std::string& id) {
    for (auto& s : subscribers) {
        if (s.id == id) return &s;
    }
    return nullptr;
}

bool PubSubChannel::subscribe(const std::string& id, Callback cb) {
    SimLog& log = event_queue->getLog();
    if (id.empty() || !cb) {
        SLOG_ERROR(log, PUBSUB, "%s: invalid subscription '%s'", name.c_str(), id.c_str());
        return false;
    }
    if (findSubscriber(id)) {
        SLOG_WARN(log, PUBSUB, "%s: %s already subscribed", name.c_str(), id.c_str());
        return false;
    }
    subscribers.push_back({id, std::move(cb), 0});
    SLOG_INFO(log, PUBSUB, "%s: %s subscribed", name.c_str(), id.c_str());
    return true;
}

bool PubSubChannel::unsubscribe(const std::string& id) {
    auto it = std::find_if(subscribers.begin(), subscribers.end(),
                           [&](const Subscriber& s) { return s.id == id; });
    if (it == subscribers.end()) {
        SLOG_WARN(event_queue->getLog(), PUBSUB, "%s: unsubscribe of unknown %s",
                  name.c_str(), id.c_str());
        return false;
    }
    subscribers.erase(it);
    SLOG_INFO(event_queue->getLog(), PUBSUB, "%s: %s unsubscribed", name.c_str(), id.c_str());
    return true;
}

bool PubSubChannel::isSubscribed(const std::string& id) const {
    for (const auto& s : subscribers) {
        if (s.id == id) return true;
    }
    return false;
}

void PubSubChannel::publish(Message msg, const std::string& origin) {
    publishAfter(0.0, std::move(msg), origin);
}

void PubSubChannel::publishAfter(SimTime delay, Message msg, const std::string& origin) {
    msg.src = origin;
    msg.dst.clear();
    msg.channel = name;
    msg.send_time = event_queue->now();
    msg.seq = next_seq++;

    std::vector<Subscriber> snapshot = subscribers;
    std::string label = name + ":" + msg.type + " from " + origin;
    event_queue->schedule(delay, [this, m = std::move(msg), snap = std::move(snapshot)]() {
        deliver(m, snap);
    }, label);
    stats.sent++;
}

void PubSubChannel::deliver(const Message& msg, const std::vector<Subscriber>& snapshot) {
    SimLog& log = event_queue->getLog();
    Message delivered = msg;
    delivered.recv_time = event_queue->now();

    for (const auto& sub : snapshot) {
        stats.recordDelay(delivered.getDelay());
        try {
            sub.callback(delivered, delivered.src);
            stats.delivered++;
        } catch (const std::exception& e) {
            stats.failed++;
            SLOG_ERROR(log, PUBSUB, "%s: subscriber %s failed on %s from %s: %s", name.c_str(),
                       sub.id.c_str(), msg.type.c_str(), msg.src.c_str(), e.what());
        } catch (...) {
            stats.failed++;
            SLOG_ERROR(log, PUBSUB, "%s: subscriber %s failed on %s from %s: unknown exception",
                       name.c_str(), sub.id.c_str(), msg.type.c_str(), msg.src.c_str());
        }
        // Counted against the live entry, if the subscriber is still there
        if (Subscriber* live = findSubscriber(sub.id)) live->received++;
    }
}

std::vector<std::string> PubSubChannel::getSubscriberIds() const {
    std::vector<std::string> ids;
    for (const auto& s : subscribers) ids.push_back(s.id);
    return ids;
}

uint64_t PubSubChannel::getReceivedCount(const std::string& id) const {
    for (const auto& s : subscribers) {
        if (s.id == id) return s.received;
    }
    return 0;
}
