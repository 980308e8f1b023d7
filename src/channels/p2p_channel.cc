// src/channels/p2p_channel.cc
#include "channels/p2p_channel.hh"
#include "event_queue.hh"
#include "sim_errors.hh"

#include <exception>

bool P2PChannel::registerNode(const std::string& id, SimObject* node) {
    SimLog& log = event_queue->getLog();
    if (!node || id.empty()) {
        SLOG_ERROR(log, CHAN, "%s: invalid registration for id '%s'", name.c_str(), id.c_str());
        return false;
    }
    if (!registry.add(id, node)) {
        SLOG_WARN(log, CHAN, "%s: node %s already registered", name.c_str(), id.c_str());
        return false;
    }
    SLOG_INFO(log, CHAN, "%s: node %s registered", name.c_str(), id.c_str());
    return true;
}

bool P2PChannel::unregisterNode(const std::string& id) {
    if (!registry.remove(id)) {
        SLOG_WARN(event_queue->getLog(), CHAN, "%s: node %s not found", name.c_str(), id.c_str());
        return false;
    }
    SLOG_INFO(event_queue->getLog(), CHAN, "%s: node %s unregistered", name.c_str(), id.c_str());
    return true;
}

void P2PChannel::send(Message msg, const std::string& src, const std::string& dst) {
    sendAfter(0.0, std::move(msg), src, dst);
}

void P2PChannel::sendAfter(SimTime delay, Message msg, const std::string& src, const std::string& dst) {
    if (!registry.contains(src)) {
        throw AddressError(name + ": source node " + src + " not registered");
    }
    if (!registry.contains(dst)) {
        throw AddressError(name + ": destination node " + dst + " not registered");
    }

    SimTime total = delay + latency;
    if (delay_model) total += delay_model->sample();

    msg.src = src;
    msg.dst = dst;
    msg.channel = name;
    msg.send_time = event_queue->now();
    msg.seq = next_seq++;

    std::string label = name + ":" + msg.type + " " + src + "->" + dst;
    event_queue->schedule(total, [this, m = std::move(msg)]() { deliver(m); }, label);
    stats.sent++;
    in_flight++;
    DPRINTF(CHAN, "[%s] queued %s -> %s (delay=%.4f)\n", name.c_str(), src.c_str(), dst.c_str(), total);
}

void P2PChannel::deliver(const Message& msg) {
    in_flight--;
    SimLog& log = event_queue->getLog();

    SimObject* dest = registry.find(msg.dst);
    if (!dest) {
        stats.dropped++;
        SLOG_ERROR(log, CHAN, "%s: destination %s vanished, dropping %s from %s",
                   name.c_str(), msg.dst.c_str(), msg.type.c_str(), msg.src.c_str());
        return;
    }

    Message delivered = msg;
    delivered.recv_time = event_queue->now();
    stats.recordDelay(delivered.getDelay());
    try {
        dest->receive(delivered, delivered.src);
        stats.delivered++;
        SLOG_DEBUG(log, CHAN, "%s: %s delivered %s -> %s", name.c_str(), msg.type.c_str(),
                   msg.src.c_str(), msg.dst.c_str());
    } catch (const std::exception& e) {
        stats.failed++;
        SLOG_ERROR(log, CHAN, "%s: error delivering %s from %s to %s: %s", name.c_str(),
                   msg.type.c_str(), msg.src.c_str(), msg.dst.c_str(), e.what());
    } catch (...) {
        stats.failed++;
        SLOG_ERROR(log, CHAN, "%s: error delivering %s from %s to %s: unknown exception",
                   name.c_str(), msg.type.c_str(), msg.src.c_str(), msg.dst.c_str());
    }
}
