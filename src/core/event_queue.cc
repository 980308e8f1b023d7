// src/core/event_queue.cc
#include "event_queue.hh"
#include "sim_errors.hh"

#include <algorithm>
#include <cmath>
#include <exception>

EventQueue::EventQueue(SimLog* l) : log(l ? l : &own_log) {
    log->setClock([this]() { return cur_time; });
}

EventQueue::~EventQueue() {
    log->setClock(nullptr);
}

void EventQueue::schedule(Event* ev, SimTime delay) {
    std::unique_ptr<Event> owned(ev);
    if (!owned) {
        throw ValidationError("EventQueue::schedule: null event");
    }
    if (!(delay >= 0.0) || std::isinf(delay)) {
        throw ValidationError("EventQueue::schedule: delay must be finite and >= 0, got " +
                              std::to_string(delay));
    }
    owned->fire_time = cur_time + delay;
    owned->sequence = next_seq++;
    heap.push_back(std::move(owned));
    std::push_heap(heap.begin(), heap.end(), laterThan);
    stats.scheduled++;
}

void EventQueue::schedule(SimTime delay, std::function<void()> cb, const std::string& label) {
    schedule(new LambdaEvent(std::move(cb), label), delay);
}

std::unique_ptr<Event> EventQueue::popNext() {
    std::pop_heap(heap.begin(), heap.end(), laterThan);
    std::unique_ptr<Event> ev = std::move(heap.back());
    heap.pop_back();
    return ev;
}

void EventQueue::dispatch(Event& ev) {
    cur_time = ev.fire_time;
    stats.processed++;
    try {
        ev.process();
    } catch (const std::exception& e) {
        stats.callback_errors++;
        SLOG_ERROR(*log, SCHED, "event #%" PRIu64 " '%s' failed: %s",
                   ev.sequence, ev.label.c_str(), e.what());
    } catch (...) {
        stats.callback_errors++;
        SLOG_ERROR(*log, SCHED, "event #%" PRIu64 " '%s' failed: unknown exception",
                   ev.sequence, ev.label.c_str());
    }
}

void EventQueue::run(SimTime until) {
    if (!(until > cur_time)) {
        throw ValidationError("EventQueue::run: until (" + std::to_string(until) +
                              ") must be greater than current time (" +
                              std::to_string(cur_time) + ")");
    }
    while (!heap.empty() && heap.front()->fire_time <= until) {
        std::unique_ptr<Event> ev = popNext();
        dispatch(*ev);
    }
    cur_time = until;
}

uint64_t EventQueue::runAll(uint64_t max_events) {
    uint64_t fired = 0;
    while (!heap.empty() && fired < max_events) {
        std::unique_ptr<Event> ev = popNext();
        dispatch(*ev);
        fired++;
    }
    return fired;
}
