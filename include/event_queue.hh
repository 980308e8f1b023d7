#ifndef EVENT_QUEUE_HH
#define EVENT_QUEUE_HH

#include <vector>
#include <memory>
#include <functional>
#include <string>
#include "sim_core.hh"
#include "sim_log.hh"

class Event {
public:
    SimTime fire_time = 0.0;
    uint64_t sequence = 0;
    std::string label;

    virtual ~Event() = default;
    virtual void process() = 0;
};

struct LambdaEvent : public Event {
    std::function<void()> func;
    explicit LambdaEvent(std::function<void()> f, std::string l = "")
        : func(std::move(f)) { label = std::move(l); }
    void process() override { func(); }
};

/**
 * Time-ordered queue of pending events and owner of the virtual clock.
 *
 * Events fire in (fire_time, sequence) order; sequence is the insertion
 * counter, so simultaneous events keep the order they were scheduled in.
 * An exception escaping an event is logged and counted, never rethrown.
 */
class EventQueue {
public:
    struct Stats {
        uint64_t scheduled = 0;
        uint64_t processed = 0;
        uint64_t callback_errors = 0;
    };

private:
    std::vector<std::unique_ptr<Event>> heap;
    SimTime cur_time = 0.0;
    uint64_t next_seq = 0;
    Stats stats;

    SimLog own_log;
    SimLog* log;

    static bool laterThan(const std::unique_ptr<Event>& a, const std::unique_ptr<Event>& b) {
        if (a->fire_time != b->fire_time) return a->fire_time > b->fire_time; // min-heap
        return a->sequence > b->sequence;
    }

    std::unique_ptr<Event> popNext();
    void dispatch(Event& ev);

public:
    explicit EventQueue(SimLog* l = nullptr);
    ~EventQueue();

    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;

    // Takes ownership of ev. Throws ValidationError on negative delay.
    void schedule(Event* ev, SimTime delay);
    void schedule(SimTime delay, std::function<void()> cb, const std::string& label = "");

    // Fires every event with fire_time <= until, then moves the clock to until.
    void run(SimTime until);
    // Drains the queue without a horizon; returns the number of events fired.
    uint64_t runAll(uint64_t max_events = UINT64_MAX);

    SimTime now() const { return cur_time; }
    SimTime getCurrentTime() const { return cur_time; }
    size_t pending() const { return heap.size(); }
    bool empty() const { return heap.empty(); }
    const Stats& getStats() const { return stats; }

    SimLog& getLog() { return *log; }
};

#endif // EVENT_QUEUE_HH
