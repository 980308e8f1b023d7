// include/process.hh
#ifndef PROCESS_HH
#define PROCESS_HH

#include "event_queue.hh"
#include "sim_errors.hh"
#include <functional>
#include <memory>
#include <string>

/**
 * Self-rescheduling unit of periodic work.
 *
 * Each firing runs the body and enqueues the next firing one period later.
 * The queue has no removal primitive, so stop() flips a shared validity
 * token that already-queued firings check before doing anything.
 */
class Process {
public:
    using Body = std::function<void(SimTime now)>;

private:
    EventQueue* event_queue;
    SimTime period;
    Body body;
    std::string label;
    std::shared_ptr<bool> alive;
    uint64_t fire_count = 0;

    struct ProcessEvent : public Event {
        Process* proc;
        std::shared_ptr<bool> token;
        ProcessEvent(Process* p, std::shared_ptr<bool> t) : proc(p), token(std::move(t)) {
            label = p->label;
        }
        void process() override {
            if (!*token) return;
            // Reschedule first so a throwing body does not end the process
            proc->scheduleNext(proc->period);
            proc->fire_count++;
            proc->body(proc->event_queue->now());
        }
    };

    void scheduleNext(SimTime delay) {
        event_queue->schedule(new ProcessEvent(this, alive), delay);
    }

public:
    Process(EventQueue* eq, SimTime p, Body b, std::string l = "process")
        : event_queue(eq), period(p), body(std::move(b)), label(std::move(l)) {
        if (!(period > 0.0)) {
            throw ValidationError("Process '" + label + "': period must be > 0");
        }
    }

    ~Process() { stop(); }

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;

    // First firing after initial_delay; a negative value means one period.
    void start(SimTime initial_delay = -1.0) {
        if (running()) return;
        alive = std::make_shared<bool>(true);
        scheduleNext(initial_delay < 0.0 ? period : initial_delay);
    }

    void stop() {
        if (alive) {
            *alive = false;
            alive.reset();
        }
    }

    bool running() const { return alive && *alive; }
    SimTime getPeriod() const { return period; }
    uint64_t getFireCount() const { return fire_count; }
    const std::string& getLabel() const { return label; }
};

#endif // PROCESS_HH
