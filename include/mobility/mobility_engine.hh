// include/mobility/mobility_engine.hh
#ifndef MOBILITY_ENGINE_HH
#define MOBILITY_ENGINE_HH

#include "../process.hh"
#include "../sim_object.hh"
#include <map>
#include <memory>
#include <string>
#include <vector>

// Drives updatePosition() of admitted entities every tick interval.
class MobilityEngine {
private:
    EventQueue* event_queue;
    SimTime interval;
    std::map<std::string, std::unique_ptr<Process>> processes;
    uint64_t ticks = 0;

public:
    explicit MobilityEngine(EventQueue* eq, SimTime tick_interval = 0.1);

    MobilityEngine(const MobilityEngine&) = delete;
    MobilityEngine& operator=(const MobilityEngine&) = delete;

    // false if the entity is null or already tracked
    bool addEntity(SimObject* entity);
    bool removeEntity(const std::string& id);
    bool isTracked(const std::string& id) const { return processes.count(id) > 0; }

    std::vector<std::string> getEntityIds() const;
    size_t entityCount() const { return processes.size(); }
    uint64_t tickCount() const { return ticks; }
    SimTime getInterval() const { return interval; }
};

#endif // MOBILITY_ENGINE_HH
