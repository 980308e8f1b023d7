// src/mobility/mobility_engine.cc
#include "mobility/mobility_engine.hh"
#include "sim_errors.hh"

MobilityEngine::MobilityEngine(EventQueue* eq, SimTime tick_interval)
    : event_queue(eq), interval(tick_interval) {
    if (!(interval > 0.0)) {
        throw ValidationError("MobilityEngine: tick interval must be > 0");
    }
}

bool MobilityEngine::addEntity(SimObject* entity) {
    SimLog& log = event_queue->getLog();
    if (!entity) {
        SLOG_ERROR(log, MOBILITY, "null entity rejected");
        return false;
    }
    const std::string& id = entity->getName();
    if (processes.count(id)) {
        SLOG_WARN(log, MOBILITY, "entity %s already tracked", id.c_str());
        return false;
    }

    SimTime dt = interval;
    auto proc = std::make_unique<Process>(event_queue, interval,
        [this, entity, dt](SimTime) {
            ticks++;
            entity->updatePosition(dt);
        }, "mobility:" + id);
    proc->start();
    processes.emplace(id, std::move(proc));
    SLOG_INFO(log, MOBILITY, "tracking %s every %.3f", id.c_str(), interval);
    return true;
}

bool MobilityEngine::removeEntity(const std::string& id) {
    auto it = processes.find(id);
    if (it == processes.end()) {
        SLOG_WARN(event_queue->getLog(), MOBILITY, "entity %s not tracked", id.c_str());
        return false;
    }
    it->second->stop();
    processes.erase(it);
    return true;
}

std::vector<std::string> MobilityEngine::getEntityIds() const {
    std::vector<std::string> ids;
    for (const auto& kv : processes) ids.push_back(kv.first);
    return ids;
}
