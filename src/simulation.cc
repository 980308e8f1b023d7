// src/simulation.cc
#include "simulation.hh"
#include "modules.hh"
#include "sim_errors.hh"

namespace {

std::unique_ptr<MobilityModel> makeMobility(const json& cfg, uint32_t seed) {
    std::string model = cfg.value("model", "random_walk");
    seed = cfg.value("seed", seed);
    if (model == "random_walk") {
        return std::make_unique<RandomWalkModel>(cfg.value("step_size", 1.0), seed);
    }
    if (model == "random_waypoint") {
        return std::make_unique<RandomWaypointModel>(
            cfg.value("speed", 1.0), cfg.value("width", 100.0), cfg.value("height", 100.0),
            cfg.value("pause_mean", 5.0), cfg.value("pause_std", 2.0), seed);
    }
    if (model == "manhattan") {
        return std::make_unique<ManhattanModel>(
            cfg.value("speed", 1.0), cfg.value("grid_rows", 10), cfg.value("grid_cols", 10),
            cfg.value("block_size", 10.0), seed);
    }
    throw ValidationError("unknown mobility model: " + model);
}

const json& section(const json& scenario, const char* key) {
    static const json empty = json::array();
    return scenario.contains(key) ? scenario[key] : empty;
}

std::string requireString(const json& obj, const char* key, const std::string& where) {
    if (!obj.contains(key) || !obj[key].is_string() || obj[key].get<std::string>().empty()) {
        throw ValidationError(where + ": \"" + key + "\" must be a non-empty string");
    }
    return obj[key].get<std::string>();
}

}

Simulation::Simulation()
    : event_queue(&log),
      a1("a1", &event_queue),
      e2("e2", &event_queue),
      f1("f1", &event_queue),
      xn("xn", &event_queue),
      x2("x2", &event_queue),
      fronthaul("fronthaul", &event_queue),
      config_store(&log),
      factory(&event_queue) {
    ModuleFactory::registerBuiltinTypes();
}

Simulation::~Simulation() {
    log.close();
}

P2PChannel* Simulation::getChannel(const std::string& name) {
    for (P2PChannel* ch : {&a1, &e2, &f1, &xn, &x2, &fronthaul}) {
        if (ch->getName() == name) return ch;
    }
    return nullptr;
}

PubSubChannel* Simulation::getIndicationChannel(const std::string& lc_id) const {
    auto it = indication_channels.find(lc_id);
    return it != indication_channels.end() ? it->second.get() : nullptr;
}

LocalController* Simulation::getLocalController(const std::string& id) const {
    auto it = local_controllers.find(id);
    return it != local_controllers.end() ? it->second.get() : nullptr;
}

void Simulation::build(const json& scenario) {
    if (built) {
        throw SimError("simulation already built");
    }
    if (!scenario.is_object()) {
        throw ValidationError("scenario must be a JSON object");
    }

    if (scenario.contains("log_level")) {
        LogLevel lvl;
        std::string name = scenario["log_level"].get<std::string>();
        if (!parseLogLevel(name, lvl)) {
            throw ValidationError("unknown log_level: " + name);
        }
        log.setLevel(lvl);
    }
    duration = scenario.value("duration", 10.0);
    if (!(duration > 0.0)) {
        throw ValidationError("duration must be > 0");
    }
    seed = scenario.value("seed", 1u);

    mobility = std::make_unique<MobilityEngine>(&event_queue, scenario.value("mobility_interval", 0.1));

    buildChannels(scenario);
    buildElements(scenario);

    config_store.loadNodes(section(scenario, "nodes"));
    config_store.applyConfigs(elements);

    buildLocalControllers(scenario, scenario.value("enforcement_period", 1.0));
    buildGlobalController(scenario);
    startElements(scenario);

    built = true;
    SLOG_INFO(log, SIM, "built %zu elements, %zu local controllers, duration %.3f",
              elements.size(), local_controllers.size(), duration);
}

void Simulation::buildChannels(const json& scenario) {
    if (scenario.contains("latency")) {
        for (auto& [name, value] : scenario["latency"].items()) {
            P2PChannel* ch = getChannel(name);
            if (!ch) throw ValidationError("latency for unknown channel: " + name);
            ch->setLatency(value.get<double>());
        }
    }

    json fh = scenario.value("fronthaul", json::object());
    fronthaul.setDelayModel(std::make_unique<NormalDelay>(
        fh.value("mean", 0.1), fh.value("std", 0.02), fh.value("jitter", 0.005),
        fh.value("floor", 0.0), fh.value("seed", seed)));
}

void Simulation::buildElements(const json& scenario) {
    const json& list = section(scenario, "elements");
    factory.instantiateAll(list);

    uint32_t index = 0;
    for (const auto& el : list) {
        std::string name = el["name"].get<std::string>();
        SimObject* obj = factory.getInstance(name);
        elements.add(name, obj);
        index++;

        switch (obj->getElementClass()) {
            case ElementClass::RadioUnit:
                fronthaul.registerNode(name, obj);
                obj->bindChannel("fronthaul", &fronthaul, el.value("fronthaul_du", ""));
                break;
            case ElementClass::DistributedUnit:
                fronthaul.registerNode(name, obj);
                obj->bindChannel("fronthaul", &fronthaul);
                f1.registerNode(name, obj);
                obj->bindChannel("f1", &f1, el.value("f1_peer", ""));
                break;
            case ElementClass::CuControlPlane:
                for (P2PChannel* ch : {&f1, &xn, &x2}) {
                    ch->registerNode(name, obj);
                    obj->bindChannel(ch->getName(), ch);
                }
                break;
            case ElementClass::CuUserPlane:
                f1.registerNode(name, obj);
                obj->bindChannel("f1", &f1);
                break;
            case ElementClass::UserTerminal: {
                auto* ue = static_cast<UserTerminal*>(obj);
                if (el.contains("position")) {
                    ue->setPosition({el["position"].value("x", 0.0), el["position"].value("y", 0.0)});
                }
                if (el.contains("mobility")) {
                    ue->setMobility(makeMobility(el["mobility"], seed + index));
                    mobility->addEntity(ue);
                }
                break;
            }
            default:
                throw ValidationError("element " + name + " cannot be declared as an element");
        }
    }

    // Serving cells once every DU exists
    for (const auto& el : list) {
        if (!el.contains("serving_du")) continue;
        std::string name = el["name"].get<std::string>();
        std::string du_id = el["serving_du"].get<std::string>();
        auto* du = factory.getInstanceAs<DistributedUnit>(du_id);
        if (!du) {
            throw AddressError(name + ": serving_du " + du_id + " is not an o_du");
        }
        du->attachUe(name);
        factory.getInstance(name)->setParams({{"serving_du", du_id}});
    }
}

void Simulation::buildLocalControllers(const json& scenario, SimTime enforcement_period) {
    for (const auto& cfg : section(scenario, "local_controllers")) {
        std::string name = requireString(cfg, "name", "local controller");
        if (local_controllers.count(name) || elements.contains(name)) {
            throw ValidationError("duplicate node name: " + name);
        }
        auto ind = std::make_unique<PubSubChannel>("e2_indications." + name, &event_queue);
        auto lc = std::make_unique<LocalController>(name, &event_queue, &a1, &e2, ind.get());
        indication_channels.emplace(name, std::move(ind));

        for (const auto& pat : cfg.value("elements", json::array())) {
            std::string pattern = pat.get<std::string>();
            if (!Wildcard::isPattern(pattern)) {
                SimObject* obj = elements.find(pattern);
                if (!obj) throw AddressError(name + ": unknown element " + pattern);
                lc->registerElement(pattern, obj);
                continue;
            }
            for (const auto& id : factory.match(pattern)) {
                SimObject* obj = elements.find(id);
                if (obj && isManagedClass(obj->getElementClass())) {
                    lc->registerElement(id, obj);
                }
            }
        }

        for (const auto& app : cfg.value("xapps", json::array())) {
            std::string id = requireString(app, "id", name + " xApp");
            std::string type = app.value("type", "observer");
            std::unique_ptr<XApp> xapp;
            if (type == "handover") {
                xapp = std::make_unique<HandoverXApp>(id, app.value("seed", seed),
                    app.value("probability", 0.5), app.value("hysteresis_margin", 1.0),
                    app.value("time_to_trigger_margin", 5.0));
            } else if (type == "observer") {
                xapp = std::make_unique<XApp>(id);
            } else {
                throw ValidationError("unknown xApp type: " + type);
            }
            if (!lc->addXApp(xapp.get())) {
                throw ValidationError(name + ": cannot register xApp " + id);
            }
            xapps.push_back(std::move(xapp));
        }

        SimTime period = cfg.value("enforcement_period", enforcement_period);
        if (period > 0.0) lc->startPeriodicEnforcement(period);
        local_controllers.emplace(name, std::move(lc));
    }
}

void Simulation::buildGlobalController(const json& scenario) {
    if (!scenario.contains("global_controller")) return;
    const json& cfg = scenario["global_controller"];
    std::string name = cfg.value("name", "non_rt_ric");
    if (local_controllers.count(name) || elements.contains(name)) {
        throw ValidationError("duplicate node name: " + name);
    }
    global_controller = std::make_unique<GlobalController>(name, &event_queue, &a1);
    for (auto& kv : local_controllers) {
        global_controller->addManagedLocalController(kv.second.get());
    }

    for (const auto& app : cfg.value("rapps", json::array())) {
        std::string id = requireString(app, "id", name + " rApp");
        std::string type = app.value("type", "load_balancing");
        if (type != "load_balancing") {
            throw ValidationError("unknown rApp type: " + type);
        }
        auto rapp = std::make_unique<LoadBalancingRApp>(id, app.value("period", 5.0),
                                                        app.value("threshold", 0.8));
        if (!global_controller->addRApp(rapp.get())) {
            throw ValidationError(name + ": cannot register rApp " + id);
        }
        rapp->start();
        rapps.push_back(std::move(rapp));
    }

    for (const auto& entry : cfg.value("policies", json::array())) {
        schedulePolicy(entry);
    }
}

void Simulation::schedulePolicy(const json& entry) {
    PolicyType type;
    std::string type_name = entry.value("type", "POLICY-TYPE-1");
    if (!parsePolicyType(type_name, type)) {
        throw ValidationError("unknown policy type: " + type_name);
    }
    ElementClass target;
    std::string target_name = entry.value("target", "o_du");
    if (!parseElementClass(target_name, target) || !isManagedClass(target)) {
        throw ValidationError("invalid policy target: " + target_name);
    }
    json content = entry.value("content", json::object());
    if (!content.is_object()) {
        throw ValidationError("policy content must be an object");
    }

    std::vector<std::string> targets;
    std::string to = entry.value("to", "*");
    for (const auto& kv : local_controllers) {
        if (Wildcard::match(to, kv.first)) targets.push_back(kv.first);
    }
    if (targets.empty()) {
        throw AddressError("policy addressed to unknown local controller: " + to);
    }

    GlobalController* gc = global_controller.get();
    event_queue.schedule(entry.value("at", 0.0), [gc, type, content, target, targets]() {
        std::string id = gc->createPolicy(type, content, target);
        for (const auto& lc : targets) gc->distributePolicy(id, lc);
    }, "policy:" + type_name + "->" + to);
}

void Simulation::startElements(const json& scenario) {
    for (const auto& el : section(scenario, "elements")) {
        std::string name = el["name"].get<std::string>();
        SimObject* obj = elements.find(name);

        if (auto* ru = dynamic_cast<RadioUnit*>(obj)) {
            SimTime period = el.value("iq_period", 0.0);
            if (period > 0.0) {
                const std::string& du_id = ru->getPeer("fronthaul");
                if (!fronthaul.isRegistered(du_id)) {
                    throw AddressError(name + ": fronthaul_du '" + du_id + "' is not a DU");
                }
                ru->startIqTransmission(du_id, period);
            }
        } else if (auto* du = dynamic_cast<DistributedUnit*>(obj)) {
            SimTime period = el.value("report_period", 0.0);
            if (period > 0.0) du->startLoadReports(period);
            if (!du->getPeer("f1").empty()) {
                event_queue.schedule(0.0, [du]() { du->f1Setup(); }, "f1-setup:" + name);
            }
        } else if (auto* cucp = dynamic_cast<CuControlPlane*>(obj)) {
            std::string cu_up = el.value("cu_up", "");
            for (const auto& ue : el.value("bearers", json::array())) {
                if (cu_up.empty()) throw ValidationError(name + ": bearers need a cu_up");
                std::string ue_id = ue.get<std::string>();
                event_queue.schedule(0.0, [cucp, cu_up, ue_id]() {
                    cucp->setupBearer(cu_up, ue_id);
                }, "bearer:" + name);
            }
            for (const auto& ho : el.value("handovers", json::array())) {
                std::string peer = requireString(ho, "peer", name + " handover");
                std::string ue_id = requireString(ho, "ue", name + " handover");
                std::string via = ho.value("via", "xn");
                if (via != "xn" && via != "x2") {
                    throw ValidationError(name + ": handover via must be xn or x2");
                }
                event_queue.schedule(ho.value("at", 0.0), [cucp, peer, ue_id, via]() {
                    cucp->requestHandover(peer, ue_id, via);
                }, "handover:" + name + "->" + peer);
            }
        }
    }
}

void Simulation::run(SimTime until) {
    if (!built) {
        throw SimError("simulation not built");
    }
    SLOG_INFO(log, SIM, "running until t=%.4f", until);
    event_queue.run(until);
}

void Simulation::sampleStats(SimTime period, std::function<void(const json&)> callback) {
    stats_sampler = std::make_unique<Process>(&event_queue, period,
        [this, cb = std::move(callback)](SimTime) { cb(collectStats()); }, "stats");
    stats_sampler->start();
}

json Simulation::collectStats() const {
    const EventQueue::Stats& es = event_queue.getStats();
    json out;
    out["time"] = event_queue.now();
    out["events"] = {
        {"scheduled", es.scheduled},
        {"processed", es.processed},
        {"callback_errors", es.callback_errors},
        {"pending", event_queue.pending()}
    };

    json channels = json::object();
    for (const P2PChannel* ch : {&a1, &e2, &f1, &xn, &x2, &fronthaul}) {
        channels[ch->getName()] = ch->getStats().toJson();
    }
    for (const auto& kv : indication_channels) {
        json ind = kv.second->getStats().toJson();
        ind["subscribers"] = kv.second->subscriberCount();
        channels[kv.second->getName()] = ind;
    }
    out["channels"] = channels;

    json nodes = json::object();
    for (const auto& [id, obj] : elements.all()) {
        json n = {
            {"class", obj->getClassName()},
            {"received", obj->getReceivedCount()},
            {"policies_applied", obj->getPolicyApplyCount()},
            {"configs_applied", obj->getConfigApplyCount()}
        };
        if (auto* du = dynamic_cast<const DistributedUnit*>(obj)) {
            n["load"] = du->load();
            n["iq_slots"] = du->getIqSlots();
            n["reports_sent"] = du->getReportsSent();
            n["controls_applied"] = du->getControlsApplied();
            n["f1_established"] = du->isF1Established();
        } else if (auto* ru = dynamic_cast<const RadioUnit*>(obj)) {
            n["slots_sent"] = ru->getSlotsSent();
        } else if (auto* ue = dynamic_cast<const UserTerminal*>(obj)) {
            n["position"] = {{"x", ue->getPosition().x}, {"y", ue->getPosition().y}};
            n["position_updates"] = ue->getUpdateCount();
        } else if (auto* cucp = dynamic_cast<const CuControlPlane*>(obj)) {
            n["connected_dus"] = cucp->connectedDuCount();
            n["handovers_acked"] = cucp->getHandoversAcked();
            n["bearers_established"] = cucp->getBearersEstablished();
        } else if (auto* cuup = dynamic_cast<const CuUserPlane*>(obj)) {
            n["bearers"] = cuup->bearerCount();
        }
        nodes[id] = n;
    }
    out["elements"] = nodes;

    json lcs = json::object();
    for (const auto& kv : local_controllers) lcs[kv.first] = kv.second->statsJson();
    out["local_controllers"] = lcs;
    if (global_controller) {
        out["global_controller"] = global_controller->statsJson();
    }

    out["mobility"] = {
        {"entities", mobility ? mobility->entityCount() : 0},
        {"ticks", mobility ? mobility->tickCount() : 0}
    };
    out["config"] = {
        {"nodes", config_store.getNodeIds().size()},
        {"rejected", config_store.getRejectedCount()},
        {"apply_errors", config_store.getApplyErrorCount()}
    };
    out["log"] = {
        {"error", log.count(LogLevel::Error)},
        {"warn", log.count(LogLevel::Warn)},
        {"info", log.count(LogLevel::Info)},
        {"debug", log.count(LogLevel::Debug)}
    };
    return out;
}
