// include/modules/distributed_unit.hh
#ifndef DISTRIBUTED_UNIT_HH
#define DISTRIBUTED_UNIT_HH

#include "../sim_object.hh"
#include "../process.hh"
#include "../sim_errors.hh"
#include <memory>
#include <set>

/**
 * O-DU: terminates fronthaul IQ traffic, reports cell load to its local
 * controller over E2 and takes handover tuning through E2 control.
 */
class DistributedUnit : public SimObject {
private:
    std::set<std::string> attached_ues;
    std::unique_ptr<Process> report_process;
    uint64_t iq_slots = 0;
    uint64_t iq_samples = 0;
    uint64_t reports_sent = 0;
    uint64_t controls_applied = 0;
    bool f1_established = false;

protected:
    void handleMessage(const Message& msg, const std::string& src) override {
        if (msg.type == MSG_IQ_DATA) {
            iq_slots++;
            iq_samples += msg.payload.value("samples", 0u);
        } else if (msg.type == MSG_CONTROL) {
            handleControl(msg.payload);
        } else if (msg.type == "F1_SETUP_RESPONSE") {
            f1_established = true;
            SLOG_INFO(event_queue->getLog(), F1, "%s F1 setup complete with %s",
                      name.c_str(), src.c_str());
        } else {
            SimObject::handleMessage(msg, src);
        }
    }

    void handleControl(const json& payload) {
        std::string kind = payload.value("message_type", "");
        if (kind != "HANDOVER_PARAMETER_ADJUSTMENT") {
            SLOG_WARN(event_queue->getLog(), E2, "%s: unsupported control '%s'",
                      name.c_str(), kind.c_str());
            return;
        }
        if (!payload.contains("actions") || !payload["actions"].is_array()) return;
        for (const auto& action : payload["actions"]) {
            std::string param = action.value("parameter", "");
            if (param.empty() || !action.contains("value")) continue;
            double delta = action["value"].get<double>();
            params[param] = params.value(param, 0.0) + delta;
        }
        controls_applied++;
    }

public:
    DistributedUnit(const std::string& n, EventQueue* eq)
        : SimObject(n, ElementClass::DistributedUnit, eq) {
        params["cell_id"] = n;
        params["max_ues"] = 100;
        params["transmit_power"] = 46.0;
        params["hysteresis"] = 2.0;          // dB
        params["time_to_trigger"] = 40.0;    // ms
        params["traffic_steering"] = json::object();
    }

    void applyPolicy(const json& policy) override {
        SimObject::applyPolicy(policy);
        const json& content = policy.contains("policy_content") ? policy["policy_content"] : json::object();
        if (content.is_object() && content.value("action", "") == "steer_traffic" &&
            content.value("source_du", "") == name) {
            params["traffic_steering"] = content;
        }
    }

    bool attachUe(const std::string& ue_id) { return attached_ues.insert(ue_id).second; }
    bool detachUe(const std::string& ue_id) { return attached_ues.erase(ue_id) > 0; }
    size_t attachedCount() const { return attached_ues.size(); }

    double load() const {
        int max_ues = params.value("max_ues", 0);
        if (max_ues <= 0) return 0.0;
        return static_cast<double>(attached_ues.size()) / max_ues;
    }

    void sendLoadReport() {
        json kpm = {
            {"message_type", "KPM_REPORT"},
            {"cell_id", params["cell_id"]},
            {"metric", "cell_load"},
            {"value", load()},
            {"ues", attached_ues.size()}
        };
        sendOn("e2", Message(MSG_INDICATION, kpm));
        json ho = {
            {"message_type", "HANDOVER_REPORT"},
            {"cell_id", params["cell_id"]},
            {"hysteresis", params["hysteresis"]},
            {"time_to_trigger", params["time_to_trigger"]}
        };
        sendOn("e2", Message(MSG_INDICATION, ho));
        reports_sent++;
    }

    // Periodic E2 reports to the controller bound as the "e2" peer
    void startLoadReports(SimTime period) {
        if (getPeer("e2").empty()) {
            throw AddressError(name + ": no E2 controller bound");
        }
        report_process = std::make_unique<Process>(event_queue, period,
            [this](SimTime) { sendLoadReport(); }, "kpm:" + name);
        report_process->start();
    }

    void stopLoadReports() {
        if (report_process) report_process->stop();
    }

    void f1Setup() {
        json req = {{"du_id", name}, {"cell_id", params["cell_id"]}};
        sendOn("f1", Message("F1_SETUP_REQUEST", req));
    }

    uint64_t getIqSlots() const { return iq_slots; }
    uint64_t getIqSamples() const { return iq_samples; }
    uint64_t getReportsSent() const { return reports_sent; }
    uint64_t getControlsApplied() const { return controls_applied; }
    bool isF1Established() const { return f1_established; }
};

#endif // DISTRIBUTED_UNIT_HH
