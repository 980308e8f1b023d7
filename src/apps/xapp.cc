// src/apps/xapp.cc
#include "apps/xapp.hh"
#include "modules/local_controller.hh"
#include "sim_errors.hh"

void XApp::onIndication(const Message& msg, const std::string& origin) {
    indications_seen++;
    DPRINTF(XAPP, "[%s] indication %s from %s\n", id.c_str(), msg.type.c_str(), origin.c_str());
}

void XApp::sendControl(const json& payload, const std::string& element_id) {
    if (!controller) {
        throw SimError("xApp " + id + " is not attached to a controller");
    }
    controller->sendControl(Message(MSG_CONTROL, payload), element_id);
    controls_sent++;
}

void HandoverXApp::onIndication(const Message& msg, const std::string& origin) {
    XApp::onIndication(msg, origin);
    if (msg.payload.value("message_type", "") != "HANDOVER_REPORT") return;
    reports_seen++;
    if (std::uniform_real_distribution<double>(0.0, 1.0)(rng) < adjust_probability) {
        adjustHandoverParameters(origin);
    }
}

void HandoverXApp::adjustHandoverParameters(const std::string& du_id) {
    std::uniform_real_distribution<double> hyst(-hysteresis_margin, hysteresis_margin);
    std::uniform_real_distribution<double> ttt(-time_to_trigger_margin, time_to_trigger_margin);
    json control = {
        {"message_type", "HANDOVER_PARAMETER_ADJUSTMENT"},
        {"du_id", du_id},
        {"actions", json::array({
            {{"parameter", "hysteresis"}, {"value", hyst(rng)}},
            {{"parameter", "time_to_trigger"}, {"value", ttt(rng)}}
        })}
    };
    sendControl(control, du_id);
}
