// include/modules/cu_control_plane.hh
#ifndef CU_CONTROL_PLANE_HH
#define CU_CONTROL_PLANE_HH

#include "../sim_object.hh"
#include <map>

// O-CU-CP: F1 setup toward DUs, Xn/X2 handover signalling between CUs,
// bearer setup toward its CU-UP.
class CuControlPlane : public SimObject {
private:
    std::map<std::string, std::string> connected_dus;   // du id -> cell id
    std::map<std::string, uint64_t> handovers_in;       // interface -> count
    uint64_t handovers_acked = 0;
    uint64_t bearers_established = 0;

protected:
    void handleMessage(const Message& msg, const std::string& src) override {
        if (msg.type == "F1_SETUP_REQUEST") {
            connected_dus[src] = msg.payload.value("cell_id", src);
            json rsp = {{"cu_id", name}, {"accepted", true}};
            sendOn("f1", Message("F1_SETUP_RESPONSE", rsp), src);
        } else if (msg.type == "HANDOVER_REQUEST") {
            handovers_in[msg.channel]++;
            json ack = {{"ue_id", msg.payload.value("ue_id", "")}, {"target_cu", name}};
            sendOn(msg.channel, Message("HANDOVER_REQUEST_ACK", ack), src);
        } else if (msg.type == "HANDOVER_REQUEST_ACK") {
            handovers_acked++;
        } else if (msg.type == "BEARER_SETUP_RESPONSE") {
            bearers_established++;
        } else {
            SimObject::handleMessage(msg, src);
        }
    }

public:
    CuControlPlane(const std::string& n, EventQueue* eq)
        : SimObject(n, ElementClass::CuControlPlane, eq) {
        params["max_dus"] = 16;
        params["handover_enabled"] = true;
    }

    // via is the interface label, "xn" or "x2"
    void requestHandover(const std::string& peer_cu, const std::string& ue_id,
                         const std::string& via = "xn") {
        json req = {{"ue_id", ue_id}, {"source_cu", name}};
        sendOn(via, Message("HANDOVER_REQUEST", req), peer_cu);
    }

    void setupBearer(const std::string& cu_up, const std::string& ue_id) {
        json req = {{"ue_id", ue_id}, {"cu_cp", name}};
        sendOn("f1", Message("BEARER_SETUP_REQUEST", req), cu_up);
    }

    size_t connectedDuCount() const { return connected_dus.size(); }
    bool isDuConnected(const std::string& du) const { return connected_dus.count(du) > 0; }
    uint64_t getHandoversIn(const std::string& via) const {
        auto it = handovers_in.find(via);
        return it != handovers_in.end() ? it->second : 0;
    }
    uint64_t getHandoversAcked() const { return handovers_acked; }
    uint64_t getBearersEstablished() const { return bearers_established; }
};

#endif // CU_CONTROL_PLANE_HH
