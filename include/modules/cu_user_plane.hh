// include/modules/cu_user_plane.hh
#ifndef CU_USER_PLANE_HH
#define CU_USER_PLANE_HH

#include "../sim_object.hh"
#include <set>

class CuUserPlane : public SimObject {
private:
    std::set<std::string> bearers;

protected:
    void handleMessage(const Message& msg, const std::string& src) override {
        if (msg.type == "BEARER_SETUP_REQUEST") {
            std::string ue = msg.payload.value("ue_id", "");
            bool fresh = bearers.insert(ue).second;
            json rsp = {{"ue_id", ue}, {"cu_up", name}, {"new_bearer", fresh}};
            sendOn(msg.channel, Message("BEARER_SETUP_RESPONSE", rsp), src);
        } else {
            SimObject::handleMessage(msg, src);
        }
    }

public:
    CuUserPlane(const std::string& n, EventQueue* eq)
        : SimObject(n, ElementClass::CuUserPlane, eq) {
        params["max_bearers"] = 1024;
    }

    size_t bearerCount() const { return bearers.size(); }
    bool hasBearer(const std::string& ue) const { return bearers.count(ue) > 0; }
};

#endif // CU_USER_PLANE_HH
