// include/modules/user_terminal.hh
#ifndef USER_TERMINAL_HH
#define USER_TERMINAL_HH

#include "../sim_object.hh"
#include "../mobility/mobility_model.hh"
#include <memory>

class UserTerminal : public SimObject {
private:
    Position position;
    std::unique_ptr<MobilityModel> mobility;
    uint64_t updates = 0;
    SimTime distance_travelled = 0.0;

public:
    UserTerminal(const std::string& n, EventQueue* eq)
        : SimObject(n, ElementClass::UserTerminal, eq) {
        params["serving_du"] = "";
    }

    void setMobility(std::unique_ptr<MobilityModel> m) { mobility = std::move(m); }
    MobilityModel* getMobility() const { return mobility.get(); }

    void setPosition(const Position& p) { position = p; }
    const Position& getPosition() const { return position; }

    void updatePosition(SimTime elapsed) override {
        updates++;
        if (!mobility) return;
        Position next = mobility->updatePosition(position, elapsed);
        distance_travelled += distance(position, next);
        position = next;
    }

    uint64_t getUpdateCount() const { return updates; }
    double getDistanceTravelled() const { return distance_travelled; }
};

#endif // USER_TERMINAL_HH
