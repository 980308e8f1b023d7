#ifndef MESSAGE_HH
#define MESSAGE_HH

#include "sim_core.hh"
#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

// Message types understood by the core; other types are element-specific.
inline constexpr const char* MSG_A1_POLICY          = "A1_POLICY";
inline constexpr const char* MSG_A1_POLICY_FEEDBACK = "A1_POLICY_FEEDBACK";
inline constexpr const char* MSG_A1_POLICY_ENFORCE  = "A1_POLICY_ENFORCE";
inline constexpr const char* MSG_O1_CONFIG          = "O1_CONFIG";
inline constexpr const char* MSG_INDICATION         = "INDICATION";
inline constexpr const char* MSG_CONTROL            = "CONTROL";
inline constexpr const char* MSG_IQ_DATA            = "IQ_DATA";

class Message {
public:
    std::string type;
    json payload;
    std::string src;
    std::string dst;           // empty for publish/subscribe
    std::string channel;       // name of the carrying channel
    SimTime send_time = 0.0;
    SimTime recv_time = 0.0;   // set by the channel at delivery
    uint64_t seq = 0;          // per-channel send counter

    Message() = default;
    Message(std::string t, json p) : type(std::move(t)), payload(std::move(p)) {}

    bool isPolicy() const { return type == MSG_A1_POLICY; }
    bool isEnforcement() const { return type == MSG_A1_POLICY_ENFORCE; }
    bool isConfig() const { return type == MSG_O1_CONFIG; }
    bool isIndication() const { return type == MSG_INDICATION; }

    SimTime getDelay() const {
        return recv_time > send_time ? recv_time - send_time : 0.0;
    }
};

#endif // MESSAGE_HH
