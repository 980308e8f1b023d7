// include/apps/xapp.hh
#ifndef XAPP_HH
#define XAPP_HH

#include "../message.hh"
#include <random>
#include <string>

class LocalController;

// Observer hosted by a local controller: sees every E2 indication and may
// answer with control messages to managed elements.
class XApp {
protected:
    std::string id;
    LocalController* controller = nullptr;
    uint64_t indications_seen = 0;
    uint64_t controls_sent = 0;

public:
    explicit XApp(const std::string& i) : id(i) {}
    virtual ~XApp() = default;

    XApp(const XApp&) = delete;
    XApp& operator=(const XApp&) = delete;

    void attach(LocalController* lc) { controller = lc; }
    void detach() { controller = nullptr; }
    bool isAttached() const { return controller != nullptr; }
    LocalController* getController() const { return controller; }

    virtual void onIndication(const Message& msg, const std::string& origin);

    // Throws SimError when not attached, AddressError for an unknown element.
    void sendControl(const json& payload, const std::string& element_id);

    const std::string& getId() const { return id; }
    uint64_t getIndicationsSeen() const { return indications_seen; }
    uint64_t getControlsSent() const { return controls_sent; }
};

/**
 * Handover tuning: on each HANDOVER_REPORT indication, with probability
 * adjust_probability, asks the reporting DU to shift hysteresis and
 * time-to-trigger by uniform random deltas within the margins.
 */
class HandoverXApp : public XApp {
private:
    std::mt19937 rng;
    double adjust_probability;
    double hysteresis_margin;       // dB
    double time_to_trigger_margin;  // ms
    uint64_t reports_seen = 0;

public:
    HandoverXApp(const std::string& i, uint32_t seed = 1, double probability = 0.5,
                 double hyst_margin = 1.0, double ttt_margin = 5.0)
        : XApp(i), rng(seed), adjust_probability(probability),
          hysteresis_margin(hyst_margin), time_to_trigger_margin(ttt_margin) {}

    void onIndication(const Message& msg, const std::string& origin) override;
    void adjustHandoverParameters(const std::string& du_id);

    uint64_t getReportsSeen() const { return reports_seen; }
};

#endif // XAPP_HH
