// include/modules/radio_unit.hh
#ifndef RADIO_UNIT_HH
#define RADIO_UNIT_HH

#include "../sim_object.hh"
#include "../process.hh"
#include "../sim_errors.hh"
#include <memory>

// O-RU: emits one IQ slot per period toward its DU over fronthaul.
class RadioUnit : public SimObject {
private:
    std::unique_ptr<Process> iq_process;
    uint64_t slot = 0;

public:
    RadioUnit(const std::string& n, EventQueue* eq)
        : SimObject(n, ElementClass::RadioUnit, eq) {
        params["frequency"] = 3.5e9;          // Hz
        params["bandwidth"] = 100e6;          // Hz
        params["tx_power"] = 46.0;            // dBm
        params["iq_samples_per_slot"] = 1024;
    }

    void sendIqData(const std::string& du_id) {
        json payload = {
            {"ru_id", name},
            {"slot", slot++},
            {"samples", params["iq_samples_per_slot"]}
        };
        sendOn("fronthaul", Message(MSG_IQ_DATA, payload), du_id);
    }

    void startIqTransmission(const std::string& du_id, SimTime period) {
        if (!hasChannel("fronthaul")) {
            throw AddressError(name + ": fronthaul not bound");
        }
        iq_process = std::make_unique<Process>(event_queue, period,
            [this, du_id](SimTime) { sendIqData(du_id); }, "iq:" + name);
        iq_process->start();
    }

    void stopIqTransmission() {
        if (iq_process) iq_process->stop();
    }

    uint64_t getSlotsSent() const { return slot; }
    double getTxPower() const { return params["tx_power"].get<double>(); }
    double getFrequency() const { return params["frequency"].get<double>(); }
};

#endif // RADIO_UNIT_HH
