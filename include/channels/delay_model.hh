// include/channels/delay_model.hh
#ifndef DELAY_MODEL_HH
#define DELAY_MODEL_HH

#include "../sim_core.hh"
#include <algorithm>
#include <random>

// Transmission delay sampled once per message.
class DelayModel {
public:
    virtual ~DelayModel() = default;
    virtual SimTime sample() = 0;
};

class ConstantDelay : public DelayModel {
private:
    SimTime delay;

public:
    explicit ConstantDelay(SimTime d) : delay(d < 0.0 ? 0.0 : d) {}
    SimTime sample() override { return delay; }
};

/**
 * Normally distributed latency plus jitter, clamped to a floor.
 * Defaults match an open fronthaul link: 100 ms +/- 20 ms, 5 ms jitter.
 */
class NormalDelay : public DelayModel {
private:
    std::mt19937 rng;
    double mean;
    double stddev;
    double jitter_std;
    SimTime floor;

public:
    NormalDelay(double mean_value = 0.1, double stddev_value = 0.02, double jitter = 0.005,
                SimTime floor_value = 0.0, uint32_t seed = 1)
        : rng(seed), mean(mean_value), stddev(stddev_value), jitter_std(jitter),
          floor(floor_value < 0.0 ? 0.0 : floor_value) {}

    SimTime sample() override {
        double d = mean;
        if (stddev > 0.0) d = std::normal_distribution<double>(mean, stddev)(rng);
        if (jitter_std > 0.0) d += std::normal_distribution<double>(0.0, jitter_std)(rng);
        return std::max(floor, d);
    }

    SimTime getFloor() const { return floor; }
};

#endif // DELAY_MODEL_HH
