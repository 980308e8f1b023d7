// include/mobility/mobility_model.hh
#ifndef MOBILITY_MODEL_HH
#define MOBILITY_MODEL_HH

#include "../sim_core.hh"
#include "../sim_errors.hh"
#include <cmath>
#include <random>

struct Position {
    double x = 0.0;
    double y = 0.0;

    bool operator==(const Position& o) const { return x == o.x && y == o.y; }
    bool operator!=(const Position& o) const { return !(*this == o); }
};

inline double distance(const Position& a, const Position& b) {
    return std::hypot(b.x - a.x, b.y - a.y);
}

// Moves p toward target by at most step; lands exactly on target when in reach.
inline Position stepToward(const Position& p, const Position& target, double step, bool& arrived) {
    double dist = distance(p, target);
    if (dist <= step) {
        arrived = true;
        return target;
    }
    arrived = false;
    double k = step / dist;
    return {p.x + (target.x - p.x) * k, p.y + (target.y - p.y) * k};
}

class MobilityModel {
public:
    virtual ~MobilityModel() = default;
    // Next position after elapsed time units
    virtual Position updatePosition(const Position& current, SimTime elapsed) = 0;
    virtual const char* getName() const = 0;
};

// Uniformly random heading every tick; no memory between ticks.
class RandomWalkModel : public MobilityModel {
private:
    double step_size;
    std::mt19937 rng;

public:
    explicit RandomWalkModel(double step = 1.0, uint32_t seed = 1) : step_size(step), rng(seed) {}

    Position updatePosition(const Position& current, SimTime elapsed) override;
    const char* getName() const override { return "random_walk"; }
    double getStepSize() const { return step_size; }
};

/**
 * Random waypoint: alternate between travelling to a uniformly drawn
 * target and pausing there for max(0, N(mean, std)) time units.
 *
 * Starts MOVING without a target; the first tick draws one and pauses,
 * so that tick never moves the entity.
 */
class RandomWaypointModel : public MobilityModel {
public:
    enum class State { Moving, Paused };

private:
    double speed;
    double area_w, area_h;
    double pause_mean, pause_std;
    std::mt19937 rng;

    State state = State::Moving;
    bool has_target = false;
    Position target;
    SimTime pause_timer = 0.0;
    SimTime pause_duration = 0.0;

    Position drawTarget();
    SimTime samplePause();
    void enterPause();

public:
    RandomWaypointModel(double spd = 1.0, double width = 100.0, double height = 100.0,
                        double p_mean = 5.0, double p_std = 2.0, uint32_t seed = 1)
        : speed(spd), area_w(width), area_h(height),
          pause_mean(p_mean), pause_std(p_std), rng(seed) {}

    Position updatePosition(const Position& current, SimTime elapsed) override;
    const char* getName() const override { return "random_waypoint"; }

    State getState() const { return state; }
    bool isPaused() const { return state == State::Paused; }
    bool hasTarget() const { return has_target; }
    const Position& getTarget() const { return target; }
    SimTime getPauseTimer() const { return pause_timer; }
    SimTime getPauseDuration() const { return pause_duration; }
};

/**
 * Manhattan grid: hop between adjacent grid intersections, one block at a
 * time. grid_rows/grid_cols count intersections along y/x.
 */
class ManhattanModel : public MobilityModel {
private:
    double speed;
    int grid_rows, grid_cols;
    double block_size;
    std::mt19937 rng;

    bool has_target = false;
    Position target;

public:
    ManhattanModel(double spd = 1.0, int rows = 10, int cols = 10, double block = 10.0,
                   uint32_t seed = 1)
        : speed(spd), grid_rows(rows), grid_cols(cols), block_size(block), rng(seed) {
        if (!(block_size > 0.0) || grid_rows < 1 || grid_cols < 1) {
            throw ValidationError("manhattan: block_size must be > 0 and the grid non-empty");
        }
    }

    Position updatePosition(const Position& current, SimTime elapsed) override;
    const char* getName() const override { return "manhattan"; }

    bool hasTarget() const { return has_target; }
    const Position& getTarget() const { return target; }
    double getBlockSize() const { return block_size; }
};

#endif // MOBILITY_MODEL_HH
