// src/mobility/mobility_model.cc
#include "mobility/mobility_model.hh"

#include <algorithm>
#include <vector>

namespace {
constexpr double kTwoPi = 6.283185307179586;
}

Position RandomWalkModel::updatePosition(const Position& current, SimTime elapsed) {
    double angle = std::uniform_real_distribution<double>(0.0, kTwoPi)(rng);
    double d = step_size * elapsed;
    return {current.x + d * std::cos(angle), current.y + d * std::sin(angle)};
}

Position RandomWaypointModel::drawTarget() {
    double x = std::uniform_real_distribution<double>(0.0, area_w)(rng);
    double y = std::uniform_real_distribution<double>(0.0, area_h)(rng);
    return {x, y};
}

SimTime RandomWaypointModel::samplePause() {
    double d = pause_mean;
    if (pause_std > 0.0) d = std::normal_distribution<double>(pause_mean, pause_std)(rng);
    return std::max(0.0, d);
}

void RandomWaypointModel::enterPause() {
    state = State::Paused;
    pause_timer = 0.0;
    pause_duration = samplePause();
}

Position RandomWaypointModel::updatePosition(const Position& current, SimTime elapsed) {
    if (state == State::Paused) {
        pause_timer += elapsed;
        if (pause_timer >= pause_duration) {
            state = State::Moving;
            pause_timer = 0.0;
            target = drawTarget();
            has_target = true;
        }
        return current;
    }

    if (!has_target) {
        target = drawTarget();
        has_target = true;
        enterPause();
        return current;
    }

    bool arrived = false;
    Position next = stepToward(current, target, speed * elapsed, arrived);
    if (arrived) enterPause();
    return next;
}

Position ManhattanModel::updatePosition(const Position& current, SimTime elapsed) {
    if (!has_target || current == target) {
        // Off-grid starts snap to the nearest edge cell
        int row = std::clamp(static_cast<int>(std::floor(current.y / block_size)), 0, grid_rows - 1);
        int col = std::clamp(static_cast<int>(std::floor(current.x / block_size)), 0, grid_cols - 1);

        std::vector<std::pair<int, int>> moves;   // (col, row)
        if (row > 0) moves.emplace_back(col, row - 1);
        if (row < grid_rows - 1) moves.emplace_back(col, row + 1);
        if (col > 0) moves.emplace_back(col - 1, row);
        if (col < grid_cols - 1) moves.emplace_back(col + 1, row);

        if (moves.empty()) {
            has_target = false;
            return current;
        }
        size_t pick = std::uniform_int_distribution<size_t>(0, moves.size() - 1)(rng);
        target = {moves[pick].first * block_size, moves[pick].second * block_size};
        has_target = true;
        return current;
    }

    bool arrived = false;
    return stepToward(current, target, speed * elapsed, arrived);
}
