#pragma once

#include "bomber/game/Simulation.h"

namespace bomber::game {

// Lets tests stage a state (score, targets, drone) before ticking.
class SimulationTestAccess {
public:
    static SimulationState& state(Simulation& sim) { return sim.state_; }
};

} // namespace bomber::game
