/**
 * @file leapfrog.hpp
 * @brief Kick-drift-kick integration of all live bodies
 */

#pragma once

#include "accretion/systems/barnes_hut.hpp"
#include "accretion/systems/i_system.hpp"

namespace Systems {

/**
 * @class LeapfrogSystem
 * @brief Advances positions and velocities by one step of length dt
 *
 * Half kick, drift, force evaluation, half kick. The accelerations from the
 * end of a step are reused as the first half kick of the next one unless
 * invalidateAccelerations() was called in between (bodies added, removed or
 * moved, or settings changed).
 */
class LeapfrogSystem : public ISystem {
public:
    explicit LeapfrogSystem(BarnesHutSystem& forces);
    ~LeapfrogSystem() override = default;

    void update(BodyRegistry& bodies, TickContext& ctx) override;

    void invalidateAccelerations() { accelerationsValid = false; }
    bool accelerationsCached() const { return accelerationsValid; }

private:
    void kick(BodyRegistry& bodies, double halfDt, bool clamp) const;

    BarnesHutSystem& forces;
    bool accelerationsValid = false;
};

} // namespace Systems
