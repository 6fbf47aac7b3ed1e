/**
 * @file boundary.hpp
 * @brief System keeping bodies inside the world rectangle
 *
 * This system handles:
 * - Clamping a body back inside [radius, width - radius] x [radius, height - radius]
 * - Reflecting the velocity component normal to the wall, scaled by elasticity
 * - Zeroing reflected speeds below a small epsilon to stop micro-bouncing
 *
 * The floor, ceiling, right and left walls are tested independently, so a
 * body in a corner is corrected on both axes in the same tick.
 *
 * Required components:
 * - Position, Velocity (to modify)
 * - Radius (to read)
 */

#ifndef DISCSIM_BOUNDARY_SYSTEM_HPP
#define DISCSIM_BOUNDARY_SYSTEM_HPP

#include <entt/entt.hpp>
#include "discsim/systems/i_system.hpp"

namespace Systems {

/**
 * @struct BoundaryConfig
 * @brief Configuration parameters specific to the boundary system
 */
struct BoundaryConfig {
    // Reflected speeds below this are set to zero
    double restingSpeedEpsilon = SimulatorConstants::RestingSpeedEpsilon;
};

/**
 * @class BoundarySystem
 * @brief Handles wall collisions against the world bounds
 */
class BoundarySystem : public ConfigurableSystem<BoundaryConfig> {
public:
    BoundarySystem();
    ~BoundarySystem() override = default;

    void update(entt::registry &registry, double dt) override;

    SystemType getType() const override { return SystemType::BOUNDARY; }

private:
    void bounce(double &component) const;
};

} // namespace Systems

#endif
