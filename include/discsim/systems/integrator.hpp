/**
 * @file integrator.hpp
 * @brief Gravity, surface friction and semi-implicit Euler integration
 *
 * For every body, in order:
 * - acceleration = (mass * gravity) / mass, i.e. the gravity vector itself
 * - velocity += acceleration * dt
 * - optional friction: floor contact damps velocity.x, side wall contact
 *   damps velocity.y (contacts are tested on the position before moving)
 * - position += velocity * dt, using the velocity just computed
 *
 * Required components:
 * - Position, Velocity, Acceleration (to modify)
 * - Mass, Radius (to read)
 */

#ifndef DISCSIM_INTEGRATOR_SYSTEM_HPP
#define DISCSIM_INTEGRATOR_SYSTEM_HPP

#include <entt/entt.hpp>
#include "discsim/components/basic.hpp"
#include "discsim/systems/i_system.hpp"

namespace Systems {

/**
 * @struct IntegratorConfig
 * @brief Configuration parameters specific to the integrator
 */
struct IntegratorConfig {
    // Per-tick velocity multiplier while touching a surface
    double frictionCoefficient = SimulatorConstants::FrictionCoefficient;

    // A body within this distance of a surface counts as touching it
    double contactTolerance = SimulatorConstants::FrictionContactTolerance;
};

/**
 * @class IntegratorSystem
 * @brief Advances velocity and position of every body
 */
class IntegratorSystem : public ConfigurableSystem<IntegratorConfig> {
public:
    IntegratorSystem();
    ~IntegratorSystem() override = default;

    void update(entt::registry& registry, double dt) override;

    SystemType getType() const override { return SystemType::INTEGRATOR; }

    /**
     * @brief Applies the surface friction approximation to one body
     *
     * @param pos Body position at the start of the tick
     * @param radius Body radius
     * @param vel Velocity to damp in place
     */
    void applySurfaceFriction(const Vector2D& pos, double radius, Vector2D& vel) const;
};

} // namespace Systems

#endif
