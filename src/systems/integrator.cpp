/**
 * @file integrator.cpp
 * @brief Implementation of the integrator system
 */

#include "discsim/systems/integrator.hpp"
#include "discsim/core/debug.hpp"
#include "discsim/core/profile.hpp"

namespace Systems {

IntegratorSystem::IntegratorSystem() = default;

void IntegratorSystem::update(entt::registry& registry, double dt) {
    PROFILE_SCOPE("IntegratorSystem");

    // Gravity always acts along the world's vertical axis (+y is down).
    const Vector2D gravity(0.0, sysConfig.GravityMagnitude);

    auto view = registry.view<Components::Position,
                              Components::Velocity,
                              Components::Acceleration,
                              Components::Mass,
                              Components::Radius>();

    for (auto [entity, pos, vel, acc, mass, radius] : view.each()) {
        // F = m * g, a = F / m. Mass cancels, every body falls alike.
        const Vector2D force = gravity * mass.value;
        acc = force / mass.value;

        vel += acc * dt;

        if (sysConfig.FrictionEnabled) {
            applySurfaceFriction(pos, radius.value, vel);
        }

        // Semi-implicit: the position step uses the updated velocity.
        pos += vel * dt;

        DebugStats::countIntegrated();
    }
}

void IntegratorSystem::applySurfaceFriction(const Vector2D& pos, double radius, Vector2D& vel) const {
    const double k = specificConfig.frictionCoefficient;
    const double tol = specificConfig.contactTolerance;

    // Floor contact damps horizontal motion.
    if (pos.y + radius >= sysConfig.WorldHeight - tol) {
        vel.x *= k;
    }

    // Wall contact damps the vertical component.
    if (pos.x + radius >= sysConfig.WorldWidth - tol || pos.x - radius <= tol) {
        vel.y *= k;
    }
}

} // namespace Systems
