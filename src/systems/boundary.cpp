#include "discsim/systems/boundary.hpp"
#include "discsim/components/basic.hpp"
#include "discsim/core/debug.hpp"
#include "discsim/core/profile.hpp"
#include <cmath>

namespace Systems {

BoundarySystem::BoundarySystem() = default;

void BoundarySystem::bounce(double &component) const {
    component *= -sysConfig.Elasticity;
    if (std::abs(component) < specificConfig.restingSpeedEpsilon) {
        component = 0.0;
    }
}

void BoundarySystem::update(entt::registry &registry, double /*dt*/) {
    PROFILE_SCOPE("BoundarySystem");

    const double width = sysConfig.WorldWidth;
    const double height = sysConfig.WorldHeight;

    auto view = registry.view<Components::Position, Components::Velocity, Components::Radius>();

    for (auto &&[entity, pos, vel, radius] : view.each()) {
        const double r = radius.value;

        // Floor
        if (pos.y + r > height) {
            pos.y = height - r;
            bounce(vel.y);
            DebugStats::countBoundaryContact();
        }
        // Ceiling
        if (pos.y - r < 0.0) {
            pos.y = r;
            bounce(vel.y);
            DebugStats::countBoundaryContact();
        }
        // Right wall
        if (pos.x + r > width) {
            pos.x = width - r;
            bounce(vel.x);
            DebugStats::countBoundaryContact();
        }
        // Left wall
        if (pos.x - r < 0.0) {
            pos.x = r;
            bounce(vel.x);
            DebugStats::countBoundaryContact();
        }
    }
}

} // namespace Systems
