#include "discsim/systems/collision.hpp"
#include "discsim/core/debug.hpp"
#include "discsim/core/profile.hpp"
#include "discsim/systems/collision/narrow_phase_system.hpp"
#include "discsim/systems/collision/solid_collision_response_system.hpp"

namespace Systems {

CollisionSystem::CollisionSystem() = default;

void CollisionSystem::update(entt::registry& registry, double /*dt*/) {
    PROFILE_SCOPE("CollisionSystem");

    resolved.clear();

    const auto bodies = NarrowPhaseSystem::orderedBodies(registry);
    for (size_t i = 0; i < bodies.size(); ++i) {
        for (size_t j = i + 1; j < bodies.size(); ++j) {
            DebugStats::countPairTested();

            auto contact = NarrowPhaseSystem::testPair(registry, bodies[i], bodies[j],
                                                       specificConfig.fallbackNormal);
            if (!contact) {
                continue;
            }

            if (SolidCollisionResponseSystem::resolve(registry, *contact, sysConfig.Elasticity)) {
                resolved.collisions.push_back(*contact);
            }
        }
    }
}

} // namespace Systems
