/**
 * @file collision.hpp
 * @brief Pairwise circle collision detection and response
 *
 * Pairs (i, j) with i before j in body id order are tested one at a time and
 * each overlap is resolved immediately, so a pair sees positions already
 * corrected by earlier pairs in the same tick.
 *
 * Required components:
 * - BodyId (pair ordering)
 * - Position, Velocity (to modify)
 * - Mass, Radius (to read)
 */

#ifndef DISCSIM_COLLISION_SYSTEM_HPP
#define DISCSIM_COLLISION_SYSTEM_HPP

#include <entt/entt.hpp>
#include "discsim/systems/collision/collision_data.hpp"
#include "discsim/systems/i_system.hpp"

namespace Systems {

/**
 * @struct CollisionConfig
 * @brief Configuration parameters specific to the collision system
 */
struct CollisionConfig {
    // Normal used when two centres coincide exactly
    Vector2D fallbackNormal{1.0, 0.0};
};

class CollisionSystem : public ConfigurableSystem<CollisionConfig> {
public:
    CollisionSystem();
    ~CollisionSystem() override = default;

    void update(entt::registry& registry, double dt) override;

    SystemType getType() const override { return SystemType::COLLISION; }

    /**
     * @brief Contacts resolved during the most recent update
     */
    const CollisionManifold& getResolved() const { return resolved; }

private:
    CollisionManifold resolved;
};

} // namespace Systems

#endif
