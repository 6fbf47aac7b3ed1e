#ifndef DISCSIM_NARROW_PHASE_SYSTEM_HPP
#define DISCSIM_NARROW_PHASE_SYSTEM_HPP

#include <optional>
#include <vector>

#include <entt/entt.hpp>
#include "discsim/systems/collision/collision_data.hpp"

namespace Systems {

    /**
     * @brief Brute-force circle overlap tests.
     *
     * Every unordered pair is tested (O(n^2)); there is no broad phase.
     * Pairs are visited in body id order so results do not depend on the
     * registry's storage layout.
     */
    class NarrowPhaseSystem {
    public:
        /**
         * @brief Tests two circles for overlap
         *
         * Overlap means distance < radiusA + radiusB. When the centres
         * coincide the normal is @p fallbackNormal instead of 0/0.
         */
        static std::optional<CollisionInfo> detect(const Vector2D& posA, double radiusA,
                                                   const Vector2D& posB, double radiusB,
                                                   const Vector2D& fallbackNormal);

        /** @brief detect() on two registry entities */
        static std::optional<CollisionInfo> testPair(const entt::registry& registry,
                                                     entt::entity a, entt::entity b,
                                                     const Vector2D& fallbackNormal);

        /** @brief Bodies sorted by BodyId */
        static std::vector<entt::entity> orderedBodies(const entt::registry& registry);

        /**
         * @brief Collects every overlapping pair without modifying anything
         */
        static void update(const entt::registry& registry,
                           CollisionManifold& manifold,
                           const Vector2D& fallbackNormal);
    };

} // namespace Systems

#endif
