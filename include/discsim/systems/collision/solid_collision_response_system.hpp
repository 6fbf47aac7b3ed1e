#ifndef DISCSIM_SOLID_COLLISION_RESPONSE_SYSTEM_HPP
#define DISCSIM_SOLID_COLLISION_RESPONSE_SYSTEM_HPP

#include <entt/entt.hpp>
#include "discsim/systems/collision/collision_data.hpp"

namespace Systems {

    /**
     * @brief Impulse response and positional correction for one contact.
     *
     * Only approaching pairs (relative normal speed < 0) are touched. The
     * impulse is j = -(1 + e) * vrel / (1/mA + 1/mB); the overlap is then
     * split evenly between the two bodies, regardless of mass.
     */
    class SolidCollisionResponseSystem {
    public:
        /**
         * @return true if the pair was approaching and has been resolved
         */
        static bool resolve(entt::registry &registry, const CollisionInfo &col, double elasticity);

        /** @brief Impulse magnitude along the normal, 0 when separating */
        static double impulseMagnitude(double normalSpeed, double elasticity,
                                       double massA, double massB);
    };

} // namespace Systems

#endif
