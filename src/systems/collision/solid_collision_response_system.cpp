#include "discsim/systems/collision/solid_collision_response_system.hpp"
#include "discsim/components/basic.hpp"
#include "discsim/core/debug.hpp"

double Systems::SolidCollisionResponseSystem::impulseMagnitude(double normalSpeed, double elasticity,
                                                               double massA, double massB) {
    if (normalSpeed >= 0) {
        return 0.0;
    }
    return -(1.0 + elasticity) * normalSpeed / (1.0 / massA + 1.0 / massB);
}

bool Systems::SolidCollisionResponseSystem::resolve(entt::registry &registry,
                                                    const CollisionInfo &col,
                                                    double elasticity) {
    auto &posA = registry.get<Components::Position>(col.a);
    auto &velA = registry.get<Components::Velocity>(col.a);
    const double massA = registry.get<Components::Mass>(col.a).value;

    auto &posB = registry.get<Components::Position>(col.b);
    auto &velB = registry.get<Components::Velocity>(col.b);
    const double massB = registry.get<Components::Mass>(col.b).value;

    const Vector2D &n = col.normal;
    const double normalSpeed = (velB - velA).dotProduct(n);

    // Separating or resting: leave both bodies alone, even if they overlap.
    if (normalSpeed >= 0) {
        DebugStats::countSeparating();
        return false;
    }

    const double j = impulseMagnitude(normalSpeed, elasticity, massA, massB);
    const Vector2D impulse = n * j;
    velA -= impulse / massA;
    velB += impulse / massB;

    const Vector2D separation = n * (col.penetration / 2.0);
    posA -= separation;
    posB += separation;

    if (col.degenerate) {
        DebugStats::countDegenerateNormal();
    }
    DebugStats::countResolved();
    return true;
}
