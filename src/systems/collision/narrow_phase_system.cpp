#include "discsim/systems/collision/narrow_phase_system.hpp"
#include "discsim/components/basic.hpp"
#include "discsim/core/debug.hpp"

#include <algorithm>

std::optional<CollisionInfo> Systems::NarrowPhaseSystem::detect(const Vector2D &posA, double radiusA,
                                                                const Vector2D &posB, double radiusB,
                                                                const Vector2D &fallbackNormal) {
    const double distance = posA.dist(posB);
    if (!(distance < radiusA + radiusB)) {
        return std::nullopt;
    }

    CollisionInfo info{};
    info.distance = distance;
    info.penetration = radiusA + radiusB - distance;
    info.degenerate = distance <= 0.0;
    info.normal = info.degenerate ? fallbackNormal : (posB - posA) / distance;
    return info;
}

std::optional<CollisionInfo> Systems::NarrowPhaseSystem::testPair(const entt::registry &registry,
                                                                  entt::entity a, entt::entity b,
                                                                  const Vector2D &fallbackNormal) {
    if (!registry.valid(a) || !registry.valid(b)) return std::nullopt;

    const auto &posA = registry.get<Components::Position>(a);
    const auto &posB = registry.get<Components::Position>(b);
    const double radiusA = registry.get<Components::Radius>(a).value;
    const double radiusB = registry.get<Components::Radius>(b).value;

    auto info = detect(posA, radiusA, posB, radiusB, fallbackNormal);
    if (info) {
        info->a = a;
        info->b = b;
    }
    return info;
}

std::vector<entt::entity> Systems::NarrowPhaseSystem::orderedBodies(const entt::registry &registry) {
    std::vector<entt::entity> bodies;
    auto view = registry.view<Components::BodyId, Components::Position, Components::Radius>();
    for (auto entity : view) {
        bodies.push_back(entity);
    }
    std::sort(bodies.begin(), bodies.end(), [&registry](entt::entity lhs, entt::entity rhs) {
        return registry.get<Components::BodyId>(lhs) < registry.get<Components::BodyId>(rhs);
    });
    return bodies;
}

void Systems::NarrowPhaseSystem::update(const entt::registry &registry,
                                        CollisionManifold &manifold,
                                        const Vector2D &fallbackNormal) {
    manifold.clear();

    auto bodies = orderedBodies(registry);
    for (size_t i = 0; i < bodies.size(); ++i) {
        for (size_t j = i + 1; j < bodies.size(); ++j) {
            DebugStats::countPairTested();
            auto info = testPair(registry, bodies[i], bodies[j], fallbackNormal);
            if (info) {
                manifold.collisions.push_back(*info);
            }
        }
    }
}
