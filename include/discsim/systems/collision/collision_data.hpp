/**
 * @file collision_data.hpp
 * @brief Data passed between collision detection and response
 */

#pragma once

#include <vector>

#include <entt/entt.hpp>

#include "discsim/math/vector_math.hpp"

// One overlapping pair. normal points from a to b.
struct CollisionInfo {
    entt::entity a;
    entt::entity b;
    Vector2D normal;
    double distance;
    double penetration;  // radiusA + radiusB - distance
    bool degenerate;     // centres coincide, normal is the fallback
};

struct CollisionManifold {
    std::vector<CollisionInfo> collisions;
    void clear() { collisions.clear(); }
    std::size_t size() const { return collisions.size(); }
    bool empty() const { return collisions.empty(); }
};
