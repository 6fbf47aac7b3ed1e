#pragma once

namespace Systems {

/**
 * @enum SystemType
 * @brief The ECS systems making up one simulation tick, in execution order.
 */
enum class SystemType {
    INTEGRATOR,
    COLLISION,
    BOUNDARY
};

} // namespace Systems
