/**
 * @file body_store.hpp
 * @brief Owner of the simulated bodies
 */

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <vector>

#include <entt/entt.hpp>
#include "discsim/components/basic.hpp"

/**
 * @struct BodyDefinition
 * @brief Everything needed to create a body, minus its id
 *
 * Mass and radius must be positive; the store does not check.
 */
struct BodyDefinition {
    Vector2D position;
    Vector2D velocity;
    Vector2D acceleration;
    double mass = 1.0;
    double radius = 1.0;
    Components::Color color;
};

/**
 * @struct BodySnapshot
 * @brief Read-only copy of one body, as handed to the renderer
 */
struct BodySnapshot {
    Components::BodyId id;
    Vector2D position;
    Vector2D velocity;
    Vector2D acceleration;
    double mass;
    double radius;
    Components::Color color;
};

/**
 * @class BodyStore
 * @brief Arena of bodies keyed by a monotonic id
 *
 * Each body is an entity in an EnTT registry carrying BodyId, Position,
 * Velocity, Acceleration, Mass, Radius and Color. Ids start at 1 and are
 * never reused, including across clearAll().
 */
class BodyStore {
public:
    BodyStore() = default;

    BodyStore(const BodyStore&) = delete;
    BodyStore& operator=(const BodyStore&) = delete;

    /**
     * @brief Appends a body and returns its freshly assigned id
     */
    Components::BodyId addBody(const BodyDefinition& def);

    /**
     * @brief Removes every body at once
     */
    void clearAll();

    std::size_t size() const { return index.size(); }
    bool empty() const { return index.empty(); }
    bool contains(Components::BodyId id) const;

    std::optional<BodySnapshot> find(Components::BodyId id) const;

    /**
     * @brief Visits every body in id order
     */
    void forEach(const std::function<void(const BodySnapshot&)>& fn) const;

    /**
     * @brief Copies every body, in id order
     */
    std::vector<BodySnapshot> snapshot() const;

    /** @brief The id the next addBody() call will assign */
    Components::BodyId peekNextId() const { return Components::BodyId{nextId}; }

    entt::registry& getRegistry() { return registry; }
    const entt::registry& getRegistry() const { return registry; }

private:
    BodySnapshot makeSnapshot(Components::BodyId id, entt::entity entity) const;

    entt::registry registry;
    std::map<Components::BodyId, entt::entity> index;
    std::uint64_t nextId = 1;
};
