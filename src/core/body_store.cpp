/**
 * @file body_store.cpp
 * @brief Implementation of BodyStore
 */

#include "discsim/core/body_store.hpp"
#include "discsim/core/debug.hpp"

Components::BodyId BodyStore::addBody(const BodyDefinition& def) {
  Components::BodyId const id{nextId++};

  auto entity = registry.create();
  registry.emplace<Components::BodyId>(entity, id);
  registry.emplace<Components::Position>(entity, def.position);
  registry.emplace<Components::Velocity>(entity, def.velocity);
  registry.emplace<Components::Acceleration>(entity, def.acceleration);
  registry.emplace<Components::Mass>(entity, def.mass);
  registry.emplace<Components::Radius>(entity, def.radius);
  registry.emplace<Components::Color>(entity, def.color);

  index.emplace(id, entity);

  DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "BodyStore: added body " << id.value << " at ("
            << def.position.x << ", " << def.position.y << ") r=" << def.radius
            << " m=" << def.mass << "\n");
  return id;
}

void BodyStore::clearAll() {
  DEBUG_MSG(DEBUG_LEVEL_BASIC, "BodyStore: clearing " << index.size() << " bodies\n");
  registry.clear();
  index.clear();
}

bool BodyStore::contains(Components::BodyId id) const {
  return index.find(id) != index.end();
}

std::optional<BodySnapshot> BodyStore::find(Components::BodyId id) const {
  auto it = index.find(id);
  if (it == index.end()) {
    return std::nullopt;
  }
  return makeSnapshot(it->first, it->second);
}

void BodyStore::forEach(const std::function<void(const BodySnapshot&)>& fn) const {
  for (const auto& [id, entity] : index) {
    fn(makeSnapshot(id, entity));
  }
}

std::vector<BodySnapshot> BodyStore::snapshot() const {
  std::vector<BodySnapshot> out;
  out.reserve(index.size());
  forEach([&out](const BodySnapshot& body) { out.push_back(body); });
  return out;
}

BodySnapshot BodyStore::makeSnapshot(Components::BodyId id, entt::entity entity) const {
  BodySnapshot snap{};
  snap.id = id;
  snap.position = registry.get<Components::Position>(entity);
  snap.velocity = registry.get<Components::Velocity>(entity);
  snap.acceleration = registry.get<Components::Acceleration>(entity);
  snap.mass = registry.get<Components::Mass>(entity).value;
  snap.radius = registry.get<Components::Radius>(entity).value;
  snap.color = registry.get<Components::Color>(entity);
  return snap;
}
