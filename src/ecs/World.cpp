#include "ecs/World.h"

#include <vector>

#include "combat/CombatComponents.h"

EntityId World::create() {
  return registry.create();
}

void World::destroy(EntityId id) {
  registry.destroy(id);
}

int World::slotOf(EntityId e) const {
  for (std::size_t i = 0; i < fighters.size(); ++i) {
    if (fighters[i] == e && e != kInvalidEntity) {
      return static_cast<int>(i);
    }
  }
  return -1;
}

void World::clearBoxes() {
  std::vector<EntityId> doomed;
  for (auto e : registry.view<HitboxData>()) {
    doomed.push_back(e);
  }
  for (auto e : registry.view<ThrowboxData>()) {
    doomed.push_back(e);
  }
  for (auto e : doomed) {
    registry.destroy(e);
  }
}
