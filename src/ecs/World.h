#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <entt/entt.hpp>

#include "ecs/Components.h"  // IWYU pragma: keep
#include "ecs/Entity.h"

class World {
 public:
  EntityId create();
  void destroy(EntityId);

  // Destroys every hitbox and throwbox; fighters stay.
  void clearBoxes();

  [[nodiscard]] EntityId fighter(int slot) const {
    return fighters[static_cast<std::size_t>(slot)];
  }
  // Slot of a fighter entity, or -1.
  [[nodiscard]] int slotOf(EntityId e) const;

  entt::registry registry;
  // Outbound combat events; enqueued during a tick, drained by the caller with update().
  entt::dispatcher events;

  std::array<EntityId, 2> fighters{kInvalidEntity, kInvalidEntity};

  // debug/test-friendly counters
  int hitEvents = 0;
  int blockEvents = 0;
  int parryEvents = 0;

  int freezeFrames = 0;  // cosmetic super freeze, view only
  bool roundOver = false;
  int winner = -1;
};
