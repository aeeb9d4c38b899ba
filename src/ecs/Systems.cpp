#include "ecs/Systems.h"

#include <algorithm>
#include <cmath>
#include <vector>

#include "combat/CombatComponents.h"
#include "ecs/Components.h"
#include "ecs/Entity.h"
#include "ecs/World.h"

namespace Systems {

static Box attackBox(const Transform& t, int facingX, const BoxShape& shape) {
  Box b{};
  b.center = {t.pos.x + (shape.x * static_cast<float>(facingX)), t.pos.y + shape.y};
  b.half = {shape.w * 0.5F, shape.h * 0.5F};
  return b;
}

void hurtboxes(World& w) {
  auto view = w.registry.view<Transform, Fighter, PlayerCombatData, HurtboxData>();
  for (auto entity : view) {
    const auto& t = view.get<Transform>(entity);
    const auto& f = view.get<Fighter>(entity);
    const auto& c = view.get<PlayerCombatData>(entity);
    auto& hurt = view.get<HurtboxData>(entity);

    hurt.box.center = {t.pos.x, t.pos.y + (f.hurtH * 0.5F)};
    hurt.box.half = {f.hurtW * 0.5F, f.hurtH * 0.5F};
    hurt.vulnerable = !c.invulnerable && c.state != CombatState::Knockdown &&
                      c.state != CombatState::KO;
  }
}

void hitboxes(World& w) {
  std::vector<EntityId> toDestroy;

  auto view = w.registry.view<HitboxData>();
  for (auto entity : view) {
    auto& hb = view.get<HitboxData>(entity);
    if (hb.projectile) {
      continue;
    }
    const auto* owner = w.registry.try_get<PlayerCombatData>(hb.owner);
    // A move that ended or was interrupted takes its hitbox with it.
    if (owner == nullptr || owner->moveSerial != hb.moveSerial) {
      toDestroy.push_back(entity);
      continue;
    }
    const auto& t = w.registry.get<Transform>(hb.owner);
    const auto& f = w.registry.get<Fighter>(hb.owner);
    hb.box = attackBox(t, f.facingX, hb.attack->box);
  }

  auto throws = w.registry.view<ThrowboxData>();
  for (auto entity : throws) {
    auto& tb = throws.get<ThrowboxData>(entity);
    const auto* owner = w.registry.try_get<PlayerCombatData>(tb.owner);
    if (owner == nullptr || owner->moveSerial != tb.moveSerial) {
      toDestroy.push_back(entity);
      continue;
    }
    const auto& t = w.registry.get<Transform>(tb.owner);
    const auto& f = w.registry.get<Fighter>(tb.owner);
    tb.box = attackBox(t, f.facingX, tb.attack->box);
  }

  for (auto e : toDestroy) {
    w.destroy(e);
  }
}

void projectiles(World& w, const CombatConfig& cfg) {
  std::vector<EntityId> toDestroy;

  auto view = w.registry.view<HitboxData>();
  for (auto entity : view) {
    auto& hb = view.get<HitboxData>(entity);
    if (!hb.projectile) {
      continue;
    }
    hb.box.center.x += hb.vx;
    if (hb.box.center.x + hb.box.half.x < 0.0F ||
        hb.box.center.x - hb.box.half.x > cfg.stage.width) {
      toDestroy.push_back(entity);
    }
  }

  for (auto e : toDestroy) {
    w.destroy(e);
  }
}

void pushBoxes(World& w, const CombatConfig& cfg) {
  const EntityId a = w.fighter(0);
  const EntityId b = w.fighter(1);
  if (!w.registry.valid(a) || !w.registry.valid(b)) {
    return;
  }
  auto& ta = w.registry.get<Transform>(a);
  auto& tb = w.registry.get<Transform>(b);

  const float push = cfg.stage.pushWidth;
  const float lo = push * 0.5F;
  const float hi = std::max(lo, cfg.stage.width - lo);

  const float dx = tb.pos.x - ta.pos.x;
  if (std::fabs(dx) < push) {
    // P1 yields left when the fighters stand on the same spot.
    const float dir = dx >= 0.0F ? 1.0F : -1.0F;
    const float overlap = push - std::fabs(dx);
    ta.pos.x -= dir * overlap * 0.5F;
    tb.pos.x += dir * overlap * 0.5F;
  }

  ta.pos.x = std::clamp(ta.pos.x, lo, hi);
  tb.pos.x = std::clamp(tb.pos.x, lo, hi);

  // Against a wall the free fighter gives way.
  const float gap = tb.pos.x - ta.pos.x;
  if (std::fabs(gap) < push) {
    const float dir = gap >= 0.0F ? 1.0F : -1.0F;
    if (ta.pos.x <= lo || ta.pos.x >= hi) {
      tb.pos.x = std::clamp(ta.pos.x + (dir * push), lo, hi);
    } else {
      ta.pos.x = std::clamp(tb.pos.x - (dir * push), lo, hi);
    }
  }
}

void retireBoxes(World& w) {
  std::vector<EntityId> toDestroy;

  auto view = w.registry.view<HitboxData>();
  for (auto entity : view) {
    auto& hb = view.get<HitboxData>(entity);
    if (--hb.framesLeft <= 0) {
      toDestroy.push_back(entity);
    }
  }
  auto throws = w.registry.view<ThrowboxData>();
  for (auto entity : throws) {
    auto& tb = throws.get<ThrowboxData>(entity);
    if (--tb.framesLeft <= 0) {
      toDestroy.push_back(entity);
    }
  }

  for (auto e : toDestroy) {
    w.destroy(e);
  }
}

}  // namespace Systems
