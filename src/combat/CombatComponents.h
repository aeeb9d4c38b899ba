#pragma once

#include <cstdint>
#include <vector>

#include "combat/MoveData.h"
#include "ecs/Components.h"
#include "ecs/Entity.h"

enum class CombatState : std::uint8_t {
  Neutral,
  Attacking,
  Blocking,
  Hitstun,
  Blockstun,
  SpecialMove,
  Parrying,
  Knockdown,
  KO,
};

const char* combatStateName(CombatState state);

struct PlayerCombatData {
  CombatState state = CombatState::Neutral;
  int stateTimer = 0;  // frames spent in `state`

  const MoveDef* activeMove = nullptr;  // owned by the character's MoveRegistry
  int moveFrame = 0;                    // 1-based while a move runs
  std::uint32_t moveSerial = 0;         // bumps whenever a move starts or is interrupted

  int hitstun = 0;
  int blockstun = 0;
  int knockdown = 0;
  int parryWindow = 0;
  int parryRecovery = 0;
  int techWindow = 0;

  int comboCount = 0;
  int comboDamage = 0;
  int comboDecayTimer = 0;

  float meter = 0.0F;
  float maxMeter = 100.0F;

  bool blocking = false;
  bool crouching = false;
  bool invulnerable = false;
  int advantage = 0;  // recorded only
};

struct HitboxData {
  EntityId owner = kInvalidEntity;
  const AttackData* attack = nullptr;
  const MoveDef* move = nullptr;
  std::uint32_t moveSerial = 0;
  int activeFromFrame = 0;  // owner move frames
  int activeToFrame = 0;
  int framesLeft = 0;
  std::vector<EntityId> hitTargets;
  Box box{};
  float vx = 0.0F;  // projectiles only
  bool projectile = false;

  [[nodiscard]] bool alreadyHit(EntityId e) const;
};

struct HurtboxData {
  EntityId owner = kInvalidEntity;
  bool vulnerable = true;
  Box box{};
};

struct ThrowboxData {
  EntityId owner = kInvalidEntity;
  const AttackData* attack = nullptr;
  const MoveDef* move = nullptr;
  std::uint32_t moveSerial = 0;
  int framesLeft = 0;
  Box box{};
};
