#pragma once

#include <cstdint>
#include <string>

#include "combat/MoveData.h"
#include "ecs/Components.h"
#include "input/MotionRecognizer.h"

// Outbound notifications. Player ids are slots (0 = P1, 1 = P2).

enum class ParryType : std::uint8_t { Normal, Red };

enum class DamageType : std::uint8_t { Normal, Chip, Counter };

const char* parryTypeName(ParryType type);
const char* damageTypeName(DamageType type);

struct HitEvent {
  int attacker = 0;
  int defender = 0;
  int damage = 0;
  Vec2 position{};
  const AttackData* attack = nullptr;
};

struct BlockEvent {
  int defender = 0;
  int attacker = 0;
  int damage = 0;  // chip dealt
  Vec2 position{};
};

struct ParryEvent {
  int defender = 0;
  int attacker = 0;
  ParryType type = ParryType::Normal;
  Vec2 position{};
};

struct DamageEvent {
  int player = 0;
  int damage = 0;
  DamageType type = DamageType::Normal;
  int health = 0;  // after the damage
};

struct ComboEvent {
  int player = 0;
  int hits = 0;
  int damage = 0;
};

struct ComboEndEvent {
  int player = 0;
};

struct SpecialMoveEvent {
  int player = 0;
  std::string move;
  const MoveDef* data = nullptr;
};

struct KoEvent {
  int winner = 0;
  int loser = 0;
};

struct SpecialMoveInputEvent {
  int player = 0;
  std::string move;
  Motion pattern = Motion::QCF;
};

struct TechEvent {
  int defender = 0;
  int attacker = 0;
  Vec2 position{};
};

struct SuperFreezeEvent {
  int player = 0;
  int frames = 0;
};
