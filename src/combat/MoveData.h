#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "input/InputSnapshot.h"
#include "input/MotionRecognizer.h"

enum class GuardType : std::uint8_t { Mid, High, Low, Unblockable };

enum class MoveKind : std::uint8_t { Normal, Special, Super, Throw };

// Hitbox relative to the fighter's feet; x is mirrored by facing. w/h are full extents.
struct BoxShape {
  float x = 50.0F;
  float y = 100.0F;
  float w = 50.0F;
  float h = 20.0F;
};

// Immutable frame data of one attack.
struct AttackData {
  static constexpr int kDefaultMeterGain = 5;
  static constexpr float kDefaultProjectileSpeed = 6.0F;
  static constexpr int kDefaultProjectileLifetime = 90;

  int damage = 0;
  int startup = 0;
  int active = 0;
  int recovery = 0;
  int hitAdvantage = 0;
  int blockAdvantage = 0;
  int meterGain = kDefaultMeterGain;
  int meterCost = 0;
  int hitstun = 0;    // 0 = derive from config
  int blockstun = 0;  // 0 = derive from config
  GuardType guard = GuardType::Mid;
  bool knockdown = false;
  bool projectile = false;
  int invulnFrom = 0;  // 0 = none
  int invulnTo = 0;
  int superFreeze = 0;

  BoxShape box{};
  float projectileSpeed = kDefaultProjectileSpeed;  // px/frame
  int projectileLifetime = kDefaultProjectileLifetime;

  [[nodiscard]] int totalFrames() const { return startup + active + recovery; }
  [[nodiscard]] int firstActiveFrame() const { return startup + 1; }
  [[nodiscard]] int lastActiveFrame() const { return startup + active; }
  [[nodiscard]] bool hasInvuln() const { return invulnTo > 0 && invulnTo >= invulnFrom; }
};

struct MoveDef {
  std::string name;
  MoveKind kind = MoveKind::Normal;
  Motion motion = Motion::QCF;  // specials and supers only
  std::vector<Button> buttons;
  AttackData attack{};
};

const char* guardTypeName(GuardType guard);
bool parseGuardType(std::string_view s, GuardType& out);
const char* moveKindName(MoveKind kind);
