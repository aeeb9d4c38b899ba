#pragma once

#include <array>
#include <cstdint>
#include <string_view>

#include "character/CharacterConfig.h"
#include "combat/CombatComponents.h"
#include "combat/CombatConfig.h"
#include "combat/CombatEvents.h"
#include "input/InputSnapshot.h"

class World;

// Advances both fighters by exactly one frame per tick() and resolves every contact.
// Events are enqueued on World::events; the caller drains them after the tick.
class CombatEngine {
 public:
  static constexpr int kPlayers = 2;

  CombatEngine(World& world, const CombatConfig& config);

  // Creates both fighter entities. The character configs must outlive the match.
  void startMatch(const CharacterConfig& p1, const CharacterConfig& p2);
  void resetRound();
  void endMatch();

  void tick(const std::array<InputSnapshot, kPlayers>& input);

  // Consumer of recognized motion inputs; unknown moves are ignored.
  void onSpecialMoveInput(int slot, std::string_view moveName);
  [[nodiscard]] bool canPerformSpecialMove(int slot, const MoveDef& move) const;
  void executeSpecialMove(int slot, const MoveDef& move);

  // Applies damage through the single damage path. Returns the amount dealt.
  int dealDamage(int slot, int amount, DamageType type);

  [[nodiscard]] bool started() const { return started_; }
  [[nodiscard]] uint64_t frame() const { return frame_; }
  [[nodiscard]] bool roundOver() const;

  PlayerCombatData& combat(int slot);
  [[nodiscard]] const PlayerCombatData& combat(int slot) const;
  Fighter& fighter(int slot);
  [[nodiscard]] const Fighter& fighter(int slot) const;
  Transform& transform(int slot);
  [[nodiscard]] const Transform& transform(int slot) const;
  [[nodiscard]] const CharacterConfig& character(int slot) const;

 private:
  void enterState(int slot, CombatState state);
  void interrupt(int slot);
  void updateFacing();
  void handleInput(int slot, const InputSnapshot& in);
  void startMove(int slot, const MoveDef& move);
  void advanceMove(int slot);
  void spawnBox(int slot, const MoveDef& move);
  void tickCounters(int slot);
  void tickCombo(int slot);
  void tickMeter(int slot);
  void addMeter(int slot, float amount);

  void resolveContacts();
  void resolveThrows();
  void applyParry(int attacker, int defender, ParryType type, Vec2 pos);
  void applyBlock(int attacker, int defender, const AttackData& attack, Vec2 pos);
  void applyHit(int attacker, int defender, const AttackData& attack, Vec2 pos);
  [[nodiscard]] bool canBlock(const PlayerCombatData& defender, const AttackData& attack) const;

  World& world_;
  const CombatConfig& cfg_;
  std::array<const CharacterConfig*, kPlayers> chars_{};
  std::array<uint64_t, kPlayers> lastComboHitFrame_{};
  uint64_t frame_ = 0;
  bool started_ = false;
};
