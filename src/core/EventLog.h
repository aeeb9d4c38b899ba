#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <vector>

#include <entt/entt.hpp>

#include "combat/CombatEvents.h"

class CombatEngine;

// Formats drained combat events into frame-stamped lines. Listens on the dispatcher for as
// long as it lives.
class EventLog {
 public:
  static constexpr std::size_t kMaxLines = 64;

  EventLog(entt::dispatcher& events, const CombatEngine& engine);
  ~EventLog();

  EventLog(const EventLog&) = delete;
  EventLog& operator=(const EventLog&) = delete;

  void setEcho(bool echo) { echo_ = echo; }
  void clear();

  [[nodiscard]] const std::deque<std::string>& lines() const { return lines_; }
  [[nodiscard]] std::vector<std::string> snapshot() const;

  [[nodiscard]] int specials() const { return specials_; }
  [[nodiscard]] int techs() const { return techs_; }
  [[nodiscard]] int combosEnded() const { return combosEnded_; }
  [[nodiscard]] int longestCombo() const { return longestCombo_; }

 private:
  void onHit(const HitEvent& e);
  void onBlock(const BlockEvent& e);
  void onParry(const ParryEvent& e);
  void onDamage(const DamageEvent& e);
  void onCombo(const ComboEvent& e);
  void onComboEnd(const ComboEndEvent& e);
  void onSpecial(const SpecialMoveEvent& e);
  void onSpecialInput(const SpecialMoveInputEvent& e);
  void onKo(const KoEvent& e);
  void onTech(const TechEvent& e);
  void onSuperFreeze(const SuperFreezeEvent& e);

  void append(const std::string& text);

  entt::dispatcher& events_;
  const CombatEngine& engine_;
  std::deque<std::string> lines_;
  bool echo_ = false;
  int specials_ = 0;
  int techs_ = 0;
  int combosEnded_ = 0;
  int longestCombo_ = 0;
};
