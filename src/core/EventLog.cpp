#include "core/EventLog.h"

#include <algorithm>
#include <cstdio>
#include <format>
#include <utility>

#include "combat/CombatEngine.h"

EventLog::EventLog(entt::dispatcher& events, const CombatEngine& engine)
    : events_(events), engine_(engine) {
  events_.sink<HitEvent>().connect<&EventLog::onHit>(*this);
  events_.sink<BlockEvent>().connect<&EventLog::onBlock>(*this);
  events_.sink<ParryEvent>().connect<&EventLog::onParry>(*this);
  events_.sink<DamageEvent>().connect<&EventLog::onDamage>(*this);
  events_.sink<ComboEvent>().connect<&EventLog::onCombo>(*this);
  events_.sink<ComboEndEvent>().connect<&EventLog::onComboEnd>(*this);
  events_.sink<SpecialMoveEvent>().connect<&EventLog::onSpecial>(*this);
  events_.sink<SpecialMoveInputEvent>().connect<&EventLog::onSpecialInput>(*this);
  events_.sink<KoEvent>().connect<&EventLog::onKo>(*this);
  events_.sink<TechEvent>().connect<&EventLog::onTech>(*this);
  events_.sink<SuperFreezeEvent>().connect<&EventLog::onSuperFreeze>(*this);
}

EventLog::~EventLog() {
  events_.disconnect(*this);
}

void EventLog::clear() {
  lines_.clear();
  specials_ = 0;
  techs_ = 0;
  combosEnded_ = 0;
  longestCombo_ = 0;
}

std::vector<std::string> EventLog::snapshot() const {
  return {lines_.begin(), lines_.end()};
}

void EventLog::append(const std::string& text) {
  std::string line = std::format("[{:06}] {}", engine_.frame(), text);
  if (echo_) {
    std::printf("%s\n", line.c_str());
  }
  lines_.push_back(std::move(line));
  while (lines_.size() > kMaxLines) {
    lines_.pop_front();
  }
}

void EventLog::onHit(const HitEvent& e) {
  append(std::format("P{} hits P{} for {} at ({:.0f}, {:.0f})", e.attacker + 1, e.defender + 1,
                     e.damage, e.position.x, e.position.y));
}

void EventLog::onBlock(const BlockEvent& e) {
  if (e.damage > 0)
    append(std::format("P{} blocks P{} (chip {})", e.defender + 1, e.attacker + 1, e.damage));
  else
    append(std::format("P{} blocks P{}", e.defender + 1, e.attacker + 1));
}

void EventLog::onParry(const ParryEvent& e) {
  append(std::format("P{} {} parries P{}", e.defender + 1, parryTypeName(e.type),
                     e.attacker + 1));
}

void EventLog::onDamage(const DamageEvent& e) {
  append(std::format("P{} takes {} {} damage, health {}", e.player + 1, e.damage,
                     damageTypeName(e.type), e.health));
}

void EventLog::onCombo(const ComboEvent& e) {
  longestCombo_ = std::max(longestCombo_, e.hits);
  if (e.hits > 1) {
    append(std::format("P{} combo {} hits, {} damage", e.player + 1, e.hits, e.damage));
  }
}

void EventLog::onComboEnd(const ComboEndEvent& e) {
  ++combosEnded_;
  append(std::format("P{} combo ended", e.player + 1));
}

void EventLog::onSpecial(const SpecialMoveEvent& e) {
  ++specials_;
  append(std::format("P{} performs {}", e.player + 1, e.move));
}

void EventLog::onSpecialInput(const SpecialMoveInputEvent& e) {
  append(std::format("P{} input {} ({})", e.player + 1, e.move, motionName(e.pattern)));
}

void EventLog::onKo(const KoEvent& e) {
  append(std::format("KO! P{} defeats P{}", e.winner + 1, e.loser + 1));
}

void EventLog::onTech(const TechEvent& e) {
  ++techs_;
  append(std::format("P{} techs P{}'s throw", e.defender + 1, e.attacker + 1));
}

void EventLog::onSuperFreeze(const SuperFreezeEvent& e) {
  append(std::format("P{} super freeze {}f", e.player + 1, e.frames));
}
