#include "combat/MoveRegistry.h"

#include <algorithm>
#include <format>
#include <utility>

const char* guardTypeName(GuardType guard) {
  switch (guard) {
    case GuardType::Mid:
      return "mid";
    case GuardType::High:
      return "high";
    case GuardType::Low:
      return "low";
    case GuardType::Unblockable:
      return "unblockable";
  }
  return "mid";
}

bool parseGuardType(std::string_view s, GuardType& out) {
  if (s == "mid") {
    out = GuardType::Mid;
    return true;
  }
  if (s == "high") {
    out = GuardType::High;
    return true;
  }
  if (s == "low") {
    out = GuardType::Low;
    return true;
  }
  if (s == "unblockable") {
    out = GuardType::Unblockable;
    return true;
  }
  return false;
}

const char* moveKindName(MoveKind kind) {
  switch (kind) {
    case MoveKind::Normal:
      return "normal";
    case MoveKind::Special:
      return "special";
    case MoveKind::Super:
      return "super";
    case MoveKind::Throw:
      return "throw";
  }
  return "normal";
}

bool MoveRegistry::validate(const MoveDef& move, std::string& error) {
  const AttackData& a = move.attack;
  if (move.name.empty()) {
    error = "move has no name";
    return false;
  }
  auto negative = [&](std::string_view field, int v) {
    if (v < 0) {
      error = std::format("move '{}': {} must not be negative (got {})", move.name, field, v);
      return true;
    }
    return false;
  };
  if (negative("damage", a.damage) || negative("startup", a.startup) ||
      negative("active", a.active) || negative("recovery", a.recovery) ||
      negative("meter_gain", a.meterGain) || negative("meter_cost", a.meterCost) ||
      negative("hitstun", a.hitstun) || negative("blockstun", a.blockstun) ||
      negative("super_freeze", a.superFreeze) || negative("invulnerable", a.invulnFrom) ||
      negative("invulnerable", a.invulnTo)) {
    return false;
  }
  if (a.active == 0) {
    error = std::format("move '{}': active must be at least 1 frame", move.name);
    return false;
  }
  if (a.box.w <= 0.0F || a.box.h <= 0.0F) {
    error = std::format("move '{}': hitbox w/h must be positive", move.name);
    return false;
  }
  if (a.projectile && (a.projectileLifetime <= 0)) {
    error = std::format("move '{}': projectile lifetime must be positive", move.name);
    return false;
  }
  if ((move.kind == MoveKind::Special || move.kind == MoveKind::Super) && move.buttons.empty()) {
    error = std::format("move '{}': special moves need at least one button", move.name);
    return false;
  }
  if (move.kind == MoveKind::Normal && move.buttons.size() != 1) {
    error = std::format("move '{}': normals bind exactly one button", move.name);
    return false;
  }
  return true;
}

bool MoveRegistry::add(MoveDef move, std::string& error) {
  if (!validate(move, error)) {
    return false;
  }
  if (moves_.contains(move.name)) {
    error = std::format("move '{}' is defined twice", move.name);
    return false;
  }

  const std::string name = move.name;
  const MoveKind kind = move.kind;
  const int cost = move.attack.meterCost;
  const Button first = move.buttons.empty() ? Button::LP : move.buttons.front();
  moves_.emplace(name, std::move(move));

  switch (kind) {
    case MoveKind::Normal:
      normals_[static_cast<std::size_t>(first)] = name;
      break;
    case MoveKind::Throw:
      throw_ = name;
      break;
    case MoveKind::Special:
    case MoveKind::Super: {
      auto pos = std::ranges::find_if(specials_, [&](const std::string& other) {
        const int otherCost = moves_.at(other).attack.meterCost;
        return cost > otherCost || (cost == otherCost && name < other);
      });
      specials_.insert(pos, name);
      break;
    }
  }
  return true;
}

bool MoveRegistry::remove(std::string_view name) {
  auto it = moves_.find(std::string(name));
  if (it == moves_.end()) {
    return false;
  }
  for (auto& n : normals_) {
    if (n == name)
      n.clear();
  }
  if (throw_ == name)
    throw_.clear();
  std::erase(specials_, it->first);
  moves_.erase(it);
  return true;
}

void MoveRegistry::clear() {
  moves_.clear();
  for (auto& n : normals_) {
    n.clear();
  }
  throw_.clear();
  specials_.clear();
}

const MoveDef* MoveRegistry::find(std::string_view name) const {
  auto it = moves_.find(std::string(name));
  return it != moves_.end() ? &it->second : nullptr;
}

const MoveDef* MoveRegistry::findNormal(Button b) const {
  const std::string& name = normals_[static_cast<std::size_t>(b)];
  return name.empty() ? nullptr : find(name);
}

const MoveDef* MoveRegistry::findThrow() const {
  return throw_.empty() ? nullptr : find(throw_);
}

const MoveDef* MoveRegistry::findSpecial(Motion motion, Button b) const {
  for (const std::string& name : specials_) {
    const MoveDef& m = moves_.at(name);
    if (m.motion == motion && std::ranges::find(m.buttons, b) != m.buttons.end()) {
      return &m;
    }
  }
  return nullptr;
}

bool MoveRegistry::hasSpecial(Motion motion, ButtonClass cls) const {
  return std::ranges::any_of(specials_, [&](const std::string& name) {
    const MoveDef& m = moves_.at(name);
    return m.motion == motion && std::ranges::any_of(m.buttons, [cls](Button b) {
             return buttonClass(b) == cls;
           });
  });
}
