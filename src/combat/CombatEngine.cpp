#include "combat/CombatEngine.h"

#include <algorithm>
#include <cstdio>
#include <string>
#include <utility>

#include "combat/Parry.h"
#include "ecs/Systems.h"
#include "ecs/World.h"
#include "input/MotionRecognizer.h"

namespace {

void countDown(int& v) {
  if (v > 0) {
    --v;
  }
}

bool canAct(CombatState s) {
  return s == CombatState::Neutral || s == CombatState::Blocking;
}

bool canGuard(CombatState s) {
  return s == CombatState::Neutral || s == CombatState::Blocking || s == CombatState::Blockstun;
}

// Strongest newly pressed button: heavy before medium before light, punches first.
bool pickNormalButton(const InputSnapshot& in, Button& out) {
  constexpr std::array<Button, kButtonCount> kOrder = {Button::HP, Button::HK, Button::MP,
                                                       Button::MK, Button::LP, Button::LK};
  for (Button b : kOrder) {
    if (in.isPressed(b)) {
      out = b;
      return true;
    }
  }
  return false;
}

}  // namespace

CombatEngine::CombatEngine(World& world, const CombatConfig& config)
    : world_(world), cfg_(config) {}

void CombatEngine::startMatch(const CharacterConfig& p1, const CharacterConfig& p2) {
  if (started_) {
    endMatch();
  }
  chars_ = {&p1, &p2};

  for (int slot = 0; slot < kPlayers; ++slot) {
    const EntityId e = world_.create();
    world_.registry.emplace<FighterTag>(e);
    world_.registry.emplace<Transform>(e);
    world_.registry.emplace<Fighter>(e);
    world_.registry.emplace<PlayerCombatData>(e);
    world_.registry.emplace<HurtboxData>(e, HurtboxData{e, true, Box{}});
    world_.fighters[static_cast<std::size_t>(slot)] = e;
  }
  started_ = true;
  resetRound();

  std::printf("Match: %s vs %s\n", p1.displayName.c_str(), p2.displayName.c_str());
}

void CombatEngine::resetRound() {
  if (!started_) {
    return;
  }
  world_.clearBoxes();
  world_.roundOver = false;
  world_.winner = -1;
  world_.freezeFrames = 0;
  lastComboHitFrame_.fill(0);

  const float mid = cfg_.stage.width * 0.5F;
  for (int slot = 0; slot < kPlayers; ++slot) {
    const CharacterConfig& ch = *chars_[static_cast<std::size_t>(slot)];
    const EntityId e = world_.fighter(slot);

    Fighter f{};
    f.slot = slot;
    f.health = ch.stats.health;
    f.maxHealth = ch.stats.health;
    f.facingX = slot == 0 ? 1 : -1;
    f.walkSpeed = ch.stats.walkSpeed;
    f.hurtW = ch.hurtbox.w;
    f.hurtH = ch.hurtbox.h;
    world_.registry.replace<Fighter>(e, f);

    const float side = slot == 0 ? -1.0F : 1.0F;
    const float x = mid + (side * cfg_.stage.startGap * 0.5F);
    world_.registry.replace<Transform>(e, Transform{Vec2{x, 0.0F}});

    PlayerCombatData c{};
    c.maxMeter = cfg_.meter.max;
    world_.registry.replace<PlayerCombatData>(e, c);
  }
  Systems::hurtboxes(world_);
}

void CombatEngine::endMatch() {
  if (!started_) {
    return;
  }
  world_.clearBoxes();
  for (EntityId& e : world_.fighters) {
    if (world_.registry.valid(e)) {
      world_.destroy(e);
    }
    e = kInvalidEntity;
  }
  chars_ = {};
  started_ = false;
}

bool CombatEngine::roundOver() const {
  return world_.roundOver;
}

PlayerCombatData& CombatEngine::combat(int slot) {
  return world_.registry.get<PlayerCombatData>(world_.fighter(slot));
}

const PlayerCombatData& CombatEngine::combat(int slot) const {
  return world_.registry.get<PlayerCombatData>(world_.fighter(slot));
}

Fighter& CombatEngine::fighter(int slot) {
  return world_.registry.get<Fighter>(world_.fighter(slot));
}

const Fighter& CombatEngine::fighter(int slot) const {
  return world_.registry.get<Fighter>(world_.fighter(slot));
}

Transform& CombatEngine::transform(int slot) {
  return world_.registry.get<Transform>(world_.fighter(slot));
}

const Transform& CombatEngine::transform(int slot) const {
  return world_.registry.get<Transform>(world_.fighter(slot));
}

const CharacterConfig& CombatEngine::character(int slot) const {
  return *chars_[static_cast<std::size_t>(slot)];
}

void CombatEngine::enterState(int slot, CombatState state) {
  PlayerCombatData& c = combat(slot);
  if (c.state != state) {
    c.state = state;
    c.stateTimer = 0;
  }
}

// Drops whatever move was running; its hitbox retires on the next box pass.
void CombatEngine::interrupt(int slot) {
  PlayerCombatData& c = combat(slot);
  c.activeMove = nullptr;
  c.moveFrame = 0;
  ++c.moveSerial;
  c.parryWindow = 0;
  c.blocking = false;
  c.invulnerable = false;
}

void CombatEngine::tick(const std::array<InputSnapshot, kPlayers>& input) {
  if (!started_) {
    return;
  }
  ++frame_;

  updateFacing();
  for (int slot = 0; slot < kPlayers; ++slot) {
    handleInput(slot, input[static_cast<std::size_t>(slot)]);
  }
  Systems::pushBoxes(world_, cfg_);

  for (int slot = 0; slot < kPlayers; ++slot) {
    advanceMove(slot);
  }
  Systems::hurtboxes(world_);
  Systems::hitboxes(world_);
  Systems::projectiles(world_, cfg_);

  if (!world_.roundOver) {
    resolveThrows();
    resolveContacts();
  }
  Systems::retireBoxes(world_);

  for (int slot = 0; slot < kPlayers; ++slot) {
    tickCounters(slot);
    tickCombo(slot);
    tickMeter(slot);
  }
  if (world_.freezeFrames > 0) {
    --world_.freezeFrames;
  }
}

void CombatEngine::updateFacing() {
  const float x0 = transform(0).pos.x;
  const float x1 = transform(1).pos.x;
  if (x0 == x1) {
    return;
  }
  for (int slot = 0; slot < kPlayers; ++slot) {
    const CombatState s = combat(slot).state;
    if (!canAct(s) && s != CombatState::Parrying) {
      continue;
    }
    const float self = slot == 0 ? x0 : x1;
    const float other = slot == 0 ? x1 : x0;
    fighter(slot).facingX = other > self ? 1 : -1;
  }
}

void CombatEngine::handleInput(int slot, const InputSnapshot& in) {
  PlayerCombatData& c = combat(slot);
  Fighter& f = fighter(slot);
  if (world_.roundOver || c.state == CombatState::KO) {
    c.blocking = false;
    return;
  }

  if (in.techPressed) {
    c.techWindow = cfg_.hit.techWindow;
  }

  const std::uint8_t forwardBit = f.facingX > 0 ? kDirRight : kDirLeft;
  if (cfg_.parry.enabled && (in.dirPressed & forwardBit) != 0 && canAttemptParry(c)) {
    c.parryWindow = cfg_.parry.window;
    if (c.state != CombatState::Blockstun) {
      enterState(slot, CombatState::Parrying);
    }
  }

  const Dir d = dominantDirection(in, f.facingX);
  const bool back = d == Dir::Back || d == Dir::DownBack || d == Dir::UpBack;
  c.crouching = in.down;
  c.blocking = back && canGuard(c.state);

  // An armed parry can still be cancelled into an attack.
  const bool parrying = c.state == CombatState::Parrying;
  if (!canAct(c.state) && !parrying) {
    return;
  }

  const MoveRegistry& moves = character(slot).moves;
  if (in.throwPressed) {
    if (const MoveDef* t = moves.findThrow()) {
      startMove(slot, *t);
      return;
    }
  }
  Button b{};
  if (pickNormalButton(in, b)) {
    if (const MoveDef* n = moves.findNormal(b)) {
      startMove(slot, *n);
      return;
    }
  }

  if (parrying) {
    return;
  }
  enterState(slot, back ? CombatState::Blocking : CombatState::Neutral);
  if (!in.down && in.left != in.right) {
    transform(slot).pos.x += (in.right ? 1.0F : -1.0F) * f.walkSpeed;
  }
}

void CombatEngine::startMove(int slot, const MoveDef& move) {
  PlayerCombatData& c = combat(slot);
  c.activeMove = &move;
  c.moveFrame = 0;
  ++c.moveSerial;
  c.blocking = false;
  c.parryWindow = 0;
  const bool special = move.kind == MoveKind::Special || move.kind == MoveKind::Super;
  enterState(slot, special ? CombatState::SpecialMove : CombatState::Attacking);
}

void CombatEngine::advanceMove(int slot) {
  PlayerCombatData& c = combat(slot);
  if (c.activeMove == nullptr ||
      (c.state != CombatState::Attacking && c.state != CombatState::SpecialMove)) {
    return;
  }

  ++c.moveFrame;
  const AttackData& a = c.activeMove->attack;
  c.invulnerable = a.hasInvuln() && c.moveFrame >= a.invulnFrom && c.moveFrame <= a.invulnTo;

  if (c.moveFrame == a.firstActiveFrame()) {
    spawnBox(slot, *c.activeMove);
  }

  if (c.moveFrame >= a.totalFrames()) {
    c.activeMove = nullptr;
    c.moveFrame = 0;
    c.invulnerable = false;
    ++c.moveSerial;
    enterState(slot, CombatState::Neutral);
  }
}

void CombatEngine::spawnBox(int slot, const MoveDef& move) {
  const EntityId owner = world_.fighter(slot);
  const PlayerCombatData& c = combat(slot);
  const Fighter& f = fighter(slot);
  const Transform& t = transform(slot);
  const AttackData& a = move.attack;

  Box box{};
  box.center = {t.pos.x + (a.box.x * static_cast<float>(f.facingX)), t.pos.y + a.box.y};
  box.half = {a.box.w * 0.5F, a.box.h * 0.5F};

  const EntityId e = world_.create();
  if (move.kind == MoveKind::Throw) {
    ThrowboxData tb{};
    tb.owner = owner;
    tb.attack = &a;
    tb.move = &move;
    tb.moveSerial = c.moveSerial;
    tb.framesLeft = a.active;
    tb.box = box;
    world_.registry.emplace<ThrowboxTag>(e);
    world_.registry.emplace<ThrowboxData>(e, std::move(tb));
    return;
  }

  HitboxData hb{};
  hb.owner = owner;
  hb.attack = &a;
  hb.move = &move;
  hb.moveSerial = c.moveSerial;
  hb.activeFromFrame = a.firstActiveFrame();
  hb.activeToFrame = a.lastActiveFrame();
  hb.box = box;
  if (a.projectile) {
    hb.projectile = true;
    hb.vx = a.projectileSpeed * static_cast<float>(f.facingX);
    hb.framesLeft = a.projectileLifetime;
  } else {
    hb.framesLeft = a.active;
  }
  world_.registry.emplace<HitboxTag>(e);
  world_.registry.emplace<HitboxData>(e, std::move(hb));
}

void CombatEngine::tickCounters(int slot) {
  PlayerCombatData& c = combat(slot);
  countDown(c.hitstun);
  countDown(c.blockstun);
  countDown(c.knockdown);
  countDown(c.parryWindow);
  countDown(c.parryRecovery);
  countDown(c.techWindow);

  switch (c.state) {
    case CombatState::Hitstun:
      if (c.hitstun == 0)
        enterState(slot, CombatState::Neutral);
      break;
    case CombatState::Blockstun:
      if (c.blockstun == 0)
        enterState(slot, CombatState::Neutral);
      break;
    case CombatState::Knockdown:
      if (c.knockdown == 0)
        enterState(slot, CombatState::Neutral);
      break;
    case CombatState::Parrying:
      if (c.parryWindow == 0)
        enterState(slot, CombatState::Neutral);
      break;
    case CombatState::Neutral:
    case CombatState::Attacking:
    case CombatState::Blocking:
    case CombatState::SpecialMove:
    case CombatState::KO:
      break;
  }
  ++c.stateTimer;
}

void CombatEngine::tickCombo(int slot) {
  PlayerCombatData& c = combat(slot);
  if (c.comboCount <= 0 || lastComboHitFrame_[static_cast<std::size_t>(slot)] == frame_) {
    return;
  }
  countDown(c.comboDecayTimer);
  if (c.comboDecayTimer == 0) {
    c.comboCount = 0;
    c.comboDamage = 0;
    world_.events.enqueue(ComboEndEvent{slot});
  }
}

void CombatEngine::addMeter(int slot, float amount) {
  PlayerCombatData& c = combat(slot);
  c.meter = std::clamp(c.meter + amount, 0.0F, c.maxMeter);
}

void CombatEngine::tickMeter(int slot) {
  const bool ko = combat(slot).state == CombatState::KO;
  addMeter(slot, ko ? 0.0F : cfg_.meter.passiveGain);
}

void CombatEngine::onSpecialMoveInput(int slot, std::string_view moveName) {
  if (!started_ || slot < 0 || slot >= kPlayers) {
    return;
  }
  const MoveDef* move = character(slot).moves.find(moveName);
  if (move == nullptr || (move->kind != MoveKind::Special && move->kind != MoveKind::Super)) {
    return;
  }
  if (canPerformSpecialMove(slot, *move)) {
    executeSpecialMove(slot, *move);
  }
}

bool CombatEngine::canPerformSpecialMove(int slot, const MoveDef& move) const {
  if (world_.roundOver) {
    return false;
  }
  const PlayerCombatData& c = combat(slot);
  if (c.hitstun > 0 || c.blockstun > 0) {
    return false;
  }
  switch (c.state) {
    case CombatState::Neutral:
    case CombatState::Blocking:
    case CombatState::Attacking:
    case CombatState::Parrying:
      break;
    case CombatState::Hitstun:
    case CombatState::Blockstun:
    case CombatState::SpecialMove:
    case CombatState::Knockdown:
    case CombatState::KO:
      return false;
  }
  return c.meter >= static_cast<float>(move.attack.meterCost);
}

void CombatEngine::executeSpecialMove(int slot, const MoveDef& move) {
  PlayerCombatData& c = combat(slot);
  c.meter = std::max(0.0F, c.meter - static_cast<float>(move.attack.meterCost));
  startMove(slot, move);

  world_.events.enqueue(SpecialMoveEvent{slot, move.name, &move});
  if (move.attack.superFreeze > 0) {
    world_.freezeFrames = move.attack.superFreeze;
    world_.events.enqueue(SuperFreezeEvent{slot, move.attack.superFreeze});
  }
}

int CombatEngine::dealDamage(int slot, int amount, DamageType type) {
  Fighter& f = fighter(slot);
  const int dealt = std::min(std::max(0, amount), f.health);
  f.health -= dealt;
  world_.events.enqueue(DamageEvent{slot, dealt, type, f.health});

  if (f.health == 0 && !world_.roundOver) {
    world_.roundOver = true;
    world_.winner = 1 - slot;
    interrupt(slot);
    PlayerCombatData& c = combat(slot);
    c.hitstun = 0;
    c.blockstun = 0;
    c.knockdown = 0;
    enterState(slot, CombatState::KO);
    world_.events.enqueue(KoEvent{1 - slot, slot});
    std::printf("KO: P%d wins\n", 2 - slot);
  }
  return dealt;
}
