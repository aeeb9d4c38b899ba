#pragma once

#include <gtest/gtest.h>

#include <memory>
#include <vector>

#include "character/CharacterConfig.h"
#include "combat/CombatConfig.h"
#include "combat/CombatEngine.h"
#include "combat/CombatEvents.h"
#include "ecs/World.h"
#include "support/TestData.h"

struct EventRecorder {
  std::vector<HitEvent> hits;
  std::vector<BlockEvent> blocks;
  std::vector<ParryEvent> parries;
  std::vector<DamageEvent> damage;
  std::vector<ComboEvent> combos;
  std::vector<ComboEndEvent> comboEnds;
  std::vector<SpecialMoveEvent> specials;
  std::vector<KoEvent> kos;
  std::vector<TechEvent> techs;
  std::vector<SuperFreezeEvent> freezes;

  void onHit(const HitEvent& e) { hits.push_back(e); }
  void onBlock(const BlockEvent& e) { blocks.push_back(e); }
  void onParry(const ParryEvent& e) { parries.push_back(e); }
  void onDamage(const DamageEvent& e) { damage.push_back(e); }
  void onCombo(const ComboEvent& e) { combos.push_back(e); }
  void onComboEnd(const ComboEndEvent& e) { comboEnds.push_back(e); }
  void onSpecial(const SpecialMoveEvent& e) { specials.push_back(e); }
  void onKo(const KoEvent& e) { kos.push_back(e); }
  void onTech(const TechEvent& e) { techs.push_back(e); }
  void onFreeze(const SuperFreezeEvent& e) { freezes.push_back(e); }

  void connect(entt::dispatcher& d) {
    d.sink<HitEvent>().connect<&EventRecorder::onHit>(*this);
    d.sink<BlockEvent>().connect<&EventRecorder::onBlock>(*this);
    d.sink<ParryEvent>().connect<&EventRecorder::onParry>(*this);
    d.sink<DamageEvent>().connect<&EventRecorder::onDamage>(*this);
    d.sink<ComboEvent>().connect<&EventRecorder::onCombo>(*this);
    d.sink<ComboEndEvent>().connect<&EventRecorder::onComboEnd>(*this);
    d.sink<SpecialMoveEvent>().connect<&EventRecorder::onSpecial>(*this);
    d.sink<KoEvent>().connect<&EventRecorder::onKo>(*this);
    d.sink<TechEvent>().connect<&EventRecorder::onTech>(*this);
    d.sink<SuperFreezeEvent>().connect<&EventRecorder::onFreeze>(*this);
  }
};

// Two test fighters at close range, driven snapshot by snapshot.
class MatchTest : public ::testing::Test {
 protected:
  static constexpr float kP1X = 600.0F;
  static constexpr float kP2X = 680.0F;

  void SetUp() override {
    p1 = TestData::character();
    p2 = TestData::character();
    ASSERT_TRUE(p1.errors.empty());
    engine = std::make_unique<CombatEngine>(world, config);
    engine->startMatch(p1, p2);
    place(kP1X, kP2X);
    events.connect(world.events);
  }

  void TearDown() override {
    world.events.disconnect(events);
    engine.reset();
  }

  void place(float x0, float x1) {
    engine->transform(0).pos.x = x0;
    engine->transform(1).pos.x = x1;
  }

  void step(const InputSnapshot& a = {}, const InputSnapshot& b = {}) {
    engine->tick({a, b});
    world.events.update();
  }

  void idle(int ticks) {
    for (int i = 0; i < ticks; ++i) {
      step();
    }
  }

  PlayerCombatData& combat(int slot) { return engine->combat(slot); }
  Fighter& fighter(int slot) { return engine->fighter(slot); }

  World world;
  CombatConfig config;
  CharacterConfig p1;
  CharacterConfig p2;
  std::unique_ptr<CombatEngine> engine;
  EventRecorder events;
};
