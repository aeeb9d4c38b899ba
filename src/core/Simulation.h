#pragma once

#include <array>
#include <cstdint>

#include "character/CharacterConfig.h"
#include "combat/CombatConfig.h"
#include "combat/CombatEngine.h"
#include "ecs/World.h"
#include "input/InputAggregator.h"
#include "input/MotionHistory.h"
#include "input/MotionRecognizer.h"

// One match: both input pipelines plus the combat engine, advanced one tick per step().
class Simulation {
 public:
  static constexpr int kPlayers = CombatEngine::kPlayers;
  using PlayerDevices = std::array<InputAggregator::Devices, kPlayers>;

  // Motions tried per tick, first match wins.
  static constexpr std::array<Motion, kMotionCount> kMotionPriority = {
      Motion::QCF2, Motion::QCF, Motion::QCB, Motion::DP, Motion::ChargeBF, Motion::ChargeDU};

  // The configs are borrowed and must outlive the simulation.
  Simulation(const CombatConfig& config, const CharacterConfig& p1, const CharacterConfig& p2);

  void step(const PlayerDevices& devices);
  // Convenience for scripted input: one device per player.
  void step(const std::array<DeviceState, kPlayers>& devices);

  // Delivers queued events to listeners.
  void drainEvents() { world_.events.update(); }
  void resetRound();

  void setSocdPolicy(SocdPolicy policy);

  [[nodiscard]] uint64_t tick() const { return tick_; }
  [[nodiscard]] const InputSnapshot& snapshot(int slot) const;
  [[nodiscard]] const MotionHistory& history(int slot) const;
  [[nodiscard]] const InputAggregator& aggregator(int slot) const;

  World& world() { return world_; }
  [[nodiscard]] const World& world() const { return world_; }
  CombatEngine& engine() { return engine_; }
  [[nodiscard]] const CombatEngine& engine() const { return engine_; }
  entt::dispatcher& events() { return world_.events; }
  [[nodiscard]] const CombatConfig& config() const { return cfg_; }

 private:
  void recognizeSpecials(int slot);

  const CombatConfig& cfg_;
  World world_;
  CombatEngine engine_;
  std::array<InputAggregator, kPlayers> aggregators_;
  std::array<MotionHistory, kPlayers> histories_;
  std::array<MotionRecognizer, kPlayers> recognizers_;
  std::array<InputSnapshot, kPlayers> snapshots_{};
  uint64_t tick_ = 0;
};
