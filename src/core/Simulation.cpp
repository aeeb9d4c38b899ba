#include "core/Simulation.h"

#include <cstddef>

#include "combat/CombatEvents.h"

Simulation::Simulation(const CombatConfig& config,
                       const CharacterConfig& p1,
                       const CharacterConfig& p2)
    : cfg_(config), engine_(world_, config) {
  const MotionWindows windows = cfg_.motionWindows();
  for (std::size_t i = 0; i < kPlayers; ++i) {
    aggregators_[i].setSocdPolicy(cfg_.input.socd);
    recognizers_[i].setWindows(windows);
    histories_[i].setRetentionFrames(recognizers_[i].retentionFrames());
  }
  engine_.startMatch(p1, p2);
}

void Simulation::setSocdPolicy(SocdPolicy policy) {
  for (auto& agg : aggregators_) {
    agg.setSocdPolicy(policy);
  }
}

void Simulation::resetRound() {
  for (std::size_t i = 0; i < kPlayers; ++i) {
    aggregators_[i].reset();
    histories_[i].clear();
    recognizers_[i].reset();
    snapshots_[i] = InputSnapshot{};
  }
  engine_.resetRound();
}

void Simulation::step(const std::array<DeviceState, kPlayers>& devices) {
  PlayerDevices all{};
  for (std::size_t i = 0; i < kPlayers; ++i) {
    all[i][static_cast<std::size_t>(Device::Keyboard)] = devices[i];
  }
  step(all);
}

void Simulation::step(const PlayerDevices& devices) {
  ++tick_;
  for (std::size_t i = 0; i < kPlayers; ++i) {
    snapshots_[i] = aggregators_[i].update(devices[i], tick_);
    histories_[i].push(tick_, snapshots_[i]);
  }
  for (int slot = 0; slot < kPlayers; ++slot) {
    recognizeSpecials(slot);
  }
  engine_.tick(snapshots_);
}

void Simulation::recognizeSpecials(int slot) {
  const auto i = static_cast<std::size_t>(slot);
  const MoveRegistry& moves = engine_.character(slot).moves;
  const int facing = engine_.fighter(slot).facingX;

  for (Motion motion : kMotionPriority) {
    for (ButtonClass cls : {ButtonClass::Punch, ButtonClass::Kick}) {
      if (!moves.hasSpecial(motion, cls)) {
        continue;
      }
      MotionMatch match{};
      if (!recognizers_[i].find(histories_[i], motion, cls, tick_, facing, match)) {
        continue;
      }
      // A button with no move for this motion leaves the input for weaker motions.
      const MoveDef* move = moves.findSpecial(motion, match.button);
      if (move == nullptr) {
        continue;
      }
      recognizers_[i].consume(tick_);
      world_.events.enqueue(SpecialMoveInputEvent{slot, move->name, motion});
      engine_.onSpecialMoveInput(slot, move->name);
      return;
    }
  }
}

const InputSnapshot& Simulation::snapshot(int slot) const {
  return snapshots_[static_cast<std::size_t>(slot)];
}

const MotionHistory& Simulation::history(int slot) const {
  return histories_[static_cast<std::size_t>(slot)];
}

const InputAggregator& Simulation::aggregator(int slot) const {
  return aggregators_[static_cast<std::size_t>(slot)];
}
