#pragma once

#include <string>

#include "core/Time.h"
#include "input/InputAggregator.h"
#include "input/MotionRecognizer.h"

struct CombatConfig {
  int version = 0;
  int frameRate = 60;

  struct Parry {
    bool enabled = true;
    bool redEnabled = true;
    int window = 7;
    int recovery = 12;
    int advantage = 15;
    int redWindow = 2;
    int redAdvantage = 30;
    float meterGain = 15.0F;
    int healthGain = 5;
  } parry;

  struct Stun {
    int hitstunBase = 12;
    float hitstunScaling = 1.2F;
    int blockstunBase = 8;
    float blockstunScaling = 1.0F;
    int knockdownFrames = 40;
  } stun;

  struct Scaling {
    bool enabled = true;
    int start = 3;
    float rate = 0.9F;
    float minimum = 0.1F;
  } scaling;

  struct Combo {
    int decayFrames = 180;
    int maxLength = 50;
  } combo;

  struct Block {
    float chipRatio = 0.1F;
    bool chipKo = true;
  } block;

  struct Hit {
    float counterMultiplier = 1.25F;
    int techWindow = 7;
  } hit;

  struct Meter {
    float max = 100.0F;
    float passiveGain = 0.1F;
  } meter;

  struct Input {
    SocdPolicy socd = SocdPolicy::Neutral;
    int negativeEdgeMs = 60;
    int qcfMs = 250;
    int qcbMs = 250;
    int dpMs = 220;
    int qcf2Ms = 400;
    int chargeFrames = 45;
    int chargeReleaseMs = 250;
  } input;

  struct Stage {
    float width = 1280.0F;
    float pushWidth = 70.0F;
    float startGap = 300.0F;
  } stage;

  std::string path;

  bool loadFromToml(const char* path);

  [[nodiscard]] int toFrames(int ms) const { return msToFrames(ms, frameRate); }
  [[nodiscard]] MotionWindows motionWindows() const;
};
