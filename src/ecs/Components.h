#pragma once

#include <cmath>

#include "ecs/Entity.h"

struct Vec2 {
  float x = 0.0F;
  float y = 0.0F;
  Vec2 operator+(const Vec2& o) const { return {x + o.x, y + o.y}; }
  Vec2 operator-(const Vec2& o) const { return {x - o.x, y - o.y}; }
  Vec2 operator*(float s) const { return {x * s, y * s}; }
};

// Fighter feet position. +y is up, ground is y = 0.
struct Transform {
  Vec2 pos{};
};

// Center + half extents.
struct Box {
  Vec2 center{};
  Vec2 half{};
};

inline bool boxesOverlap(const Box& a, const Box& b) {
  // Touching edges count as contact.
  return std::fabs(a.center.x - b.center.x) <= a.half.x + b.half.x &&
         std::fabs(a.center.y - b.center.y) <= a.half.y + b.half.y;
}

struct FighterTag {};

struct HitboxTag {};

struct ThrowboxTag {};

struct Fighter {
  int slot = 0;
  int health = 1000;
  int maxHealth = 1000;
  int facingX = 1;
  float walkSpeed = 3.0F;  // px/frame
  float hurtW = 60.0F;
  float hurtH = 150.0F;
};
