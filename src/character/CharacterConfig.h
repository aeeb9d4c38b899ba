#pragma once

#include <string>
#include <vector>

#include <toml++/toml.h>

#include "combat/MoveRegistry.h"

// One fighter definition: vitals, hurtbox and move list.
struct CharacterConfig {
  int version = 0;
  std::string id;
  std::string displayName;

  struct Stats {
    int health = 1000;
    float walkSpeed = 3.0F;  // px/frame
  } stats;

  struct Hurtbox {
    float w = 60.0F;
    float h = 150.0F;
  } hurtbox;

  MoveRegistry moves;

  // Fatal problems from the last load (malformed moves). Warnings go to stderr.
  std::vector<std::string> errors;

  bool loadFromToml(const char* path);
  // Applies one already-parsed table; `include` is not followed.
  bool loadFromTable(const toml::table& tbl, const char* path);
};
