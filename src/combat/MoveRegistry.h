#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "combat/MoveData.h"

// Read-only catalog of one character's moves, keyed by name.
class MoveRegistry {
 public:
  // Validates and stores `move`. On failure `error` describes the problem and nothing is stored.
  bool add(MoveDef move, std::string& error);
  bool remove(std::string_view name);
  void clear();

  [[nodiscard]] const MoveDef* find(std::string_view name) const;
  [[nodiscard]] const MoveDef* findNormal(Button b) const;
  [[nodiscard]] const MoveDef* findThrow() const;
  // Special or super bound to `motion` + `b`; the costliest wins when several match.
  [[nodiscard]] const MoveDef* findSpecial(Motion motion, Button b) const;
  [[nodiscard]] bool hasSpecial(Motion motion, ButtonClass cls) const;

  [[nodiscard]] std::size_t size() const { return moves_.size(); }
  [[nodiscard]] bool empty() const { return moves_.empty(); }
  [[nodiscard]] const std::vector<std::string>& specialNames() const { return specials_; }

  static bool validate(const MoveDef& move, std::string& error);

 private:
  std::unordered_map<std::string, MoveDef> moves_;
  std::array<std::string, kButtonCount> normals_{};
  std::string throw_;
  std::vector<std::string> specials_;  // costliest first
};
