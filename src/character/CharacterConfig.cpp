#include "character/CharacterConfig.h"

#include <cstddef>
#include <filesystem>
#include <format>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>

#include "util/TomlUtil.h"

static bool requireInt(const toml::table& tbl,
                       std::string_view key,
                       const std::string& scope,
                       int& out,
                       std::string& error) {
  const toml::node* node = tbl.get(key);
  if (node == nullptr) {
    error = std::format("{}: missing required field '{}'", scope, key);
    return false;
  }
  auto v = node->value<int>();
  if (!v) {
    error = std::format("{}: '{}' must be an integer", scope, key);
    return false;
  }
  out = *v;
  return true;
}

static bool parseBox(const toml::table& tbl, const char* path, const std::string& scope,
                     BoxShape& out) {
  TomlUtil::warnUnknownKeys(tbl, path, scope, {"x", "y", "w", "h"});
  TomlUtil::readFloat(tbl, "x", path, scope, out.x, -10000.0F);
  TomlUtil::readFloat(tbl, "y", path, scope, out.y, -10000.0F);
  TomlUtil::readFloat(tbl, "w", path, scope, out.w);
  TomlUtil::readFloat(tbl, "h", path, scope, out.h);
  return true;
}

static bool parseAttack(const toml::table& tbl,
                        const char* path,
                        const std::string& scope,
                        AttackData& a,
                        std::string& error) {
  TomlUtil::warnUnknownKeys(
      tbl, path, scope,
      {"motion", "buttons", "button", "super", "damage", "startup", "active", "recovery",
       "hit_advantage", "block_advantage", "meter_gain", "meter_cost", "hitstun", "blockstun",
       "guard", "knockdown", "projectile", "invulnerable", "super_freeze", "hitbox",
       "projectile_speed", "projectile_lifetime"});

  // The four frame-data fields are mandatory; everything else has a default.
  if (!requireInt(tbl, "damage", scope, a.damage, error) ||
      !requireInt(tbl, "startup", scope, a.startup, error) ||
      !requireInt(tbl, "active", scope, a.active, error) ||
      !requireInt(tbl, "recovery", scope, a.recovery, error)) {
    return false;
  }

  TomlUtil::readInt(tbl, "hit_advantage", path, scope, a.hitAdvantage, -1000);
  TomlUtil::readInt(tbl, "block_advantage", path, scope, a.blockAdvantage, -1000);
  TomlUtil::readInt(tbl, "meter_gain", path, scope, a.meterGain);
  TomlUtil::readInt(tbl, "meter_cost", path, scope, a.meterCost);
  TomlUtil::readInt(tbl, "hitstun", path, scope, a.hitstun);
  TomlUtil::readInt(tbl, "blockstun", path, scope, a.blockstun);
  TomlUtil::readInt(tbl, "super_freeze", path, scope, a.superFreeze);
  TomlUtil::readBool(tbl, "knockdown", path, scope, a.knockdown);
  TomlUtil::readBool(tbl, "projectile", path, scope, a.projectile);
  TomlUtil::readFloat(tbl, "projectile_speed", path, scope, a.projectileSpeed);
  TomlUtil::readInt(tbl, "projectile_lifetime", path, scope, a.projectileLifetime, 1);

  if (auto g = tbl["guard"].value<std::string>()) {
    if (!parseGuardType(*g, a.guard)) {
      error = std::format("{}: unknown guard '{}'", scope, *g);
      return false;
    }
  }

  if (const toml::node* inv = tbl.get("invulnerable")) {
    const auto* arr = inv->as_array();
    if (arr == nullptr || arr->size() != 2 || !(*arr)[0].value<int>() || !(*arr)[1].value<int>()) {
      error = std::format("{}: invulnerable must be [from, to]", scope);
      return false;
    }
    a.invulnFrom = *(*arr)[0].value<int>();
    a.invulnTo = *(*arr)[1].value<int>();
  }

  if (auto box = tbl["hitbox"].as_table()) {
    parseBox(*box, path, scope + ".hitbox", a.box);
  }
  return true;
}

static bool parseButtons(const toml::table& tbl,
                         const std::string& scope,
                         std::vector<Button>& out,
                         std::string& error) {
  auto one = [&](const toml::node& node) {
    auto s = node.value<std::string>();
    Button b{};
    if (!s || !parseButton(*s, b)) {
      error = std::format("{}: unknown button '{}'", scope, s.value_or("?"));
      return false;
    }
    out.push_back(b);
    return true;
  };

  if (const toml::node* n = tbl.get("buttons")) {
    if (const auto* arr = n->as_array()) {
      for (const auto& node : *arr) {
        if (!one(node)) {
          return false;
        }
      }
      return true;
    }
    error = std::format("{}: buttons must be an array", scope);
    return false;
  }
  if (const toml::node* n = tbl.get("button")) {
    return one(*n);
  }
  return true;
}

bool CharacterConfig::loadFromTable(const toml::table& tbl, const char* path) {
  TomlUtil::warnUnknownKeys(tbl, path, "root",
                            {"version", "include", "name", "stats", "hurtbox", "normals",
                             "throw", "specials"});

  if (auto v = tbl["version"].value<int>())
    version = *v;

  if (auto n = tbl["name"].as_table()) {
    TomlUtil::warnUnknownKeys(*n, path, "name", {"id", "display"});
    if (auto v = n->get("id"))
      id = v->value_or(id);
    if (auto v = n->get("display"))
      displayName = v->value_or(displayName);
  }

  if (auto s = tbl["stats"].as_table()) {
    TomlUtil::warnUnknownKeys(*s, path, "stats", {"health", "walk_speed"});
    TomlUtil::readInt(*s, "health", path, "stats", stats.health, 1);
    TomlUtil::readFloat(*s, "walk_speed", path, "stats", stats.walkSpeed);
  }

  if (auto h = tbl["hurtbox"].as_table()) {
    TomlUtil::warnUnknownKeys(*h, path, "hurtbox", {"w", "h"});
    TomlUtil::readFloat(*h, "w", path, "hurtbox", hurtbox.w, 1.0F);
    TomlUtil::readFloat(*h, "h", path, "hurtbox", hurtbox.h, 1.0F);
  }

  const std::string file = path != nullptr ? path : "<toml>";
  bool ok = true;
  // A file replaces any same-named move from the files it includes.
  auto addMove = [&](MoveDef move) {
    (void)moves.remove(move.name);
    std::string error;
    if (!moves.add(std::move(move), error)) {
      errors.push_back(std::format("{}: {}", file, error));
      ok = false;
    }
  };

  if (auto normals = tbl["normals"].as_table()) {
    for (const auto& [key, node] : *normals) {
      const std::string name(key.str());
      const std::string scope = "normals." + name;
      Button b{};
      if (!parseButton(name, b)) {
        errors.push_back(std::format("{}: {}: normals are keyed by button (lp..hk)", file, scope));
        ok = false;
        continue;
      }
      const auto* t = node.as_table();
      if (t == nullptr) {
        errors.push_back(std::format("{}: {} must be a table", file, scope));
        ok = false;
        continue;
      }
      MoveDef move{};
      move.name = name;
      move.kind = MoveKind::Normal;
      move.buttons.push_back(b);
      std::string error;
      if (!parseAttack(*t, path, scope, move.attack, error)) {
        errors.push_back(std::format("{}: {}", file, error));
        ok = false;
        continue;
      }
      addMove(std::move(move));
    }
  }

  if (auto t = tbl["throw"].as_table()) {
    MoveDef move{};
    move.name = "throw";
    move.kind = MoveKind::Throw;
    move.attack.guard = GuardType::Unblockable;
    move.attack.knockdown = true;
    std::string error;
    if (parseAttack(*t, path, "throw", move.attack, error)) {
      addMove(std::move(move));
    } else {
      errors.push_back(std::format("{}: {}", file, error));
      ok = false;
    }
  }

  if (auto specials = tbl["specials"].as_table()) {
    for (const auto& [key, node] : *specials) {
      const std::string name(key.str());
      const std::string scope = "specials." + name;
      const auto* t = node.as_table();
      if (t == nullptr) {
        errors.push_back(std::format("{}: {} must be a table", file, scope));
        ok = false;
        continue;
      }

      MoveDef move{};
      move.name = name;
      std::string error;
      auto motion = (*t)["motion"].value<std::string>();
      if (!motion) {
        errors.push_back(std::format("{}: {}: missing required field 'motion'", file, scope));
        ok = false;
        continue;
      }
      if (!parseMotion(*motion, move.motion)) {
        errors.push_back(std::format("{}: {}: unknown motion '{}'", file, scope, *motion));
        ok = false;
        continue;
      }
      if (!parseButtons(*t, scope, move.buttons, error) ||
          !parseAttack(*t, path, scope, move.attack, error)) {
        errors.push_back(std::format("{}: {}", file, error));
        ok = false;
        continue;
      }
      bool super = move.attack.meterCost > 0;
      TomlUtil::readBool(*t, "super", path, scope, super);
      move.kind = super ? MoveKind::Super : MoveKind::Special;
      addMove(std::move(move));
    }
  }

  return ok;
}

bool CharacterConfig::loadFromToml(const char* path) {
  if (path == nullptr || path[0] == '\0') {
    return false;
  }
  errors.clear();

  std::unordered_set<std::string> seen;
  auto appendFromToml = [&](auto&& self, const std::filesystem::path& filePath) -> bool {
    const std::filesystem::path normalized = filePath.lexically_normal();
    const std::string pathStr = normalized.string();
    if (pathStr.empty()) {
      return false;
    }

    if (!seen.insert(pathStr).second) {
      TomlUtil::warnf(pathStr.c_str(), "character include cycle detected; skipping");
      return true;
    }

    toml::table tbl;
    try {
      tbl = toml::parse_file(pathStr);
    } catch (const toml::parse_error& err) {
      errors.push_back(std::format("{}: {}", pathStr, err.description()));
      return false;
    }

    if (auto include = tbl["include"].value<std::string>()) {
      if (!self(self, normalized.parent_path() / *include)) {
        return false;
      }
    } else if (auto includes = tbl["include"].as_array()) {
      std::size_t idx = 0;
      for (const auto& node : *includes) {
        if (auto inc = node.value<std::string>()) {
          if (!self(self, normalized.parent_path() / *inc)) {
            return false;
          }
        } else {
          TomlUtil::warnf(pathStr.c_str(), "include[{}] must be a string path", idx);
        }
        ++idx;
      }
    } else if (tbl.contains("include")) {
      TomlUtil::warnf(pathStr.c_str(), "include must be a string path or array of paths");
    }

    return loadFromTable(tbl, pathStr.c_str());
  };

  return appendFromToml(appendFromToml, std::filesystem::path(path));
}
