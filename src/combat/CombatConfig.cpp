#include "combat/CombatConfig.h"

#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <string>
#include <unordered_set>

#include <toml++/toml.h>
#include "util/TomlUtil.h"

MotionWindows CombatConfig::motionWindows() const {
  MotionWindows w{};
  w.qcf = toFrames(input.qcfMs);
  w.qcb = toFrames(input.qcbMs);
  w.dp = toFrames(input.dpMs);
  w.qcf2 = toFrames(input.qcf2Ms);
  w.chargeFrames = input.chargeFrames;
  w.chargeRelease = toFrames(input.chargeReleaseMs);
  w.negativeEdge = toFrames(input.negativeEdgeMs);
  return w;
}

bool CombatConfig::loadFromToml(const char* filePath) {
  if (filePath == nullptr || filePath[0] == '\0') {
    return false;
  }

  std::unordered_set<std::string> seen;
  auto appendFromToml = [&](auto&& self, const std::filesystem::path& p) -> bool {
    const std::filesystem::path normalized = p.lexically_normal();
    const std::string pathStr = normalized.string();
    if (!seen.insert(pathStr).second) {
      TomlUtil::warnf(pathStr.c_str(), "combat config include cycle detected; skipping");
      return true;
    }

    toml::table tbl;
    try {
      tbl = toml::parse_file(pathStr);
    } catch (const toml::parse_error& err) {
      std::printf("CombatConfig: parse error in %s: %s\n", pathStr.c_str(), err.what());
      return false;
    }

    const char* path = pathStr.c_str();
    TomlUtil::warnUnknownKeys(tbl, path, "root",
                              {"version", "include", "frame_rate", "parry", "stun",
                               "damage_scaling", "combo", "block", "hit", "meter", "input",
                               "stage"});

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
          TomlUtil::warnf(path, "include[{}] must be a string path", idx);
        }
        ++idx;
      }
    } else if (tbl.contains("include")) {
      TomlUtil::warnf(path, "include must be a string path or array of paths");
    }

    if (auto v = tbl["version"].value<int>())
      version = *v;
    TomlUtil::readInt(tbl, "frame_rate", path, "root", frameRate, 1);

    if (auto t = tbl["parry"].as_table()) {
      TomlUtil::warnUnknownKeys(*t, path, "parry",
                                {"enabled", "red_enabled", "window", "recovery", "advantage",
                                 "red_window", "red_advantage", "meter_gain", "health_gain"});
      TomlUtil::readBool(*t, "enabled", path, "parry", parry.enabled);
      TomlUtil::readBool(*t, "red_enabled", path, "parry", parry.redEnabled);
      TomlUtil::readInt(*t, "window", path, "parry", parry.window);
      TomlUtil::readInt(*t, "recovery", path, "parry", parry.recovery);
      TomlUtil::readInt(*t, "advantage", path, "parry", parry.advantage);
      TomlUtil::readInt(*t, "red_window", path, "parry", parry.redWindow);
      TomlUtil::readInt(*t, "red_advantage", path, "parry", parry.redAdvantage);
      TomlUtil::readFloat(*t, "meter_gain", path, "parry", parry.meterGain);
      TomlUtil::readInt(*t, "health_gain", path, "parry", parry.healthGain);
    }

    if (auto t = tbl["stun"].as_table()) {
      TomlUtil::warnUnknownKeys(*t, path, "stun",
                                {"hitstun_base", "hitstun_scaling", "blockstun_base",
                                 "blockstun_scaling", "knockdown_frames"});
      TomlUtil::readInt(*t, "hitstun_base", path, "stun", stun.hitstunBase);
      TomlUtil::readFloat(*t, "hitstun_scaling", path, "stun", stun.hitstunScaling);
      TomlUtil::readInt(*t, "blockstun_base", path, "stun", stun.blockstunBase);
      TomlUtil::readFloat(*t, "blockstun_scaling", path, "stun", stun.blockstunScaling);
      TomlUtil::readInt(*t, "knockdown_frames", path, "stun", stun.knockdownFrames, 1);
    }

    if (auto t = tbl["damage_scaling"].as_table()) {
      TomlUtil::warnUnknownKeys(*t, path, "damage_scaling",
                                {"enabled", "start", "rate", "minimum"});
      TomlUtil::readBool(*t, "enabled", path, "damage_scaling", scaling.enabled);
      TomlUtil::readInt(*t, "start", path, "damage_scaling", scaling.start, 1);
      TomlUtil::readFloat(*t, "rate", path, "damage_scaling", scaling.rate);
      TomlUtil::readFloat(*t, "minimum", path, "damage_scaling", scaling.minimum);
      if (scaling.rate > 1.0F) {
        TomlUtil::warnf(path, "damage_scaling.rate {} > 1 would grow damage; clamping to 1",
                        scaling.rate);
        scaling.rate = 1.0F;
      }
    }

    if (auto t = tbl["combo"].as_table()) {
      TomlUtil::warnUnknownKeys(*t, path, "combo", {"decay_frames", "max_length"});
      TomlUtil::readInt(*t, "decay_frames", path, "combo", combo.decayFrames, 1);
      TomlUtil::readInt(*t, "max_length", path, "combo", combo.maxLength, 1);
    }

    if (auto t = tbl["block"].as_table()) {
      TomlUtil::warnUnknownKeys(*t, path, "block", {"chip_ratio", "chip_ko"});
      TomlUtil::readFloat(*t, "chip_ratio", path, "block", block.chipRatio);
      TomlUtil::readBool(*t, "chip_ko", path, "block", block.chipKo);
    }

    if (auto t = tbl["hit"].as_table()) {
      TomlUtil::warnUnknownKeys(*t, path, "hit", {"counter_multiplier", "tech_window"});
      TomlUtil::readFloat(*t, "counter_multiplier", path, "hit", hit.counterMultiplier, 1.0F);
      TomlUtil::readInt(*t, "tech_window", path, "hit", hit.techWindow);
    }

    if (auto t = tbl["meter"].as_table()) {
      TomlUtil::warnUnknownKeys(*t, path, "meter", {"max", "passive_gain"});
      TomlUtil::readFloat(*t, "max", path, "meter", meter.max);
      TomlUtil::readFloat(*t, "passive_gain", path, "meter", meter.passiveGain);
    }

    if (auto t = tbl["input"].as_table()) {
      TomlUtil::warnUnknownKeys(*t, path, "input",
                                {"socd", "negative_edge_ms", "qcf_ms", "qcb_ms", "dp_ms",
                                 "qcf2_ms", "charge_frames", "charge_release_ms"});
      if (auto s = (*t)["socd"].value<std::string>()) {
        if (!parseSocdPolicy(s->c_str(), input.socd)) {
          TomlUtil::warnf(path, "input.socd must be 'neutral' or 'last' (got '{}')", *s);
        }
      }
      TomlUtil::readInt(*t, "negative_edge_ms", path, "input", input.negativeEdgeMs);
      TomlUtil::readInt(*t, "qcf_ms", path, "input", input.qcfMs, 1);
      TomlUtil::readInt(*t, "qcb_ms", path, "input", input.qcbMs, 1);
      TomlUtil::readInt(*t, "dp_ms", path, "input", input.dpMs, 1);
      TomlUtil::readInt(*t, "qcf2_ms", path, "input", input.qcf2Ms, 1);
      TomlUtil::readInt(*t, "charge_frames", path, "input", input.chargeFrames, 1);
      TomlUtil::readInt(*t, "charge_release_ms", path, "input", input.chargeReleaseMs, 1);
    }

    if (auto t = tbl["stage"].as_table()) {
      TomlUtil::warnUnknownKeys(*t, path, "stage", {"width", "push_width", "start_gap"});
      TomlUtil::readFloat(*t, "width", path, "stage", stage.width, 1.0F);
      TomlUtil::readFloat(*t, "push_width", path, "stage", stage.pushWidth);
      TomlUtil::readFloat(*t, "start_gap", path, "stage", stage.startGap);
    }

    return true;
  };

  if (!appendFromToml(appendFromToml, std::filesystem::path(filePath))) {
    return false;
  }
  path = filePath;
  return true;
}
