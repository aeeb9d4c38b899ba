#include "core/Prefs.h"

#include <toml++/toml.h>

#include <array>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <system_error>

#include <SDL3/SDL_filesystem.h>
#include <SDL3/SDL_stdinc.h>

#include "util/TomlUtil.h"

namespace {

constexpr int kPrefsVersion = 1;
constexpr int kMaxDeadzone = 32767;

std::filesystem::path prefsDir() {
  using PrefPathPtr = std::unique_ptr<char, decltype(&SDL_free)>;
  const PrefPathPtr pref{SDL_GetPrefPath("framelock", "framelock"), SDL_free};
  if (!pref) {
    return {};
  }
  return std::filesystem::path(pref.get());
}

void readPath(const toml::table& tbl, const char* key, std::string& out) {
  if (auto v = tbl[key].value<std::string>()) {
    out = *v;
  }
}

}  // namespace

bool loadSessionPrefs(SessionPrefs& out) {
  const std::filesystem::path dir = prefsDir();
  if (dir.empty()) {
    return false;
  }
  const std::string path = (dir / "session.toml").string();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return false;
  }

  toml::table tbl;
  try {
    tbl = toml::parse_file(path);
  } catch (const toml::parse_error& err) {
    std::printf("Prefs: ignoring %s: %s\n", path.c_str(), err.what());
    return false;
  }

  const char* p = path.c_str();
  TomlUtil::warnUnknownKeys(tbl, p, "session",
                            {"version", "combat", "p1", "p2", "socd", "gamepad_deadzone",
                             "show_boxes", "panels_open"});
  if (tbl["version"].value_or(kPrefsVersion) != kPrefsVersion) {
    std::printf("Prefs: %s has an unknown version; ignoring\n", p);
    return false;
  }

  readPath(tbl, "combat", out.combatPath);
  readPath(tbl, "p1", out.p1Path);
  readPath(tbl, "p2", out.p2Path);
  if (auto s = tbl["socd"].value<std::string>()) {
    out.hasSocd = parseSocdPolicy(s->c_str(), out.socd);
    if (!out.hasSocd) {
      TomlUtil::warnf(p, "session.socd '{}' is not a policy", *s);
    }
  }
  TomlUtil::readInt(tbl, "gamepad_deadzone", p, "session", out.gamepadDeadzone);
  if (out.gamepadDeadzone > kMaxDeadzone) {
    out.gamepadDeadzone = kMaxDeadzone;
  }
  TomlUtil::readBool(tbl, "show_boxes", p, "session", out.showBoxes);
  TomlUtil::readBool(tbl, "panels_open", p, "session", out.panelsOpen);
  return true;
}

bool deleteSessionPrefs() {
  const std::filesystem::path dir = prefsDir();
  if (dir.empty()) {
    return false;
  }

  bool ok = true;
  for (const char* name : std::array<const char*, 2>{"session.toml", "imgui.ini"}) {
    std::error_code ec;
    const std::filesystem::path file = dir / name;
    if (std::filesystem::exists(file, ec)) {
      std::filesystem::remove(file, ec);
    }
    ok = ok && !ec;
  }
  return ok;
}

bool saveSessionPrefs(const SessionPrefs& prefs) {
  namespace fs = std::filesystem;
  const fs::path dir = prefsDir();
  if (dir.empty()) {
    return false;
  }

  toml::table tbl;
  tbl.insert("version", kPrefsVersion);
  tbl.insert("combat", prefs.combatPath);
  tbl.insert("p1", prefs.p1Path);
  tbl.insert("p2", prefs.p2Path);
  tbl.insert("socd", std::string(socdPolicyName(prefs.socd)));
  tbl.insert("gamepad_deadzone", prefs.gamepadDeadzone);
  tbl.insert("show_boxes", prefs.showBoxes);
  tbl.insert("panels_open", prefs.panelsOpen);

  // Written beside the target, then renamed over it.
  const fs::path outPath = dir / "session.toml";
  const fs::path tmpPath = dir / "session.toml.tmp";
  {
    std::ofstream tmp(tmpPath, std::ios::binary | std::ios::trunc);
    if (!tmp.is_open()) {
      return false;
    }
    tmp << tbl << '\n';
    if (!tmp) {
      return false;
    }
  }

  std::error_code ec;
  fs::rename(tmpPath, outPath, ec);
  if (ec) {
    fs::remove(tmpPath, ec);
    return false;
  }
  return true;
}
