#include "core/App.h"

#include <SDL3/SDL_hints.h>

#include <cstdio>
#include <cstdlib>
#include <string>
#include <string_view>

#include "combat/CombatComponents.h"
#include "core/EventLog.h"
#include "core/InputScript.h"
#include "core/MatchData.h"
#include "core/Prefs.h"
#include "core/Simulation.h"
#include "util/Paths.h"

namespace {

constexpr int kDefaultHeadlessFrames = 600;

void usage(const char* argv0) {
  std::printf(
      "usage: %s [--combat PATH] [--p1 PATH] [--p2 PATH] [--input-script PATH] [--frames N]\n"
      "          [--headless] [--socd neutral|last] [--log-events] [--no-prefs]\n"
      "          [--reset-prefs] [--video-driver NAME]\n",
      argv0);
  std::printf("  --combat PATH        Combat tuning TOML (default: data/combat.toml)\n");
  std::printf("  --p1 PATH            Player 1 character TOML\n");
  std::printf("  --p2 PATH            Player 2 character TOML\n");
  std::printf("  --input-script PATH  Drive both players from scripted keyframes\n");
  std::printf("  --frames N           Run N frames then exit (smoke test)\n");
  std::printf("  --headless           Simulate without a window and print a summary\n");
  std::printf("  --socd POLICY        Opposite-direction resolution: neutral or last\n");
  std::printf("  --log-events         Print combat events as they are drained\n");
  std::printf("  --no-prefs           Ignore and do not write session prefs\n");
  std::printf("  --reset-prefs        Delete saved session prefs before starting\n");
  std::printf("  --video-driver NAME  Force SDL video backend (e.g. x11, wayland, offscreen)\n");
  std::printf("  -h, --help           Show this help\n");
}

bool parseInt(const char* s, int& out) {
  if (!s || !*s)
    return false;
  char* end = nullptr;
  const long v = std::strtol(s, &end, 10);
  if (!end || *end != '\0')
    return false;
  if (v < 1 || v > 1000000)
    return false;
  out = static_cast<int>(v);
  return true;
}

int runHeadless(const AppConfig& cfg) {
  MatchPaths paths{};
  if (cfg.combatTomlPath)
    paths.combat = cfg.combatTomlPath;
  if (cfg.p1TomlPath)
    paths.p1 = cfg.p1TomlPath;
  if (cfg.p2TomlPath)
    paths.p2 = cfg.p2TomlPath;
  paths.combat = Paths::resolveAssetPath(paths.combat, cfg.argv0);
  paths.p1 = Paths::resolveAssetPath(paths.p1, cfg.argv0);
  paths.p2 = Paths::resolveAssetPath(paths.p2, cfg.argv0);

  MatchData match;
  if (!loadMatchData(paths, match)) {
    return 1;
  }

  InputScript script;
  if (cfg.inputScriptTomlPath) {
    const std::string scriptPath = Paths::resolveAssetPath(cfg.inputScriptTomlPath, cfg.argv0);
    if (!script.loadFromToml(scriptPath.c_str())) {
      std::printf("Input script load failed: %s\n", scriptPath.c_str());
      return 1;
    }
  }

  Simulation sim(match.combat, match.p1, match.p2);
  EventLog log(sim.events(), sim.engine());
  log.setEcho(cfg.logEvents);

  if (cfg.socd) {
    SocdPolicy socd = match.combat.input.socd;
    if (!parseSocdPolicy(cfg.socd, socd)) {
      std::printf("Unknown SOCD policy '%s'\n", cfg.socd);
      return 1;
    }
    sim.setSocdPolicy(socd);
  }

  int frames = cfg.maxFrames;
  if (frames <= 0) {
    frames = script.loaded() ? static_cast<int>(script.lastKeyframe()) + 120
                             : kDefaultHeadlessFrames;
  }

  for (int i = 0; i < frames; ++i) {
    sim.step(script.sample(sim.tick()));
    sim.drainEvents();
  }

  const World& w = sim.world();
  const CombatEngine& engine = sim.engine();
  std::printf("frames: %llu\n", static_cast<unsigned long long>(sim.tick()));
  std::printf("hits: %d  blocks: %d  parries: %d  techs: %d  specials: %d\n", w.hitEvents,
              w.blockEvents, w.parryEvents, log.techs(), log.specials());
  std::printf("longest combo: %d\n", log.longestCombo());
  for (int slot = 0; slot < Simulation::kPlayers; ++slot) {
    const Fighter& f = engine.fighter(slot);
    const PlayerCombatData& c = engine.combat(slot);
    std::printf("P%d %s: health %d/%d meter %.1f state %s\n", slot + 1,
                engine.character(slot).displayName.c_str(), f.health, f.maxHealth,
                static_cast<double>(c.meter), combatStateName(c.state));
  }
  if (w.roundOver) {
    std::printf("winner: P%d\n", w.winner + 1);
  }
  return 0;
}

bool takeValue(int argc, char** argv, int& i, const char* flag, const char*& out) {
  if (i + 1 >= argc) {
    std::printf("missing %s value\n", flag);
    usage(argv[0]);
    return false;
  }
  out = argv[++i];
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  AppConfig cfg{};
  cfg.argv0 = argv[0];
  const char* videoDriver = nullptr;
  bool headless = false;
  bool resetPrefs = false;

  for (int i = 1; i < argc; ++i) {
    const std::string_view arg(argv[i]);
    if (arg == "--frames") {
      if (i + 1 >= argc || !parseInt(argv[i + 1], cfg.maxFrames)) {
        std::printf("invalid --frames value\n");
        usage(argv[0]);
        return 1;
      }
      ++i;
    } else if (arg == "--combat") {
      if (!takeValue(argc, argv, i, "--combat", cfg.combatTomlPath))
        return 1;
    } else if (arg == "--p1") {
      if (!takeValue(argc, argv, i, "--p1", cfg.p1TomlPath))
        return 1;
    } else if (arg == "--p2") {
      if (!takeValue(argc, argv, i, "--p2", cfg.p2TomlPath))
        return 1;
    } else if (arg == "--input-script") {
      if (!takeValue(argc, argv, i, "--input-script", cfg.inputScriptTomlPath))
        return 1;
    } else if (arg == "--socd") {
      if (!takeValue(argc, argv, i, "--socd", cfg.socd))
        return 1;
    } else if (arg == "--video-driver") {
      if (!takeValue(argc, argv, i, "--video-driver", videoDriver))
        return 1;
    } else if (arg == "--headless") {
      headless = true;
    } else if (arg == "--log-events") {
      cfg.logEvents = true;
    } else if (arg == "--no-prefs") {
      cfg.noPrefs = true;
    } else if (arg == "--reset-prefs") {
      resetPrefs = true;
    } else if (arg == "-h" || arg == "--help") {
      usage(argv[0]);
      return 0;
    } else {
      std::printf("unknown option: %s\n", argv[i]);
      usage(argv[0]);
      return 1;
    }
  }

  if (resetPrefs && !deleteSessionPrefs()) {
    std::printf("Failed to delete session prefs\n");
  }

  if (headless) {
    return runHeadless(cfg);
  }

  if (videoDriver) {
    SDL_SetHint(SDL_HINT_VIDEO_DRIVER, videoDriver);
  }

  App app;
  if (!app.init(cfg)) {
    app.shutdown();
    return 1;
  }

  app.run();
  app.shutdown();
  return 0;
}
