#include "core/App.h"

#include <SDL3/SDL.h>

#include <algorithm>
#include <cstdio>
#include <string>

#include "combat/CombatComponents.h"
#include "util/Paths.h"

namespace {

constexpr SDL_Color kHurtColor{60, 200, 120, 255};
constexpr SDL_Color kHurtInvulnColor{90, 110, 220, 255};
constexpr SDL_Color kHitColor{235, 70, 60, 255};
constexpr SDL_Color kProjectileColor{250, 160, 40, 255};
constexpr SDL_Color kThrowColor{230, 220, 70, 255};
constexpr SDL_Color kBodyColors[2] = {{70, 130, 220, 255}, {210, 80, 90, 255}};

const char* stickNotation(const InputSnapshot& in, int facingX) {
  const bool fwd = facingX > 0 ? in.right : in.left;
  const bool back = facingX > 0 ? in.left : in.right;
  if (in.down)
    return fwd ? "3" : (back ? "1" : "2");
  if (in.up)
    return fwd ? "9" : (back ? "7" : "8");
  return fwd ? "6" : (back ? "4" : "5");
}

}  // namespace

bool App::init(const AppConfig& cfg) {
  cfg_ = cfg;
  prefsEnabled_ = !cfg_.noPrefs;

  MatchPaths paths{};
  if (prefsEnabled_ && loadSessionPrefs(prefs_)) {
    if (!prefs_.combatPath.empty())
      paths.combat = prefs_.combatPath;
    if (!prefs_.p1Path.empty())
      paths.p1 = prefs_.p1Path;
    if (!prefs_.p2Path.empty())
      paths.p2 = prefs_.p2Path;
    showBoxes_ = prefs_.showBoxes;
    panelsOpen_ = prefs_.panelsOpen;
  }
  if (cfg_.combatTomlPath)
    paths.combat = cfg_.combatTomlPath;
  if (cfg_.p1TomlPath)
    paths.p1 = cfg_.p1TomlPath;
  if (cfg_.p2TomlPath)
    paths.p2 = cfg_.p2TomlPath;
  paths.combat = Paths::resolveAssetPath(paths.combat, cfg_.argv0);
  paths.p1 = Paths::resolveAssetPath(paths.p1, cfg_.argv0);
  paths.p2 = Paths::resolveAssetPath(paths.p2, cfg_.argv0);

  match_ = std::make_unique<MatchData>();
  if (!loadMatchData(paths, *match_)) {
    return false;
  }
  prefs_.combatPath = paths.combat;
  prefs_.p1Path = paths.p1;
  prefs_.p2Path = paths.p2;

  if (!SDL_Init(SDL_INIT_VIDEO | SDL_INIT_GAMEPAD)) {
    std::printf("SDL_Init failed: %s\n", SDL_GetError());
    return false;
  }

  window_ = SDL_CreateWindow(cfg_.title, cfg_.width, cfg_.height, SDL_WINDOW_RESIZABLE);
  if (!window_) {
    std::printf("SDL_CreateWindow failed: %s\n", SDL_GetError());
    return false;
  }

  renderer_ = SDL_CreateRenderer(window_, nullptr);
  if (renderer_) {
    SDL_SetRenderVSync(renderer_, 1);
  } else {
    std::printf("SDL_CreateRenderer failed: %s\n", SDL_GetError());
    return false;
  }
  SDL_SetRenderDrawBlendMode(renderer_, SDL_BLENDMODE_BLEND);

  input_.init();
  input_.setGamepadDeadzone(prefs_.gamepadDeadzone);
  input_.appendLegend(legend_);

  if (DebugUI::available() && !debugUi_.init(window_, renderer_)) {
    std::printf("DebugUI init failed; continuing without panels\n");
  }

  sim_ = std::make_unique<Simulation>(match_->combat, match_->p1, match_->p2);
  log_ = std::make_unique<EventLog>(sim_->events(), sim_->engine());
  log_->setEcho(cfg_.logEvents);
  clock_ = FixedStep(match_->combat.frameRate);

  SocdPolicy socd = prefs_.hasSocd ? prefs_.socd : match_->combat.input.socd;
  if (cfg_.socd && !parseSocdPolicy(cfg_.socd, socd)) {
    std::printf("Unknown SOCD policy '%s'; keeping %s\n", cfg_.socd, socdPolicyName(socd));
  }
  setSocd(socd);

  if (cfg_.inputScriptTomlPath) {
    const std::string scriptPath = Paths::resolveAssetPath(cfg_.inputScriptTomlPath, cfg_.argv0);
    inputScriptEnabled_ = inputScript_.loadFromToml(scriptPath.c_str());
    if (inputScriptEnabled_) {
      std::printf("Input script: %s (%zu keyframes)\n", scriptPath.c_str(),
                  inputScript_.keyframeCount());
    } else {
      std::printf("Input script load failed: %s\n", scriptPath.c_str());
    }
  }

  return true;
}

void App::run() {
  uint64_t lastTicks = SDL_GetTicks();
  int frames = 0;

  while (running_) {
    SDL_Event e;
    while (SDL_PollEvent(&e)) {
      handleEvent(e);
    }
    handleCommands(input_.consumeCommands());

    const uint64_t now = SDL_GetTicks();
    const float dt = static_cast<float>(now - lastTicks) / 1000.0F;
    lastTicks = now;

    debugUi_.beginFrame();
    if (panelsOpen_) {
      applyUiActions(debugUi_.drawInspector(inspectorModel()));
    }

    int steps = clock_.advance(dt);
    if (simPaused_) {
      steps = pendingSimSteps_;
      pendingSimSteps_ = 0;
    }
    for (int i = 0; i < steps; ++i) {
      stepSimulation();
    }

    render();

    if (cfg_.maxFrames > 0) {
      ++frames;
      if (frames >= cfg_.maxFrames) {
        running_ = false;
      }
    }
  }
}

void App::shutdown() {
  savePrefs();

  log_.reset();
  sim_.reset();
  match_.reset();

  debugUi_.shutdown();
  input_.shutdown();

  if (renderer_) {
    SDL_DestroyRenderer(renderer_);
    renderer_ = nullptr;
  }
  if (window_) {
    SDL_DestroyWindow(window_);
    window_ = nullptr;
  }

  SDL_Quit();
}

void App::handleEvent(const SDL_Event& e) {
  debugUi_.processEvent(e);
  if (e.type == SDL_EVENT_QUIT) {
    running_ = false;
    return;
  }

  uiCaptureKeyboard_ = debugUi_.wantCaptureKeyboard();
  const bool isKey = e.type == SDL_EVENT_KEY_DOWN || e.type == SDL_EVENT_KEY_UP;
  if (isKey && uiCaptureKeyboard_ && e.key.down) {
    return;
  }
  input_.handleEvent(e);
}

void App::handleCommands(const AppCommands& cmds) {
  if (cmds.quit)
    running_ = false;
  if (cmds.resetRound)
    resetRound();
  if (cmds.toggleBoxes)
    showBoxes_ = !showBoxes_;
  if (cmds.togglePanels)
    panelsOpen_ = !panelsOpen_;
  if (cmds.togglePause) {
    simPaused_ = !simPaused_;
    pendingSimSteps_ = 0;
  }
  if (cmds.stepFrame && simPaused_)
    ++pendingSimSteps_;
}

void App::applyUiActions(const DebugUIActions& actions) {
  if (actions.quit)
    running_ = false;
  if (actions.resetRound)
    resetRound();
  if (actions.setPaused) {
    simPaused_ = actions.paused;
    pendingSimSteps_ = 0;
  }
  if (actions.stepFrames > 0) {
    simPaused_ = true;
    pendingSimSteps_ += actions.stepFrames;
  }
  if (actions.setShowBoxes)
    showBoxes_ = actions.showBoxes;
  if (actions.setSocd)
    setSocd(actions.socd == 1 ? SocdPolicy::Last : SocdPolicy::Neutral);
}

void App::stepSimulation() {
  if (inputScriptEnabled_) {
    sim_->step(inputScript_.sample(sim_->tick()));
  } else {
    sim_->step(input_.devices());
  }
  sim_->drainEvents();
}

void App::resetRound() {
  sim_->resetRound();
  inputScript_.reset();
  clock_.reset();
  log_->clear();
  std::printf("Round reset\n");
}

void App::setSocd(SocdPolicy policy) {
  sim_->setSocdPolicy(policy);
  prefs_.socd = policy;
  prefs_.hasSocd = true;
}

void App::savePrefs() const {
  if (!prefsEnabled_ || !sim_) {
    return;
  }
  SessionPrefs out = prefs_;
  out.gamepadDeadzone = input_.gamepadDeadzone();
  out.showBoxes = showBoxes_;
  out.panelsOpen = panelsOpen_;
  if (!saveSessionPrefs(out)) {
    std::printf("Failed to save session prefs\n");
  }
}

DebugUIInspectorModel App::inspectorModel() const {
  DebugUIInspectorModel m{};
  const World& w = sim_->world();
  const CombatEngine& engine = sim_->engine();

  m.tick = sim_->tick();
  m.paused = simPaused_;
  m.showBoxes = showBoxes_;
  m.socd = sim_->aggregator(0).socdPolicy() == SocdPolicy::Last ? 1 : 0;
  m.freezeFrames = w.freezeFrames;
  m.roundOver = w.roundOver;
  m.winner = w.winner;
  m.hitEvents = w.hitEvents;
  m.blockEvents = w.blockEvents;
  m.parryEvents = w.parryEvents;
  m.legend = &legend_;
  m.eventLog = &log_->lines();

  for (int slot = 0; slot < Simulation::kPlayers; ++slot) {
    const PlayerCombatData& c = engine.combat(slot);
    const Fighter& f = engine.fighter(slot);
    DebugUIFighterModel& out = m.fighters[static_cast<std::size_t>(slot)];
    out.name = engine.character(slot).displayName;
    out.state = combatStateName(c.state);
    out.move = c.activeMove ? c.activeMove->name : std::string{};
    out.moveFrame = c.moveFrame;
    out.stick = stickNotation(sim_->snapshot(slot), f.facingX);
    out.health = f.health;
    out.maxHealth = f.maxHealth;
    out.meter = c.meter;
    out.maxMeter = c.maxMeter;
    out.hitstun = c.hitstun;
    out.blockstun = c.blockstun;
    out.knockdown = c.knockdown;
    out.parryWindow = c.parryWindow;
    out.parryRecovery = c.parryRecovery;
    out.techWindow = c.techWindow;
    out.comboCount = c.comboCount;
    out.comboDamage = c.comboDamage;
    out.advantage = c.advantage;
    out.facingX = f.facingX;
    out.x = engine.transform(slot).pos.x;
    out.blocking = c.blocking;
    out.crouching = c.crouching;
    out.invulnerable = c.invulnerable;
  }
  return m;
}

SDL_FPoint App::toScreen(float x, float y) const {
  return SDL_FPoint{viewOffsetX_ + (x * viewScale_), groundY_ - (y * viewScale_)};
}

void App::fillBox(const Box& box, SDL_Color color, bool outlineOnly) {
  const SDL_FPoint tl = toScreen(box.center.x - box.half.x, box.center.y + box.half.y);
  const SDL_FRect rect{tl.x, tl.y, box.half.x * 2.0F * viewScale_, box.half.y * 2.0F * viewScale_};
  SDL_SetRenderDrawColor(renderer_, color.r, color.g, color.b, outlineOnly ? 255 : 90);
  if (outlineOnly) {
    SDL_RenderRect(renderer_, &rect);
  } else {
    SDL_RenderFillRect(renderer_, &rect);
    SDL_SetRenderDrawColor(renderer_, color.r, color.g, color.b, 255);
    SDL_RenderRect(renderer_, &rect);
  }
}

void App::renderStage(int viewW, int viewH) {
  const float stageW = match_->combat.stage.width;
  viewScale_ = static_cast<float>(viewW) / stageW;
  viewOffsetX_ = 0.0F;
  groundY_ = static_cast<float>(viewH) * 0.85F;

  SDL_SetRenderDrawColor(renderer_, 48, 44, 56, 255);
  const SDL_FRect floor{0.0F, groundY_, static_cast<float>(viewW),
                        static_cast<float>(viewH) - groundY_};
  SDL_RenderFillRect(renderer_, &floor);

  const CombatEngine& engine = sim_->engine();
  for (int slot = 0; slot < Simulation::kPlayers; ++slot) {
    const Fighter& f = engine.fighter(slot);
    const Transform& t = engine.transform(slot);
    Box body{};
    body.center = {t.pos.x, t.pos.y + (f.hurtH * 0.5F)};
    body.half = {f.hurtW * 0.4F, f.hurtH * 0.5F};
    if (engine.combat(slot).crouching) {
      body.half.y *= 0.7F;
      body.center.y = t.pos.y + body.half.y;
    }
    fillBox(body, kBodyColors[slot], false);

    // Facing marker at head height.
    const SDL_FPoint head = toScreen(t.pos.x, t.pos.y + (f.hurtH * 0.85F));
    const SDL_FPoint tip = toScreen(t.pos.x + (static_cast<float>(f.facingX) * f.hurtW * 0.6F),
                                    t.pos.y + (f.hurtH * 0.85F));
    SDL_SetRenderDrawColor(renderer_, 240, 240, 240, 255);
    SDL_RenderLine(renderer_, head.x, head.y, tip.x, tip.y);
  }
}

void App::renderBoxes() {
  const World& w = sim_->world();

  auto hurts = w.registry.view<HurtboxData>();
  for (auto e : hurts) {
    const auto& hurt = hurts.get<HurtboxData>(e);
    fillBox(hurt.box, hurt.vulnerable ? kHurtColor : kHurtInvulnColor, true);
  }

  auto hits = w.registry.view<HitboxData>();
  for (auto e : hits) {
    const auto& hb = hits.get<HitboxData>(e);
    fillBox(hb.box, hb.projectile ? kProjectileColor : kHitColor, false);
  }

  auto throws = w.registry.view<ThrowboxData>();
  for (auto e : throws) {
    fillBox(throws.get<ThrowboxData>(e).box, kThrowColor, false);
  }
}

void App::renderHud(int viewW) {
  const CombatEngine& engine = sim_->engine();
  const float margin = 24.0F;
  const float barW = (static_cast<float>(viewW) * 0.5F) - (margin * 2.0F);

  for (int slot = 0; slot < Simulation::kPlayers; ++slot) {
    const Fighter& f = engine.fighter(slot);
    const PlayerCombatData& c = engine.combat(slot);
    const float hp = f.maxHealth > 0
                         ? static_cast<float>(f.health) / static_cast<float>(f.maxHealth)
                         : 0.0F;
    const float meter = c.maxMeter > 0.0F ? std::clamp(c.meter / c.maxMeter, 0.0F, 1.0F) : 0.0F;

    // P1 drains toward the left edge, P2 toward the right.
    const float x0 = slot == 0 ? margin : (static_cast<float>(viewW) * 0.5F) + margin;
    const SDL_FRect back{x0, margin, barW, 16.0F};
    SDL_SetRenderDrawColor(renderer_, 70, 20, 20, 255);
    SDL_RenderFillRect(renderer_, &back);
    const float hpW = barW * hp;
    const SDL_FRect fill{slot == 0 ? x0 + (barW - hpW) : x0, margin, hpW, 16.0F};
    SDL_SetRenderDrawColor(renderer_, 240, 200, 60, 255);
    SDL_RenderFillRect(renderer_, &fill);

    const SDL_FRect meterRect{x0, margin + 22.0F, barW * meter, 6.0F};
    SDL_SetRenderDrawColor(renderer_, 80, 170, 250, 255);
    SDL_RenderFillRect(renderer_, &meterRect);

    SDL_SetRenderDrawColor(renderer_, 230, 230, 230, 255);
    const std::string label = engine.character(slot).displayName + "  " +
                              combatStateName(c.state) +
                              (c.comboCount > 1 ? "  " + std::to_string(c.comboCount) + " HITS"
                                                : std::string{});
    SDL_RenderDebugText(renderer_, x0, margin + 36.0F, label.c_str());
  }

  const World& w = sim_->world();
  if (w.roundOver) {
    const std::string ko = "KO - P" + std::to_string(w.winner + 1) + " WINS (F5 to reset)";
    SDL_RenderDebugText(renderer_, (static_cast<float>(viewW) * 0.5F) - 80.0F, margin + 60.0F,
                        ko.c_str());
  }
  if (simPaused_) {
    SDL_RenderDebugText(renderer_, margin, margin + 60.0F, "PAUSED");
  }
}

void App::render() {
  if (!renderer_) {
    return;
  }

  int viewW = cfg_.width;
  int viewH = cfg_.height;
  SDL_GetCurrentRenderOutputSize(renderer_, &viewW, &viewH);

  const bool freeze = sim_->world().freezeFrames > 0;
  SDL_SetRenderDrawColor(renderer_, freeze ? 8 : 20, freeze ? 8 : 20, freeze ? 12 : 24, 255);
  SDL_RenderClear(renderer_);

  renderStage(viewW, viewH);
  if (showBoxes_) {
    renderBoxes();
  }
  renderHud(viewW);

  debugUi_.endFrame(renderer_);
  SDL_RenderPresent(renderer_);
}
