#include "core/DebugUI.h"

#ifndef FRAMELOCK_WITH_IMGUI
#define FRAMELOCK_WITH_IMGUI 0
#endif

#if FRAMELOCK_WITH_IMGUI
#include <imgui.h>
#include <imgui_impl_sdl3.h>
#include <imgui_impl_sdlrenderer3.h>
#endif

#include <memory>

#include <SDL3/SDL_filesystem.h>
#include <SDL3/SDL_stdinc.h>

bool DebugUI::available() {
  return FRAMELOCK_WITH_IMGUI != 0;
}

#if FRAMELOCK_WITH_IMGUI
static void drawFighter(const char* label, const DebugUIFighterModel& f) {
  if (!ImGui::CollapsingHeader(label, ImGuiTreeNodeFlags_DefaultOpen))
    return;

  ImGui::PushID(label);
  ImGui::Text("%s  x=%.1f  facing=%s", f.name.c_str(), f.x, f.facingX > 0 ? "right" : "left");

  const float hp = f.maxHealth > 0 ? static_cast<float>(f.health) / static_cast<float>(f.maxHealth)
                                   : 0.0F;
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%d / %d", f.health, f.maxHealth);
  ImGui::ProgressBar(hp, ImVec2(-1.0F, 0.0F), buf);
  const float meter = f.maxMeter > 0.0F ? f.meter / f.maxMeter : 0.0F;
  std::snprintf(buf, sizeof(buf), "meter %.1f", f.meter);
  ImGui::ProgressBar(meter, ImVec2(-1.0F, 0.0F), buf);

  ImGui::Text("state: %s", f.state.c_str());
  if (!f.move.empty())
    ImGui::Text("move: %s (frame %d)", f.move.c_str(), f.moveFrame);
  ImGui::Text("stick: %s%s%s%s", f.stick.c_str(), f.blocking ? "  blocking" : "",
              f.crouching ? "  crouching" : "", f.invulnerable ? "  invuln" : "");

  if (ImGui::BeginTable("timers", 4, ImGuiTableFlags_SizingStretchSame)) {
    auto cell = [](const char* name, int v) {
      ImGui::TableNextColumn();
      ImGui::Text("%s %d", name, v);
    };
    cell("hitstun", f.hitstun);
    cell("blockstun", f.blockstun);
    cell("knockdown", f.knockdown);
    cell("tech", f.techWindow);
    cell("parry", f.parryWindow);
    cell("parry rec", f.parryRecovery);
    cell("combo", f.comboCount);
    cell("combo dmg", f.comboDamage);
    ImGui::EndTable();
  }
  ImGui::Text("advantage: %+d", f.advantage);
  ImGui::PopID();
}
#endif

bool DebugUI::init(SDL_Window* window, SDL_Renderer* renderer) {
#if FRAMELOCK_WITH_IMGUI
  if (initialized_)
    return true;

  IMGUI_CHECKVERSION();
  ImGui::CreateContext();
  ImGui::StyleColorsDark();

  ImGuiIO& io = ImGui::GetIO();
  iniPath_.clear();
  using PrefPathPtr = std::unique_ptr<char, decltype(&SDL_free)>;
  PrefPathPtr prefPath{SDL_GetPrefPath("framelock", "framelock"), SDL_free};
  if (prefPath) {
    iniPath_ = std::string(prefPath.get()) + "imgui.ini";
    io.IniFilename = iniPath_.c_str();  // persist layout outside the repo
  } else {
    io.IniFilename = nullptr;
  }
  io.LogFilename = nullptr;

  if (!ImGui_ImplSDL3_InitForSDLRenderer(window, renderer)) {
    ImGui::DestroyContext();
    return false;
  }

  if (!ImGui_ImplSDLRenderer3_Init(renderer)) {
    ImGui_ImplSDL3_Shutdown();
    ImGui::DestroyContext();
    return false;
  }

  initialized_ = true;
  return true;
#else
  (void)window;
  (void)renderer;
  return false;
#endif
}

void DebugUI::shutdown() {
#if FRAMELOCK_WITH_IMGUI
  if (!initialized_)
    return;
  ImGui_ImplSDLRenderer3_Shutdown();
  ImGui_ImplSDL3_Shutdown();
  ImGui::DestroyContext();
  initialized_ = false;
#endif
}

void DebugUI::processEvent(const SDL_Event& e) {
#if FRAMELOCK_WITH_IMGUI
  if (!initialized_)
    return;
  (void)ImGui_ImplSDL3_ProcessEvent(&e);
#else
  (void)e;
#endif
}

void DebugUI::beginFrame() {
#if FRAMELOCK_WITH_IMGUI
  if (!initialized_)
    return;
  ImGui_ImplSDLRenderer3_NewFrame();
  ImGui_ImplSDL3_NewFrame();
  ImGui::NewFrame();
#endif
}

void DebugUI::endFrame(SDL_Renderer* renderer) {
#if FRAMELOCK_WITH_IMGUI
  if (!initialized_)
    return;
  ImGui::Render();
  ImGui_ImplSDLRenderer3_RenderDrawData(ImGui::GetDrawData(), renderer);
#else
  (void)renderer;
#endif
}

bool DebugUI::wantCaptureKeyboard() const {
#if FRAMELOCK_WITH_IMGUI
  if (!initialized_)
    return false;
  return ImGui::GetIO().WantCaptureKeyboard;
#else
  return false;
#endif
}

// NOLINTNEXTLINE
DebugUIActions DebugUI::drawInspector(const DebugUIInspectorModel& model) {
  DebugUIActions actions{};
#if FRAMELOCK_WITH_IMGUI
  if (!initialized_)
    return actions;

  ImGui::SetNextWindowSize(ImVec2(380.0F, 560.0F), ImGuiCond_FirstUseEver);
  if (ImGui::Begin("Inspector")) {
    ImGui::Text("tick %llu", static_cast<unsigned long long>(model.tick));
    if (model.freezeFrames > 0) {
      ImGui::SameLine();
      ImGui::TextColored(ImVec4(1.0F, 0.8F, 0.2F, 1.0F), "freeze %d", model.freezeFrames);
    }
    if (model.roundOver) {
      ImGui::TextColored(ImVec4(1.0F, 0.3F, 0.3F, 1.0F), "KO - P%d wins", model.winner + 1);
    }

    bool paused = model.paused;
    if (ImGui::Checkbox("Paused", &paused)) {
      actions.setPaused = true;
      actions.paused = paused;
    }
    ImGui::SameLine();
    if (ImGui::Button("Step"))
      actions.stepFrames = 1;
    ImGui::SameLine();
    if (ImGui::Button("Step 10"))
      actions.stepFrames = 10;

    bool boxes = model.showBoxes;
    if (ImGui::Checkbox("Show boxes", &boxes)) {
      actions.setShowBoxes = true;
      actions.showBoxes = boxes;
    }

    int socd = model.socd;
    const char* socdItems[] = {"neutral", "last input"};
    if (ImGui::Combo("SOCD", &socd, socdItems, 2)) {
      actions.setSocd = true;
      actions.socd = socd;
    }

    if (ImGui::Button("Reset round"))
      actions.resetRound = true;
    ImGui::SameLine();
    if (ImGui::Button("Quit"))
      actions.quit = true;

    ImGui::Text("hits %d  blocks %d  parries %d", model.hitEvents, model.blockEvents,
                model.parryEvents);
    ImGui::Separator();

    drawFighter("P1", model.fighters[0]);
    drawFighter("P2", model.fighters[1]);

    if (model.eventLog && ImGui::CollapsingHeader("Events")) {
      ImGui::BeginChild("events", ImVec2(0.0F, 160.0F));
      for (auto it = model.eventLog->rbegin(); it != model.eventLog->rend(); ++it) {
        ImGui::TextUnformatted(it->c_str());
      }
      ImGui::EndChild();
    }

    if (model.legend && ImGui::CollapsingHeader("Controls")) {
      for (const std::string& line : *model.legend) {
        ImGui::TextUnformatted(line.c_str());
      }
    }
  }
  ImGui::End();
#else
  (void)model;
#endif
  return actions;
}
