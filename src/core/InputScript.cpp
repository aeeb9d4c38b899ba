#include "core/InputScript.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>
#include <utility>

#include "util/TomlUtil.h"

bool InputScript::appendFromToml(const std::filesystem::path& path,
                                 std::unordered_set<std::string>& seen) {
  const std::filesystem::path normalized = path.lexically_normal();
  const std::string pathStr = normalized.string();
  if (pathStr.empty()) {
    return false;
  }

  if (!seen.insert(pathStr).second) {
    TomlUtil::warnf(pathStr.c_str(), "input script include cycle detected; skipping");
    return true;
  }

  toml::table tbl;
  try {
    tbl = toml::parse_file(pathStr);
  } catch (const toml::parse_error& err) {
    std::printf("InputScript: parse error in %s: %s\n", pathStr.c_str(), err.what());
    return false;
  }

  if (auto include = tbl["include"].value<std::string>()) {
    const std::filesystem::path includePath = normalized.parent_path() / *include;
    if (!appendFromToml(includePath, seen)) {
      return false;
    }
  } else if (tbl.contains("include")) {
    TomlUtil::warnf(pathStr.c_str(), "include must be a string path");
  }

  appendTable(tbl, pathStr.c_str());
  return true;
}

void InputScript::appendTable(const toml::table& tbl, const char* path) {
  TomlUtil::warnUnknownKeys(tbl, path, "root", {"version", "keyframes", "frames", "include"});

  int version = 1;
  if (auto v = tbl["version"].value<int>())
    version = *v;
  if (version != 1) {
    TomlUtil::warnf(path, "input script version {} (expected 1)", version);
  }

  const toml::array* framesArr = nullptr;
  if (auto arr = tbl["keyframes"].as_array())
    framesArr = arr;
  else if (auto arr = tbl["frames"].as_array())
    framesArr = arr;
  if (framesArr == nullptr) {
    return;
  }

  std::size_t idx = 0;
  for (const auto& node : *framesArr) {
    auto t = node.as_table();
    ++idx;
    if (!t)
      continue;

    const std::string scope = "keyframes[" + std::to_string(idx - 1) + "]";
    TomlUtil::warnUnknownKeys(*t, path, scope,
                              {"frame", "at", "player", "left", "right", "up", "down", "lp",
                               "mp", "hp", "lk", "mk", "hk"});

    int f = -1;
    if (auto v = t->get("frame"))
      f = v->value_or(-1);
    else if (auto v = t->get("at"))
      f = v->value_or(-1);
    if (f < 0) {
      TomlUtil::warnf(path, "{} missing frame (use frame = N)", scope);
      continue;
    }

    Keyframe kf{};
    kf.frame = static_cast<uint64_t>(f);
    const int player = (*t)["player"].value_or(1);
    if (player != 1 && player != 2) {
      TomlUtil::warnf(path, "{}.player must be 1 or 2 (got {})", scope, player);
      continue;
    }
    kf.player = static_cast<std::size_t>(player - 1);

    auto readDir = [&](std::string_view key, uint32_t bit, bool& out) {
      if (auto v = (*t)[key].value<bool>()) {
        kf.mask |= bit;
        out = *v;
      }
    };
    readDir("left", kLeft, kf.values.left);
    readDir("right", kRight, kf.values.right);
    readDir("up", kUp, kf.values.up);
    readDir("down", kDown, kf.values.down);
    for (std::size_t i = 0; i < kButtonCount; ++i) {
      const std::string_view key = buttonName(static_cast<Button>(i));
      if (auto v = (*t)[key].value<bool>()) {
        kf.mask |= 1U << (kButtonShift + i);
        kf.values.buttons[i] = *v;
      }
    }

    keyframes_.push_back(kf);
  }
}

void InputScript::finish() {
  std::stable_sort(keyframes_.begin(), keyframes_.end(),
                   [](const Keyframe& a, const Keyframe& b) { return a.frame < b.frame; });
  loaded_ = true;
  reset();
}

// NOLINTNEXTLINE
bool InputScript::loadFromToml(const char* path) {
  keyframes_.clear();
  loaded_ = false;
  path_ = path ? path : "";
  reset();

  std::unordered_set<std::string> seen;
  if (!appendFromToml(path_, seen)) {
    return false;
  }
  finish();
  return true;
}

bool InputScript::loadFromString(std::string_view text) {
  keyframes_.clear();
  loaded_ = false;
  path_ = "<string>";
  reset();

  toml::table tbl;
  try {
    tbl = toml::parse(text);
  } catch (const toml::parse_error& err) {
    std::printf("InputScript: parse error: %s\n", err.what());
    return false;
  }
  appendTable(tbl, path_.c_str());
  finish();
  return true;
}

void InputScript::reset() {
  held_ = Frame{};
  nextIndex_ = 0;
  lastFrame_ = 0;
  hasLastFrame_ = false;
}

uint64_t InputScript::lastKeyframe() const {
  return keyframes_.empty() ? 0 : keyframes_.back().frame;
}

InputScript::Frame InputScript::sample(uint64_t frame) {
  if (!loaded_)
    return Frame{};

  if (!hasLastFrame_ || frame < lastFrame_) {
    reset();
  }

  while (nextIndex_ < keyframes_.size() && keyframes_[nextIndex_].frame <= frame) {
    const Keyframe& kf = keyframes_[nextIndex_];
    DeviceState& h = held_[kf.player];
    if ((kf.mask & kLeft) != 0U)
      h.left = kf.values.left;
    if ((kf.mask & kRight) != 0U)
      h.right = kf.values.right;
    if ((kf.mask & kUp) != 0U)
      h.up = kf.values.up;
    if ((kf.mask & kDown) != 0U)
      h.down = kf.values.down;
    for (std::size_t i = 0; i < kButtonCount; ++i) {
      if ((kf.mask & (1U << (kButtonShift + i))) != 0U)
        h.buttons[i] = kf.values.buttons[i];
    }
    ++nextIndex_;
  }

  lastFrame_ = frame;
  hasLastFrame_ = true;
  return held_;
}
