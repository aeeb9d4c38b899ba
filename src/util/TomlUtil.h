#pragma once

#include <algorithm>
#include <cstdio>
#include <format>
#include <initializer_list>
#include <ranges>
#include <string>
#include <string_view>
#include <utility>

#include <toml++/toml.h>

namespace TomlUtil {

inline int& warningCounter() {
  static int counter = 0;
  return counter;
}

inline void resetWarningCount() {
  warningCounter() = 0;
}

inline int warningCount() {
  return warningCounter();
}

inline void warnLine(std::string_view prefix, std::string_view message) {
  static constexpr std::string_view kWarningPrefix = ": warning: ";
  (void)std::fwrite(prefix.data(), 1, prefix.size(), stderr);
  (void)std::fwrite(kWarningPrefix.data(), 1, kWarningPrefix.size(), stderr);
  (void)std::fwrite(message.data(), 1, message.size(), stderr);
  (void)std::fwrite("\n", 1, 1, stderr);
}

template <typename... Args>
inline void warnf(const char* path, std::format_string<Args...> fmt, Args&&... args) {
  ++warningCounter();
  const std::string message = std::format(fmt, std::forward<Args>(args)...);
  const std::string_view prefix =
      (path != nullptr) ? std::string_view{path} : std::string_view{"<toml>"};
  warnLine(prefix, message);
}

inline bool allowedKey(std::string_view key, std::initializer_list<std::string_view> allowed) {
  return std::ranges::any_of(allowed, [key](std::string_view a) { return key == a; });
}

inline void warnUnknownKeys(const toml::table& tbl,
                            const char* path,
                            std::string_view scope,
                            std::initializer_list<std::string_view> allowed) {
  for (const auto& [key, node] : tbl) {
    (void)node;
    std::string_view k = key.str();
    if (allowedKey(k, allowed)) {
      continue;
    }
    warnf(path, "unknown key '{}' in {}", k, scope);
  }
}

// Reads an optional integer field; rejects values below `minValue` with a warning.
inline void readInt(const toml::table& tbl,
                    std::string_view key,
                    const char* path,
                    std::string_view scope,
                    int& out,
                    int minValue = 0) {
  const toml::node* node = tbl.get(key);
  if (node == nullptr)
    return;
  auto v = node->value<int>();
  if (!v) {
    warnf(path, "{}.{} must be an integer", scope, key);
    return;
  }
  if (*v < minValue) {
    warnf(path, "{}.{} = {} is below {}; keeping {}", scope, key, *v, minValue, out);
    return;
  }
  out = *v;
}

inline void readFloat(const toml::table& tbl,
                      std::string_view key,
                      const char* path,
                      std::string_view scope,
                      float& out,
                      float minValue = 0.0F) {
  const toml::node* node = tbl.get(key);
  if (node == nullptr)
    return;
  auto v = node->value<double>();
  if (!v) {
    warnf(path, "{}.{} must be a number", scope, key);
    return;
  }
  if (static_cast<float>(*v) < minValue) {
    warnf(path, "{}.{} = {} is below {}; keeping {}", scope, key, *v, minValue, out);
    return;
  }
  out = static_cast<float>(*v);
}

inline void readBool(const toml::table& tbl,
                     std::string_view key,
                     const char* path,
                     std::string_view scope,
                     bool& out) {
  const toml::node* node = tbl.get(key);
  if (node == nullptr)
    return;
  auto v = node->value<bool>();
  if (!v) {
    warnf(path, "{}.{} must be a boolean", scope, key);
    return;
  }
  out = *v;
}

}  // namespace TomlUtil
