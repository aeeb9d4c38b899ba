#pragma once

#include <SDL3/SDL.h>

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace Paths {

inline bool pathExists(const std::filesystem::path& p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec) && !ec;
}

// Directories a relative data path is tried against, in order: the working directory, the
// executable's directory and its parent (from argv[0]), then SDL's base path and its parent.
inline std::vector<std::filesystem::path> searchRoots(const char* argv0) {
  namespace fs = std::filesystem;
  std::vector<fs::path> roots;

  if ((argv0 != nullptr) && (*argv0 != 0)) {
    std::error_code ec;
    const fs::path exe = fs::absolute(fs::path(argv0), ec);
    if (!ec) {
      roots.push_back(exe.parent_path());
      roots.push_back(exe.parent_path() / "..");
    }
  }

  const char* base = SDL_GetBasePath();
  if ((base != nullptr) && (*base != 0)) {
    roots.emplace_back(base);
    roots.push_back(fs::path(base) / "..");
  }
  return roots;
}

// Returns the first existing location of `relativePath`, or the path unchanged so the loader
// reports the original name when nothing matches.
inline std::string resolveAssetPath(std::string_view relativePath, const char* argv0 = nullptr) {
  namespace fs = std::filesystem;

  const fs::path rel(relativePath);
  if (rel.empty() || rel.is_absolute() || pathExists(rel)) {
    return rel.string();
  }
  for (const fs::path& root : searchRoots(argv0)) {
    const fs::path candidate = root / rel;
    if (pathExists(candidate)) {
      return candidate.lexically_normal().string();
    }
  }
  return rel.string();
}

}  // namespace Paths
