#pragma once

#include "types.hpp"
#include <map>
#include <string>
#include <vector>

namespace flatsync {

/**
 * AppConfig holds the application settings read from a JSON file
 * (config/app.json by default). Unknown keys are ignored, missing keys keep
 * their defaults.
 */
struct AppConfig {
  std::string dataPath;
  std::vector<std::string> supportedExtensions;
  std::vector<std::string> excludedDirs;
  std::vector<std::string> excludedExtensions;
  bool disambiguateCollisions = false;

  static AppConfig defaults();
  // Missing or malformed files fall back to defaults.
  static AppConfig load(const std::string &path);
  bool save(const std::string &path) const;

  // FLATSYNC_CONFIG, else <cwd>/config/app.json
  static std::string defaultConfigPath();

  FilterConfig defaultFilter() const;
};

// Named extension groups offered for selection.
const std::map<std::string, std::vector<std::string>> &extensionGroups();

} // namespace flatsync
