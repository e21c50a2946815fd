#include "AppConfig.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace flatsync {

namespace {

std::vector<std::string> stringList(const json &data, const char *key,
                                    const std::vector<std::string> &fallback) {
  if (!data.contains(key) || !data[key].is_array())
    return fallback;
  std::vector<std::string> values;
  for (const auto &item : data[key]) {
    if (item.is_string())
      values.push_back(item.get<std::string>());
  }
  return values;
}

} // namespace

const std::map<std::string, std::vector<std::string>> &extensionGroups() {
  static const std::map<std::string, std::vector<std::string>> groups = {
      {"JavaScript", {".js", ".jsx", ".ts", ".tsx"}},
      {"PHP", {".php"}},
      {"Python", {".py", ".pyw"}},
      {"CSS/HTML", {".css", ".scss", ".html", ".htm"}},
      {"Configuration", {".json", ".yaml", ".yml", ".xml", ".config"}},
      {"Documentation", {".md", ".txt"}},
      {"SQL", {".sql"}},
      {"Shell", {".sh", ".bash"}},
  };
  return groups;
}

AppConfig AppConfig::defaults() {
  AppConfig config;
  if (const char *dataDir = std::getenv("FLATSYNC_DATA_DIR");
      dataDir && *dataDir) {
    config.dataPath = dataDir;
  } else {
    config.dataPath = (fs::current_path() / "data").string();
  }
  config.supportedExtensions = {".php", ".js", ".jsx", ".ts", ".tsx", ".py"};
  config.excludedDirs = {"node_modules", "vendor", ".git", "dist", "build"};
  config.excludedExtensions = {".lock", ".pyc"};
  return config;
}

std::string AppConfig::defaultConfigPath() {
  if (const char *path = std::getenv("FLATSYNC_CONFIG"); path && *path)
    return path;
  return (fs::current_path() / "config" / "app.json").string();
}

AppConfig AppConfig::load(const std::string &path) {
  AppConfig config = defaults();
  std::ifstream in(path);
  if (!in.is_open())
    return config;

  try {
    json data = json::parse(in);
    if (!data.is_object()) {
      std::cerr << "[Config] Ignoring " << path << ": not a JSON object"
                << std::endl;
      return config;
    }
    // The environment wins over the file for the data directory
    if (data.contains("dataPath") && data["dataPath"].is_string() &&
        !std::getenv("FLATSYNC_DATA_DIR"))
      config.dataPath = data["dataPath"].get<std::string>();
    config.supportedExtensions = stringList(data, "supportedExtensions",
                                            config.supportedExtensions);
    config.excludedDirs =
        stringList(data, "excludedDirs", config.excludedDirs);
    config.excludedExtensions =
        stringList(data, "excludedExtensions", config.excludedExtensions);
    config.disambiguateCollisions =
        data.value("disambiguateCollisions", config.disambiguateCollisions);
  } catch (const json::exception &e) {
    std::cerr << "[Config] Malformed config " << path << ": " << e.what()
              << std::endl;
    return defaults();
  }
  return config;
}

bool AppConfig::save(const std::string &path) const {
  json data = {{"dataPath", dataPath},
               {"supportedExtensions", supportedExtensions},
               {"excludedDirs", excludedDirs},
               {"excludedExtensions", excludedExtensions},
               {"disambiguateCollisions", disambiguateCollisions}};
  std::error_code ec;
  fs::create_directories(fs::path(path).parent_path(), ec);
  std::ofstream out(path);
  if (!out) {
    std::cerr << "[Config] Cannot write " << path << std::endl;
    return false;
  }
  out << data.dump(2) << std::endl;
  return static_cast<bool>(out);
}

FilterConfig AppConfig::defaultFilter() const {
  FilterConfig filter;
  filter.includeExtensions = supportedExtensions;
  filter.excludeExtensions = excludedExtensions;
  filter.excludeDirNames = excludedDirs;
  return filter;
}

} // namespace flatsync
