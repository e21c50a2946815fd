#include "WorkspaceStore.hpp"
#include "DatabaseManager.hpp"
#include "DirectoryStructure.hpp"
#include "Errors.hpp"
#include "StructureFile.hpp"
#include "TimeUtils.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace flatsync {

namespace {

std::optional<std::string> readTextFile(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open())
    return std::nullopt;
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

// Writes through a temporary file so readers never see a half-written tier.
bool writeTextFile(const std::string &path, const std::string &content) {
  const std::string tmp = path + ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      std::cerr << "[Store] Cannot open " << tmp << " for writing" << std::endl;
      return false;
    }
    out << content;
    out.flush();
    if (!out) {
      std::cerr << "[Store] Write failed: " << tmp << std::endl;
      return false;
    }
  }
  std::error_code ec;
  fs::rename(tmp, path, ec);
  if (ec) {
    std::cerr << "[Store] Cannot replace " << path << ": " << ec.message()
              << std::endl;
    fs::remove(tmp, ec);
    return false;
  }
  return true;
}

bool isNewer(const std::string &lhs, const std::string &rhs) {
  auto l = TimeUtils::parseIso(lhs);
  auto r = TimeUtils::parseIso(rhs);
  return l && r && *l > *r;
}

} // namespace

WorkspaceStore::WorkspaceStore(std::string dataPath)
    : m_dataPath(std::move(dataPath)) {}

std::string WorkspaceStore::projectsRoot() const {
  return (fs::path(m_dataPath) / "projects").string();
}

std::string WorkspaceStore::projectPath(const std::string &name) const {
  return (fs::path(projectsRoot()) / name).string();
}

std::string WorkspaceStore::structurePath(const std::string &name) const {
  return (fs::path(projectPath(name)) / "structure.txt").string();
}

std::string WorkspaceStore::cachePath(const std::string &name) const {
  return (fs::path(projectPath(name)) / "project.db").string();
}

std::string WorkspaceStore::legacyPath(const std::string &name) const {
  return (fs::path(projectPath(name)) / "metadata.json").string();
}

std::string WorkspaceStore::analysisPath(const std::string &name) const {
  return (fs::path(projectPath(name)) / "analysis.txt").string();
}

const char *WorkspaceStore::tierName(LoadTier tier) {
  switch (tier) {
  case LoadTier::Cache:
    return "cache";
  case LoadTier::Structure:
    return "structure";
  case LoadTier::Legacy:
    return "legacy";
  case LoadTier::Empty:
    return "empty";
  }
  return "unknown";
}

bool WorkspaceStore::isValidName(const std::string &name) {
  return !name.empty() &&
         std::all_of(name.begin(), name.end(), [](unsigned char c) {
           return std::isalnum(c) || c == '-' || c == '_';
         });
}

bool WorkspaceStore::exists(const std::string &name) const {
  std::error_code ec;
  return isValidName(name) && fs::is_directory(projectPath(name), ec);
}

std::vector<std::string> WorkspaceStore::listAll() const {
  std::vector<std::string> names;
  std::error_code ec;
  if (!fs::is_directory(projectsRoot(), ec)) {
    std::cout << "[Store] No projects directory at " << projectsRoot()
              << std::endl;
    return names;
  }
  fs::directory_iterator it(projectsRoot(), ec), end;
  if (ec) {
    std::cerr << "[Store] Error listing projects: " << ec.message()
              << std::endl;
    return names;
  }
  for (; it != end; it.increment(ec)) {
    if (ec) {
      std::cerr << "[Store] Error listing projects: " << ec.message()
                << std::endl;
      break;
    }
    if (it->is_directory(ec))
      names.push_back(it->path().filename().string());
  }
  std::sort(names.begin(), names.end());
  return names;
}

Project WorkspaceStore::create(const std::string &name, bool overwrite) {
  if (!isValidName(name)) {
    throw PreconditionError(
        "Project name can only contain letters, numbers, hyphens and "
        "underscores: '" + name + "'");
  }
  std::error_code ec;
  if (fs::exists(projectPath(name), ec)) {
    if (!overwrite)
      throw PreconditionError("Project \"" + name + "\" already exists");
    std::cout << "[Store] Overwriting project " << name << std::endl;
    fs::remove_all(projectPath(name), ec);
    if (ec)
      throw PreconditionError("Cannot remove existing project \"" + name +
                              "\": " + ec.message());
  }
  fs::create_directories(projectPath(name), ec);
  if (ec)
    throw PreconditionError("Cannot create " + projectPath(name) + ": " +
                            ec.message());

  Project project(name);
  if (!save(project))
    throw std::runtime_error("Failed to persist new project \"" + name + "\"");
  std::cout << "[Store] Created project " << name << std::endl;
  return project;
}

std::vector<WorkspaceStore::Loader> WorkspaceStore::loaders() {
  return {
      {LoadTier::Cache,
       [this](const std::string &n) { return loadFromCache(n); }},
      {LoadTier::Structure,
       [this](const std::string &n) { return loadFromStructure(n); }},
      {LoadTier::Legacy,
       [this](const std::string &n) { return loadFromLegacy(n); }},
  };
}

Project WorkspaceStore::load(const std::string &name, LoadTier *loadedFrom) {
  for (const auto &loader : loaders()) {
    auto project = loader.load(name);
    if (!project)
      continue;
    std::cout << "[Store] Loaded " << name << " from "
              << tierName(loader.tier) << " tier" << std::endl;
    if (loader.tier != LoadTier::Cache && !migrate(*project, loader.tier)) {
      std::cerr << "[Store] Could not re-persist " << name
                << " to higher tiers" << std::endl;
    }
    loadInstructions(*project);
    // The cache tier does not carry the rendered view
    if (project->directoryStructure().empty())
      project->setDirectoryStructure(DirectoryStructure::render(
          project->files(), project->sourceDirectories()));
    if (loadedFrom)
      *loadedFrom = loader.tier;
    return *project;
  }

  if (loadedFrom)
    *loadedFrom = LoadTier::Empty;
  return Project(name);
}

std::optional<Project> WorkspaceStore::loadFromCache(const std::string &name) {
  DatabaseManager db(cachePath(name));
  auto project = db.loadProject();
  if (!project)
    return std::nullopt;

  // A cache older than the durable tier lost a write; do not trust it.
  if (auto text = readTextFile(structurePath(name))) {
    auto textUpdated = StructureFile::peekLastUpdated(*text);
    if (textUpdated && isNewer(*textUpdated, project->lastUpdated())) {
      std::cerr << "[Store] Cache for " << name
                << " is older than structure.txt, ignoring it" << std::endl;
      return std::nullopt;
    }
  }
  return project;
}

std::optional<Project>
WorkspaceStore::loadFromStructure(const std::string &name) {
  auto text = readTextFile(structurePath(name));
  if (!text)
    return std::nullopt;

  ParsedStructure parsed = StructureFile::parse(*text);
  Project project(name);
  if (parsed.lastUpdated && TimeUtils::parseIso(*parsed.lastUpdated))
    project.setTimestamps(*parsed.lastUpdated, *parsed.lastUpdated);
  for (const auto &dir : parsed.sourceDirectories)
    project.addSourceDirectory(dir);
  project.addFiles(parsed.files);
  project.setDirectoryStructure(parsed.directoryStructure);
  return project;
}

std::optional<Project> WorkspaceStore::loadFromLegacy(const std::string &name) {
  std::ifstream in(legacyPath(name));
  if (!in.is_open())
    return std::nullopt;

  try {
    json data = json::parse(in);
    if (!data.is_object())
      return std::nullopt;

    Project project(name);
    const std::string now = TimeUtils::nowIso();
    project.setTimestamps(data.value("createdAt", now),
                          data.value("lastUpdated", now));

    if (data.contains("sourceDirectories") &&
        data["sourceDirectories"].is_array()) {
      for (const auto &dir : data["sourceDirectories"]) {
        if (dir.is_string())
          project.addSourceDirectory(dir.get<std::string>());
      }
    }

    std::vector<FileRecord> files;
    if (data.contains("files") && data["files"].is_array()) {
      for (const auto &item : data["files"]) {
        if (!item.is_object())
          continue;
        FileRecord f;
        f.originalPath = item.value("originalPath", "");
        f.fullOriginalPath = item.value("fullOriginalPath", "");
        f.newPath = item.value("newPath", "");
        f.originalDirectory = item.value("originalDirectory", "");
        if (item.contains("size") && item["size"].is_number())
          f.size = item["size"].get<int64_t>();
        if (item.contains("mtime") && item["mtime"].is_string())
          f.mtime = item["mtime"].get<std::string>();
        if (f.newPath.empty() ||
            (f.originalPath.empty() && f.fullOriginalPath.empty()))
          continue;
        if (f.originalDirectory.empty() && !f.fullOriginalPath.empty())
          f.originalDirectory =
              fs::path(f.fullOriginalPath).parent_path().string();
        files.push_back(f);
      }
    }
    project.addFiles(files);
    project.setDirectoryStructure(data.value("directoryStructure", ""));
    project.setInstructions(data.value("instructions", ""));
    return project;
  } catch (const json::exception &e) {
    std::cerr << "[Store] Unreadable legacy metadata for " << name << ": "
              << e.what() << std::endl;
    return std::nullopt;
  }
}

bool WorkspaceStore::migrate(Project &project, LoadTier from) {
  switch (from) {
  case LoadTier::Structure:
    return writeCache(project);
  case LoadTier::Legacy:
    if (!save(project))
      return false;
    std::cout << "[Store] Converted project " << project.name()
              << " from legacy format to new format" << std::endl;
    return true;
  case LoadTier::Cache:
  case LoadTier::Empty:
    break;
  }
  return true;
}

void WorkspaceStore::loadInstructions(Project &project) {
  if (auto text = readTextFile(analysisPath(project.name())))
    project.setInstructions(*text);
}

bool WorkspaceStore::writeCache(const Project &project) {
  DatabaseManager db(cachePath(project.name()));
  if (db.storeProject(project))
    return true;
  // Never leave a stale cache in front of a newer durable tier
  std::error_code ec;
  fs::remove(cachePath(project.name()), ec);
  if (ec) {
    std::cerr << "[Store] Could not remove stale cache "
              << cachePath(project.name()) << ": " << ec.message()
              << std::endl;
  }
  return false;
}

bool WorkspaceStore::save(Project &project) {
  const std::string previousCreated = project.createdAt();
  const std::string previousUpdated = project.lastUpdated();
  project.touch();
  project.setDirectoryStructure(DirectoryStructure::render(
      project.files(), project.sourceDirectories()));

  auto rollback = [&] {
    project.setTimestamps(previousCreated, previousUpdated);
    return false;
  };

  std::error_code ec;
  fs::create_directories(projectPath(project.name()), ec);
  if (ec) {
    std::cerr << "[Store] Cannot create " << projectPath(project.name())
              << ": " << ec.message() << std::endl;
    return rollback();
  }

  if (!writeTextFile(structurePath(project.name()),
                     StructureFile::serialize(project)))
    return rollback();

  if (!project.instructions().empty()) {
    if (!writeTextFile(analysisPath(project.name()), project.instructions()))
      return rollback();
  } else {
    fs::remove(analysisPath(project.name()), ec);
    if (ec) {
      std::cerr << "[Store] Cannot remove cleared instructions "
                << analysisPath(project.name()) << ": " << ec.message()
                << std::endl;
      return rollback();
    }
  }

  if (!writeCache(project)) {
    std::cerr << "[Store] Cache write failed for " << project.name()
              << "; structure.txt remains authoritative" << std::endl;
    return false;
  }

  std::cout << "[Store] Saved project " << project.name() << " ("
            << project.files().size() << " files)" << std::endl;
  return true;
}

} // namespace flatsync
