#ifndef WORKSPACESTORE_HPP
#define WORKSPACESTORE_HPP

#include "Project.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace flatsync {

enum class LoadTier { Cache, Structure, Legacy, Empty };

/**
 * WorkspaceStore owns the on-disk life of projects under
 * <dataPath>/projects/<name>/:
 *
 *   project.db     cache tier (sqlite)
 *   structure.txt  durable text tier
 *   metadata.json  legacy single-blob format, read only
 *   analysis.txt   instructions, when present
 *
 * load() tries the tiers in that priority order and writes a lower-tier hit
 * back to the higher tiers. save() regenerates the directory structure and
 * writes the durable tier before the cache tier.
 */
class WorkspaceStore {
public:
  explicit WorkspaceStore(std::string dataPath);

  std::string projectsRoot() const;
  std::string projectPath(const std::string &name) const;
  std::string structurePath(const std::string &name) const;
  std::string cachePath(const std::string &name) const;
  std::string legacyPath(const std::string &name) const;
  std::string analysisPath(const std::string &name) const;

  static bool isValidName(const std::string &name);

  // Provisions the workspace directory and persists an empty project.
  // Throws PreconditionError for an invalid or already taken name.
  Project create(const std::string &name, bool overwrite = false);
  Project load(const std::string &name, LoadTier *loadedFrom = nullptr);
  bool save(Project &project);

  std::vector<std::string> listAll() const;
  bool exists(const std::string &name) const;

  std::optional<Project> loadFromCache(const std::string &name);
  std::optional<Project> loadFromStructure(const std::string &name);
  std::optional<Project> loadFromLegacy(const std::string &name);

  // Re-persists a project loaded from a lower tier.
  bool migrate(Project &project, LoadTier from);

  static const char *tierName(LoadTier tier);

private:
  struct Loader {
    LoadTier tier;
    std::function<std::optional<Project>(const std::string &)> load;
  };
  std::vector<Loader> loaders();

  bool writeCache(const Project &project);
  void loadInstructions(Project &project);

  std::string m_dataPath;
};

} // namespace flatsync

#endif // WORKSPACESTORE_HPP
