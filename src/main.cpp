#include "AppConfig.hpp"
#include "DirectoryStructure.hpp"
#include "Errors.hpp"
#include "SyncEngine.hpp"
#include "WorkspaceStore.hpp"
#include <CLI/CLI.hpp>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <map>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace {

struct CollectOptions {
  std::string name;
  std::vector<std::string> paths;
  std::vector<std::string> extensions;
  std::vector<std::string> groups;
  std::vector<std::string> excludeDirs;
  std::vector<std::string> excludeExtensions;
  bool allExtensions = false;
  bool yes = false;
  bool disambiguate = false;
};

struct UpdateOptions {
  std::string name;
  flatsync::UpdateMode mode = flatsync::UpdateMode::Full;
  std::vector<std::string> picks;
  bool yes = false;
  bool pruneMissingDirs = false;
};

bool askYesNo(const std::string &question) {
  std::cout << question << " [y/N] " << std::flush;
  std::string answer;
  if (!std::getline(std::cin, answer))
    return false;
  return !answer.empty() && (answer[0] == 'y' || answer[0] == 'Y');
}

std::string formatSize(std::int64_t bytes) {
  static const char *units[] = {"bytes", "KB", "MB", "GB"};
  double value = static_cast<double>(bytes);
  int unit = 0;
  while (value >= 1024.0 && unit < 3) {
    value /= 1024.0;
    unit++;
  }
  std::ostringstream out;
  if (unit == 0)
    out << bytes << " " << units[0];
  else
    out << std::fixed << std::setprecision(2) << value << " " << units[unit];
  return out.str();
}

const char *statusName(flatsync::FileStatus status) {
  switch (status) {
  case flatsync::FileStatus::New:
    return "new";
  case flatsync::FileStatus::Modified:
    return "modified";
  case flatsync::FileStatus::Unchanged:
    return "unchanged";
  case flatsync::FileStatus::Missing:
    return "missing";
  }
  return "unknown";
}

flatsync::Project loadExisting(flatsync::WorkspaceStore &store,
                               const std::string &name) {
  if (!store.exists(name))
    throw flatsync::PreconditionError("Project \"" + name +
                                      "\" does not exist, create it first");
  return store.load(name);
}

void printReport(const flatsync::SyncReport &report) {
  std::cout << "[Main] Result: " << flatsync::SyncEngine::stateName(report.state)
            << (report.fellBackToFull ? " (after falling back to full sync)"
                                      : "")
            << std::endl;
  std::cout << "  New: " << report.newCount
            << "  Modified: " << report.modifiedCount
            << "  Unchanged: " << report.unchangedCount
            << "  Missing: " << report.missingCount;
  if (report.unknownCount > 0)
    std::cout << "  Unknown: " << report.unknownCount;
  std::cout << std::endl;
  std::cout << "  Copied: " << report.copied.size() << std::endl;
  for (const auto &failure : report.failed) {
    std::cout << "  Failed: " << failure.path << " (" << failure.reason << ")"
              << std::endl;
  }
  for (const auto &path : report.missing) {
    std::cout << "  Missing: " << path << std::endl;
  }
}

flatsync::SyncCallbacks makeCallbacks(bool yes,
                                      const std::vector<std::string> &picks) {
  flatsync::SyncCallbacks callbacks;
  if (!yes) {
    callbacks.confirm = [](const flatsync::ChangeSet &changes) {
      std::cout << "[Main] " << changes.newFiles.size() << " new and "
                << changes.modified.size() << " modified file(s) to copy"
                << std::endl;
      return askYesNo("Proceed?");
    };
  }
  callbacks.offerFullSync = [yes]() {
    return yes || askYesNo("No modified files. Run a full sync instead?");
  };
  callbacks.select =
      [picks](const std::vector<flatsync::ClassifiedFile> &pickList) {
        if (!picks.empty())
          return picks;
        std::vector<std::string> chosen;
        for (std::size_t i = 0; i < pickList.size(); ++i) {
          std::cout << "  " << (i + 1) << ". [" << statusName(pickList[i].status)
                    << "] " << pickList[i].key << std::endl;
        }
        std::cout << "Enter the numbers to update, separated by spaces: "
                  << std::flush;
        std::string line;
        if (!std::getline(std::cin, line))
          return chosen;
        std::istringstream in(line);
        std::size_t index = 0;
        while (in >> index) {
          if (index >= 1 && index <= pickList.size())
            chosen.push_back(pickList[index - 1].key);
        }
        return chosen;
      };
  return callbacks;
}

int runCreate(flatsync::WorkspaceStore &store, const std::string &name,
              bool overwrite) {
  flatsync::Project project = store.create(name, overwrite);
  std::cout << "[Main] Project " << project.name() << " created at "
            << store.projectPath(project.name()) << std::endl;
  return 0;
}

int runList(flatsync::WorkspaceStore &store) {
  auto names = store.listAll();
  if (names.empty()) {
    std::cout << "No projects found." << std::endl;
    return 0;
  }
  for (const auto &name : names) {
    std::cout << name << std::endl;
  }
  return 0;
}

int runShow(flatsync::WorkspaceStore &store, const std::string &name) {
  flatsync::LoadTier tier = flatsync::LoadTier::Empty;
  if (!store.exists(name))
    throw flatsync::PreconditionError("Project \"" + name +
                                      "\" does not exist");
  flatsync::Project project = store.load(name, &tier);

  std::int64_t totalSize = 0;
  for (const auto &f : project.files()) {
    totalSize += f.size;
  }

  std::cout << "Project: " << project.name() << std::endl;
  std::cout << "Created: " << project.createdAt() << std::endl;
  std::cout << "Last Updated: " << project.lastUpdated() << std::endl;
  std::cout << "Loaded from: " << flatsync::WorkspaceStore::tierName(tier)
            << std::endl;
  std::cout << "Files: " << project.files().size() << std::endl;
  std::cout << "Total size: " << formatSize(totalSize) << std::endl;
  std::cout << "Source directories:" << std::endl;
  for (const auto &dir : project.sourceDirectories()) {
    std::cout << "  " << dir << std::endl;
  }
  std::cout << "Files by extension:" << std::endl;
  for (const auto &[ext, count] :
       flatsync::DirectoryStructure::extensionHistogram(project.files())) {
    std::cout << "  " << (ext.empty() ? "(no extension)" : ext) << ": "
              << count << std::endl;
  }
  if (!project.instructions().empty())
    std::cout << "Instructions: present" << std::endl;
  return 0;
}

int runStructure(flatsync::WorkspaceStore &store, const std::string &name) {
  flatsync::Project project = loadExisting(store, name);
  std::string structure = project.directoryStructure();
  if (structure.empty())
    structure = flatsync::DirectoryStructure::render(
        project.files(), project.sourceDirectories());
  std::cout << structure;
  if (!structure.empty() && structure.back() != '\n')
    std::cout << std::endl;
  return 0;
}

int runCollect(flatsync::WorkspaceStore &store, flatsync::AppConfig config,
               const CollectOptions &opts) {
  flatsync::Project project = loadExisting(store, opts.name);

  // A batch of paths tolerates stale entries, a single path must exist
  auto roots =
      flatsync::SyncEngine::resolveRoots(opts.paths, opts.paths.size() > 1);
  if (roots.empty())
    throw flatsync::PreconditionError("None of the given paths exist");

  flatsync::FilterConfig filter = config.defaultFilter();
  if (opts.allExtensions) {
    filter.includeExtensions.reset();
  } else if (!opts.extensions.empty() || !opts.groups.empty()) {
    std::set<std::string> selected(opts.extensions.begin(),
                                   opts.extensions.end());
    for (const auto &group : opts.groups) {
      const auto &exts = flatsync::extensionGroups().at(group);
      selected.insert(exts.begin(), exts.end());
    }
    filter.includeExtensions =
        std::vector<std::string>(selected.begin(), selected.end());
  }
  filter.excludeDirNames.insert(filter.excludeDirNames.end(),
                                opts.excludeDirs.begin(),
                                opts.excludeDirs.end());
  filter.excludeExtensions.insert(filter.excludeExtensions.end(),
                                  opts.excludeExtensions.begin(),
                                  opts.excludeExtensions.end());

  if (opts.disambiguate)
    config.disambiguateCollisions = true;
  flatsync::SyncEngine engine(store, config);
  auto report = engine.collect(project, roots, filter,
                               makeCallbacks(opts.yes, {}));
  printReport(report);
  return report.saveFailed ? 1 : 0;
}

int runUpdate(flatsync::WorkspaceStore &store, const flatsync::AppConfig &config,
              const UpdateOptions &opts) {
  flatsync::Project project = loadExisting(store, opts.name);
  flatsync::SyncEngine engine(store, config);

  if (opts.pruneMissingDirs && !engine.pruneInvalidSourceDirectories(project)) {
    std::cerr << "[Main] Could not save pruned source directories"
              << std::endl;
    return 1;
  }

  auto report =
      engine.update(project, opts.mode, makeCallbacks(opts.yes, opts.picks));
  printReport(report);
  return report.saveFailed ? 1 : 0;
}

} // namespace

int main(int argc, char **argv) {
  CLI::App app{"flatsync - collect source trees into flat project workspaces"};
  app.require_subcommand(1);

  std::string configPath = flatsync::AppConfig::defaultConfigPath();
  app.add_option("-c,--config", configPath, "path to the JSON configuration")
      ->type_name("FILE");

  std::string name;
  bool overwrite = false;
  auto *create = app.add_subcommand("create", "Create a new empty project");
  create->add_option("name", name, "project name")->required();
  create->add_flag("--overwrite", overwrite,
                   "replace an existing project of the same name");

  auto *list = app.add_subcommand("list", "List existing projects");

  auto *show = app.add_subcommand("show", "Show project details");
  show->add_option("name", name, "project name")->required();

  auto *structure =
      app.add_subcommand("structure", "Print the project's directory structure");
  structure->add_option("name", name, "project name")->required();

  std::vector<std::string> groupNames;
  for (const auto &[group, exts] : flatsync::extensionGroups()) {
    groupNames.push_back(group);
  }

  CollectOptions collectOpts;
  auto *collect =
      app.add_subcommand("collect", "Copy files and directories into a project");
  collect->add_option("name", collectOpts.name, "project name")->required();
  collect->add_option("paths", collectOpts.paths, "files or directories")
      ->required()
      ->type_name("PATH");
  collect->add_option("-e,--ext", collectOpts.extensions,
                      "extensions to include (e.g. .js)");
  collect->add_option("-g,--group", collectOpts.groups,
                      "extension group to include")
      ->check(CLI::IsMember(groupNames));
  collect->add_flag("--all-ext", collectOpts.allExtensions,
                    "include every extension");
  collect->add_option("--exclude-dir", collectOpts.excludeDirs,
                      "additional directory names to skip");
  collect->add_option("--exclude-ext", collectOpts.excludeExtensions,
                      "additional extensions to skip");
  collect->add_flag("-y,--yes", collectOpts.yes, "do not ask for confirmation");
  collect->add_flag("--disambiguate", collectOpts.disambiguate,
                    "give colliding flattened names a unique suffix");

  UpdateOptions updateOpts;
  const std::map<std::string, flatsync::UpdateMode> modeMap{
      {"full", flatsync::UpdateMode::Full},
      {"existing", flatsync::UpdateMode::ExistingOnly},
      {"select", flatsync::UpdateMode::Selective},
  };
  auto *update = app.add_subcommand("update", "Re-synchronize a project");
  update->add_option("name", updateOpts.name, "project name")->required();
  update->add_option("-m,--mode", updateOpts.mode, "full, existing or select")
      ->transform(CLI::CheckedTransformer(modeMap, CLI::ignore_case))
      ->default_str("full");
  update->add_option("--pick", updateOpts.picks,
                     "original paths to update in select mode");
  update->add_flag("-y,--yes", updateOpts.yes, "do not ask for confirmation");
  update->add_flag("--prune-missing-dirs", updateOpts.pruneMissingDirs,
                   "drop source directories that no longer exist");

  CLI11_PARSE(app, argc, argv);

  try {
    flatsync::AppConfig config = flatsync::AppConfig::load(configPath);
    flatsync::WorkspaceStore store(config.dataPath);

    if (create->parsed())
      return runCreate(store, name, overwrite);
    if (list->parsed())
      return runList(store);
    if (show->parsed())
      return runShow(store, name);
    if (structure->parsed())
      return runStructure(store, name);
    if (collect->parsed())
      return runCollect(store, config, collectOpts);
    if (update->parsed())
      return runUpdate(store, config, updateOpts);
  } catch (const flatsync::PreconditionError &e) {
    std::cerr << "[Main] " << e.what() << std::endl;
    return 2;
  } catch (const std::exception &e) {
    std::cerr << "[Main] Error: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
