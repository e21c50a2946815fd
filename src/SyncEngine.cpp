#include "SyncEngine.hpp"
#include "DirectoryStructure.hpp"
#include "Errors.hpp"
#include "FileSystemScanner.hpp"
#include "NameFlattener.hpp"
#include "PathFilter.hpp"
#include <filesystem>
#include <iostream>
#include <set>

namespace fs = std::filesystem;

namespace flatsync {

namespace {

// Names the store itself writes inside a workspace directory.
const std::set<std::string> &reservedNames() {
  static const std::set<std::string> names = {
      "structure.txt", "structure.txt.tmp", "project.db",
      "metadata.json", "analysis.txt",      "analysis.txt.tmp"};
  return names;
}

} // namespace

SyncEngine::SyncEngine(WorkspaceStore &store, AppConfig config)
    : m_store(store), m_config(std::move(config)) {}

const char *SyncEngine::stateName(SyncState state) {
  switch (state) {
  case SyncState::Idle:
    return "Idle";
  case SyncState::Scanning:
    return "Scanning";
  case SyncState::Classified:
    return "Classified";
  case SyncState::AwaitingConfirmation:
    return "AwaitingConfirmation";
  case SyncState::Copying:
    return "Copying";
  case SyncState::Persisted:
    return "Persisted";
  case SyncState::Aborted:
    return "Aborted";
  }
  return "Unknown";
}

void SyncEngine::enter(SyncReport &report, SyncState state) {
  report.state = state;
  report.trace.push_back(state);
}

void SyncEngine::abortPass(SyncReport &report, const std::string &reason) {
  std::cout << "[Sync] " << reason << std::endl;
  enter(report, SyncState::Aborted);
}

void SyncEngine::tally(SyncReport &report, const ChangeSet &changes) {
  report.newCount = changes.newFiles.size();
  report.modifiedCount = changes.modified.size();
  report.unchangedCount = changes.unchanged.size();
  report.missingCount = changes.missing.size();
  report.missing.clear();
  for (const auto &item : changes.missing) {
    report.missing.push_back(item.key);
  }
  std::cout << "[Sync] new: " << report.newCount
            << ", modified: " << report.modifiedCount
            << ", unchanged: " << report.unchangedCount
            << ", missing: " << report.missingCount;
  if (report.unknownCount > 0)
    std::cout << ", unknown: " << report.unknownCount;
  std::cout << std::endl;
}

std::vector<ScanRoot>
SyncEngine::resolveRoots(const std::vector<std::string> &paths,
                         bool skipInvalid) {
  std::vector<ScanRoot> roots;
  for (const auto &path : paths) {
    auto root = FileSystemScanner::classifyPath(path);
    if (!root) {
      if (!skipInvalid)
        throw PreconditionError("Path does not exist: " + path);
      std::cerr << "[Sync] Skipping nonexistent path: " << path << std::endl;
      continue;
    }
    roots.push_back(*root);
  }
  return roots;
}

SourceDirectoryCheck
SyncEngine::validateSourceDirectories(const Project &project) const {
  SourceDirectoryCheck check;
  for (const auto &dir : project.sourceDirectories()) {
    std::error_code ec;
    if (fs::is_directory(dir, ec))
      check.valid.push_back(dir);
    else
      check.invalid.push_back(dir);
  }
  return check;
}

bool SyncEngine::pruneInvalidSourceDirectories(Project &project) {
  SourceDirectoryCheck check = validateSourceDirectories(project);
  if (check.invalid.empty())
    return true;
  for (const auto &dir : check.invalid) {
    project.removeSourceDirectory(dir);
    std::cout << "[Sync] Removed inaccessible source directory: " << dir
              << std::endl;
  }
  return m_store.save(project);
}

FilterConfig SyncEngine::fullSyncFilter(const Project &project) const {
  std::set<std::string> extensions;
  for (const auto &f : project.files()) {
    extensions.insert(PathFilter::extensionOf(
        f.originalPath.empty() ? f.fullOriginalPath : f.originalPath));
  }

  FilterConfig filter;
  if (!extensions.empty())
    filter.includeExtensions =
        std::vector<std::string>(extensions.begin(), extensions.end());
  filter.excludeExtensions = m_config.excludedExtensions;
  filter.excludeDirNames = m_config.excludedDirs;
  return filter;
}

std::map<std::string, Candidate>
SyncEngine::statCandidates(const ScanResult &scan, SyncReport &report) {
  std::map<std::string, Candidate> candidates;
  report.scanErrors.insert(report.scanErrors.end(), scan.errors.begin(),
                           scan.errors.end());
  for (const auto &file : scan.files) {
    auto stat = FileSystemScanner::statFile(file.absPath);
    if (!stat) {
      std::cerr << "[Sync] Cannot stat " << file.absPath << ", skipping"
                << std::endl;
      report.scanErrors.push_back({file.absPath, "cannot stat file"});
      continue;
    }
    // Overlapping roots: the first root that reached a file names it
    candidates.emplace(file.absPath, Candidate{file.absPath, file.relPath,
                                               stat->size, stat->mtime});
  }
  return candidates;
}

std::map<std::string, Candidate>
SyncEngine::restatRecords(const Project &project, SyncReport &report) {
  std::map<std::string, Candidate> candidates;
  report.unknownCount = 0;
  for (const auto &record : project.files()) {
    if (record.fullOriginalPath.empty()) {
      report.unknownCount++;
      continue;
    }
    auto stat = FileSystemScanner::statFile(record.fullOriginalPath);
    if (!stat)
      continue;
    candidates.emplace(record.fullOriginalPath,
                       Candidate{record.fullOriginalPath, record.originalPath,
                                 stat->size, stat->mtime});
  }
  return candidates;
}

std::string
SyncEngine::assignNewPath(const Candidate &candidate,
                          std::map<std::string, std::string> &usedNames) {
  const std::string name = NameFlattener::flatten(candidate.relativePath);
  if (reservedNames().count(name)) {
    std::string unique = NameFlattener::disambiguate(name, candidate.fullPath);
    std::cout << "[Sync] " << name << " is reserved, storing "
              << candidate.fullPath << " as " << unique << std::endl;
    return unique;
  }

  auto it = usedNames.find(name);
  if (it == usedNames.end() || it->second == candidate.fullPath)
    return name;

  if (!m_config.disambiguateCollisions) {
    std::cerr << "[Sync] Flattened name collision: " << candidate.fullPath
              << " and " << it->second << " both map to " << name
              << ", the later copy overwrites the earlier one" << std::endl;
    return name;
  }
  std::string unique = NameFlattener::disambiguate(name, candidate.fullPath);
  std::cout << "[Sync] Flattened name collision on " << name << ", storing "
            << candidate.fullPath << " as " << unique << std::endl;
  return unique;
}

std::optional<FileStat> SyncEngine::copyIntoWorkspace(
    const Project &project, const std::string &source,
    const std::string &newPath, SyncReport &report) {
  // Stat before copying: the recorded mtime is never newer than the copy.
  auto stat = FileSystemScanner::statFile(source);
  if (!stat) {
    std::cerr << "[Sync] Cannot copy " << source
              << ": source is gone or not a regular file" << std::endl;
    report.failed.push_back({source, "source is gone or not a regular file"});
    return std::nullopt;
  }

  const fs::path workspace(m_store.projectPath(project.name()));
  std::error_code ec;
  fs::create_directories(workspace, ec);
  if (ec) {
    std::cerr << "[Sync] Cannot create workspace " << workspace.string()
              << ": " << ec.message() << std::endl;
    report.failed.push_back({source, ec.message()});
    return std::nullopt;
  }

  fs::copy_file(source, workspace / newPath,
                fs::copy_options::overwrite_existing, ec);
  if (ec) {
    std::cerr << "[Sync] Copy failed: " << source << " -> " << newPath << " - "
              << ec.message() << std::endl;
    report.failed.push_back({source, ec.message()});
    return std::nullopt;
  }
  report.copied.push_back(source);
  return stat;
}

void SyncEngine::copyNewFiles(Project &project,
                              const std::vector<ClassifiedFile> &files,
                              SyncReport &report) {
  std::map<std::string, std::string> usedNames;
  for (const auto &f : project.files()) {
    usedNames.emplace(f.newPath, Project::recordKey(f));
  }

  std::vector<FileRecord> added;
  for (const auto &item : files) {
    if (!item.candidate)
      continue;
    const Candidate &candidate = *item.candidate;
    std::string newPath = assignNewPath(candidate, usedNames);
    auto stat = copyIntoWorkspace(project, candidate.fullPath, newPath, report);
    if (!stat)
      continue;
    usedNames[newPath] = candidate.fullPath;

    FileRecord record;
    record.originalPath = candidate.relativePath;
    record.fullOriginalPath = candidate.fullPath;
    record.newPath = newPath;
    record.originalDirectory = fs::path(candidate.fullPath).parent_path().string();
    record.size = stat->size;
    record.mtime = stat->mtime;
    added.push_back(record);
  }
  project.addFiles(added);
}

void SyncEngine::copyModifiedFiles(Project &project,
                                   const std::vector<ClassifiedFile> &files,
                                   SyncReport &report) {
  for (const auto &item : files) {
    if (!item.record)
      continue;
    // Overwrite in place, the flattened name never changes
    auto stat = copyIntoWorkspace(project, item.record->fullOriginalPath,
                                  item.record->newPath, report);
    if (!stat)
      continue;
    project.updateFileMetadata(item.key, stat->size, stat->mtime);
  }
}

void SyncEngine::persist(Project &project, SyncReport &report) {
  if (!report.failed.empty()) {
    std::cerr << "[Sync] " << report.failed.size()
              << " file(s) could not be copied" << std::endl;
  }
  if (!m_store.save(project)) {
    std::cerr << "[Sync] Saving project " << project.name() << " failed"
              << std::endl;
    report.saveFailed = true;
    enter(report, SyncState::Aborted);
    return;
  }
  enter(report, SyncState::Persisted);
  std::cout << "[Sync] Copied " << report.copied.size() << " file(s) into "
            << project.name() << std::endl;
}

SyncReport SyncEngine::collect(Project &project,
                               const std::vector<ScanRoot> &roots,
                               const FilterConfig &filter,
                               const SyncCallbacks &callbacks) {
  SyncReport report;
  enter(report, SyncState::Scanning);
  FileSystemScanner scanner{PathFilter(filter)};
  auto candidates = statCandidates(scanner.scan(roots), report);

  // Only records reached by this collection take part; nothing is missing.
  std::map<std::string, FileRecord> existing;
  for (const auto &[key, record] : project.recordsByOriginalPath()) {
    if (candidates.count(key))
      existing.emplace(key, record);
  }

  ChangeSet changes = m_detector.classify(existing, candidates);
  tally(report, changes);
  enter(report, SyncState::Classified);
  if (changes.newFiles.empty() && changes.modified.empty()) {
    abortPass(report, "No new or modified files to collect");
    return report;
  }

  enter(report, SyncState::AwaitingConfirmation);
  if (callbacks.confirm && !callbacks.confirm(changes)) {
    abortPass(report, "Collection cancelled");
    return report;
  }

  enter(report, SyncState::Copying);
  for (const auto &root : roots) {
    if (root.kind == RootKind::Directory)
      project.addSourceDirectory(root.path);
  }
  copyNewFiles(project, changes.newFiles, report);
  copyModifiedFiles(project, changes.modified, report);
  persist(project, report);
  return report;
}

SyncReport SyncEngine::fullSync(Project &project,
                                const SyncCallbacks &callbacks) {
  SyncReport report;
  enter(report, SyncState::Scanning);

  SourceDirectoryCheck check = validateSourceDirectories(project);
  for (const auto &dir : check.invalid) {
    std::cerr << "[Sync] Source directory not accessible, skipping: " << dir
              << std::endl;
  }
  if (check.valid.empty()) {
    abortPass(report, "No accessible source directories for " + project.name());
    return report;
  }

  std::vector<ScanRoot> roots;
  for (const auto &dir : check.valid) {
    roots.push_back({dir, RootKind::Directory});
  }
  FileSystemScanner scanner{PathFilter(fullSyncFilter(project))};
  auto candidates = statCandidates(scanner.scan(roots), report);

  auto existing = project.recordsByOriginalPath();
  report.unknownCount = project.files().size() - existing.size();
  // Records collected from outside the registered directories are re-stat'ed
  // so that "missing" only ever means the source is gone.
  for (const auto &[key, record] : existing) {
    if (candidates.count(key))
      continue;
    if (auto stat = FileSystemScanner::statFile(key))
      candidates.emplace(
          key, Candidate{key, record.originalPath, stat->size, stat->mtime});
  }

  ChangeSet changes = m_detector.classify(existing, candidates);
  tally(report, changes);
  enter(report, SyncState::Classified);
  if (changes.newFiles.empty() && changes.modified.empty()) {
    abortPass(report, "Project " + project.name() + " is up to date");
    return report;
  }

  enter(report, SyncState::AwaitingConfirmation);
  if (callbacks.confirm && !callbacks.confirm(changes)) {
    abortPass(report, "Full sync cancelled");
    return report;
  }

  enter(report, SyncState::Copying);
  copyNewFiles(project, changes.newFiles, report);
  copyModifiedFiles(project, changes.modified, report);
  persist(project, report);
  return report;
}

SyncReport SyncEngine::refreshExisting(Project &project,
                                       const SyncCallbacks &callbacks) {
  SyncReport report;
  enter(report, SyncState::Scanning);
  auto candidates = restatRecords(project, report);

  ChangeSet changes =
      m_detector.classify(project.recordsByOriginalPath(), candidates);
  tally(report, changes);
  enter(report, SyncState::Classified);
  for (const auto &key : report.missing) {
    std::cout << "[Sync] Source missing: " << key << std::endl;
  }

  if (changes.modified.empty()) {
    std::cout << "[Sync] No modified files in " << project.name() << std::endl;
    if (callbacks.offerFullSync && callbacks.offerFullSync()) {
      SyncReport full = fullSync(project, callbacks);
      full.fellBackToFull = true;
      if (!full.trace.empty() && full.trace.front() == SyncState::Idle)
        full.trace.erase(full.trace.begin());
      full.trace.insert(full.trace.begin(), report.trace.begin(),
                        report.trace.end());
      return full;
    }
    abortPass(report, "Nothing to refresh");
    return report;
  }

  enter(report, SyncState::AwaitingConfirmation);
  if (callbacks.confirm && !callbacks.confirm(changes)) {
    abortPass(report, "Refresh cancelled");
    return report;
  }

  enter(report, SyncState::Copying);
  copyModifiedFiles(project, changes.modified, report);
  persist(project, report);
  return report;
}

SyncReport SyncEngine::selectiveUpdate(Project &project,
                                       const SyncCallbacks &callbacks) {
  SyncReport report;
  enter(report, SyncState::Scanning);
  auto candidates = restatRecords(project, report);

  ChangeSet changes =
      m_detector.classify(project.recordsByOriginalPath(), candidates);
  tally(report, changes);
  enter(report, SyncState::Classified);

  std::vector<ClassifiedFile> pickList = changes.modified;
  pickList.insert(pickList.end(), changes.missing.begin(),
                  changes.missing.end());
  if (pickList.empty()) {
    abortPass(report, "No modified or missing files in " + project.name());
    return report;
  }

  enter(report, SyncState::AwaitingConfirmation);
  std::set<std::string> chosen;
  if (callbacks.select) {
    for (const auto &key : callbacks.select(pickList)) {
      chosen.insert(key);
    }
  }

  ChangeSet selection;
  for (const auto &item : pickList) {
    if (!chosen.erase(item.key))
      continue;
    if (item.status == FileStatus::Missing) {
      std::cout << "[Sync] Skipping missing file: " << item.key << std::endl;
      continue;
    }
    selection.modified.push_back(item);
  }
  for (const auto &key : chosen) {
    std::cerr << "[Sync] Not in the pick list, ignoring: " << key << std::endl;
  }

  if (selection.modified.empty()) {
    abortPass(report, "Nothing selected to update");
    return report;
  }
  if (callbacks.confirm && !callbacks.confirm(selection)) {
    abortPass(report, "Selective update cancelled");
    return report;
  }

  enter(report, SyncState::Copying);
  copyModifiedFiles(project, selection.modified, report);
  persist(project, report);
  return report;
}

SyncReport SyncEngine::update(Project &project, UpdateMode mode,
                              const SyncCallbacks &callbacks) {
  switch (mode) {
  case UpdateMode::Full:
    return fullSync(project, callbacks);
  case UpdateMode::ExistingOnly:
    return refreshExisting(project, callbacks);
  case UpdateMode::Selective:
    return selectiveUpdate(project, callbacks);
  }
  throw PreconditionError("Unknown update mode");
}

bool SyncEngine::enrichInstructions(Project &project,
                                    InstructionGenerator &generator) {
  std::string structure = project.directoryStructure();
  if (structure.empty())
    structure =
        DirectoryStructure::render(project.files(), project.sourceDirectories());

  auto text = generator.generate(project.name(), structure);
  if (!text || text->empty()) {
    std::cerr << "[Sync] No instructions generated for " << project.name()
              << std::endl;
    return false;
  }
  project.setInstructions(*text);
  return m_store.save(project);
}

} // namespace flatsync
