#ifndef SYNCENGINE_HPP
#define SYNCENGINE_HPP

#include "AppConfig.hpp"
#include "ChangeDetector.hpp"
#include "InstructionGenerator.hpp"
#include "Project.hpp"
#include "WorkspaceStore.hpp"
#include "types.hpp"
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace flatsync {

enum class SyncState {
  Idle,
  Scanning,
  Classified,
  AwaitingConfirmation,
  Copying,
  Persisted,
  Aborted
};

enum class UpdateMode { Full, ExistingOnly, Selective };

struct CopyFailure {
  std::string path;
  std::string reason;
};

struct SyncReport {
  SyncState state = SyncState::Idle;
  std::vector<SyncState> trace{SyncState::Idle};

  std::size_t newCount = 0;
  std::size_t modifiedCount = 0;
  std::size_t unchangedCount = 0;
  std::size_t missingCount = 0;
  std::size_t unknownCount = 0; // records without a fullOriginalPath

  std::vector<std::string> copied;
  std::vector<CopyFailure> failed;
  std::vector<std::string> missing;
  std::vector<ScanError> scanErrors;

  bool fellBackToFull = false;
  bool saveFailed = false;
};

// Hooks for whoever drives a pass (CLI, tests, a UI). Unset hooks mean:
// proceed without asking, select nothing, never fall back.
struct SyncCallbacks {
  std::function<bool(const ChangeSet &)> confirm;
  std::function<std::vector<std::string>(const std::vector<ClassifiedFile> &)>
      select;
  std::function<bool()> offerFullSync;
};

struct SourceDirectoryCheck {
  std::vector<std::string> valid;
  std::vector<std::string> invalid;
};

/**
 * SyncEngine runs one synchronization pass at a time over a Project:
 * Idle -> Scanning -> Classified -> AwaitingConfirmation -> Copying ->
 * Persisted, or Aborted when the caller declines or there is nothing to do.
 * Per-file copy failures are logged and skipped. Every pass that copies
 * ends with exactly one WorkspaceStore::save().
 */
class SyncEngine {
public:
  SyncEngine(WorkspaceStore &store, AppConfig config);

  SyncReport collect(Project &project, const std::vector<ScanRoot> &roots,
                     const FilterConfig &filter,
                     const SyncCallbacks &callbacks = {});

  SyncReport fullSync(Project &project, const SyncCallbacks &callbacks = {});
  SyncReport refreshExisting(Project &project,
                             const SyncCallbacks &callbacks = {});
  SyncReport selectiveUpdate(Project &project, const SyncCallbacks &callbacks);
  SyncReport update(Project &project, UpdateMode mode,
                    const SyncCallbacks &callbacks = {});

  // Throws PreconditionError for a path that does not exist unless
  // skipInvalid is set, in which case the path is logged and dropped.
  static std::vector<ScanRoot> resolveRoots(const std::vector<std::string> &paths,
                                            bool skipInvalid = false);

  SourceDirectoryCheck validateSourceDirectories(const Project &project) const;
  bool pruneInvalidSourceDirectories(Project &project);

  bool enrichInstructions(Project &project, InstructionGenerator &generator);

  // Extensions already in the project (all when none), excluded dirs and
  // extensions from the configuration.
  FilterConfig fullSyncFilter(const Project &project) const;

  static const char *stateName(SyncState state);

private:
  WorkspaceStore &m_store;
  AppConfig m_config;
  ChangeDetector m_detector;

  void enter(SyncReport &report, SyncState state);
  void abortPass(SyncReport &report, const std::string &reason);
  void tally(SyncReport &report, const ChangeSet &changes);

  std::map<std::string, Candidate> statCandidates(const ScanResult &scan,
                                                  SyncReport &report);
  std::map<std::string, Candidate> restatRecords(const Project &project,
                                                 SyncReport &report);

  std::string assignNewPath(const Candidate &candidate,
                            std::map<std::string, std::string> &usedNames);
  std::optional<FileStat> copyIntoWorkspace(const Project &project,
                                            const std::string &source,
                                            const std::string &newPath,
                                            SyncReport &report);
  void copyNewFiles(Project &project, const std::vector<ClassifiedFile> &files,
                    SyncReport &report);
  void copyModifiedFiles(Project &project,
                         const std::vector<ClassifiedFile> &files,
                         SyncReport &report);
  void persist(Project &project, SyncReport &report);
};

} // namespace flatsync

#endif // SYNCENGINE_HPP
