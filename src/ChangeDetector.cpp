#include "ChangeDetector.hpp"
#include "TimeUtils.hpp"

namespace flatsync {

bool ChangeDetector::isModified(const FileRecord &record,
                                const Candidate &current) {
  if (!record.mtime)
    return true;
  auto recorded = TimeUtils::parseIso(*record.mtime);
  auto now = TimeUtils::parseIso(current.mtime);
  if (!recorded || !now)
    return true;
  if (current.size != record.size)
    return true;
  // An older mtime with an identical size is not treated as a change.
  return *now > *recorded;
}

ChangeSet
ChangeDetector::classify(const std::map<std::string, FileRecord> &existing,
                         const std::map<std::string, Candidate> &candidates) const {
  ChangeSet result;

  for (const auto &[key, candidate] : candidates) {
    auto it = existing.find(key);
    if (it == existing.end()) {
      result.newFiles.push_back(
          {key, FileStatus::New, std::nullopt, candidate});
      continue;
    }
    if (isModified(it->second, candidate)) {
      result.modified.push_back(
          {key, FileStatus::Modified, it->second, candidate});
    } else {
      result.unchanged.push_back(
          {key, FileStatus::Unchanged, it->second, candidate});
    }
  }

  for (const auto &[key, record] : existing) {
    if (candidates.find(key) == candidates.end()) {
      result.missing.push_back({key, FileStatus::Missing, record, std::nullopt});
    }
  }

  return result;
}

} // namespace flatsync
