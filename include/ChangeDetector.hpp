#pragma once
#include "types.hpp"
#include <map>
#include <string>

namespace flatsync {

/**
 * ChangeDetector compares recorded metadata against freshly scanned files.
 * Both maps are keyed by the absolute original path; the four resulting sets
 * partition the union of the keys. Missing records are only reported.
 */
class ChangeDetector {
public:
  ChangeSet classify(const std::map<std::string, FileRecord> &existing,
                     const std::map<std::string, Candidate> &candidates) const;

  // A record without a usable mtime always counts as modified.
  static bool isModified(const FileRecord &record, const Candidate &current);
};

} // namespace flatsync
