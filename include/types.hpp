#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace flatsync {

enum class RootKind { File, Directory };

// A user-selected scan root. The kind comes from a prior stat.
struct ScanRoot {
  std::string path;
  RootKind kind;
};

struct ScannedFile {
  std::string absPath;
  std::string relPath; // Relative to the root it was found under
};

struct ScanError {
  std::string path;
  std::string reason;
};

struct ScanResult {
  std::vector<ScannedFile> files;
  std::vector<ScanError> errors;
};

struct FilterConfig {
  // nullopt means every extension is accepted
  std::optional<std::vector<std::string>> includeExtensions;
  std::vector<std::string> excludeExtensions;
  std::vector<std::string> excludeDirNames;
};

struct FileStat {
  int64_t size;
  std::string mtime; // ISO-8601, UTC, millisecond precision
};

struct FileRecord {
  std::string originalPath;     // relative to the scan root
  std::string fullOriginalPath; // absolute path at collection time
  std::string newPath;          // flattened name inside the workspace
  std::string originalDirectory;
  int64_t size = 0;
  std::optional<std::string> mtime;
};

// A freshly scanned file together with its current filesystem metadata.
struct Candidate {
  std::string fullPath;
  std::string relativePath;
  int64_t size;
  std::string mtime;
};

enum class FileStatus { New, Modified, Unchanged, Missing };

struct ClassifiedFile {
  std::string key; // fullOriginalPath
  FileStatus status;
  std::optional<FileRecord> record;
  std::optional<Candidate> candidate;
};

struct ChangeSet {
  std::vector<ClassifiedFile> newFiles;
  std::vector<ClassifiedFile> modified;
  std::vector<ClassifiedFile> unchanged;
  std::vector<ClassifiedFile> missing;
};

} // namespace flatsync
