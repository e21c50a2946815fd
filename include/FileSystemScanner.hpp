#ifndef FILESYSTEMSCANNER_HPP
#define FILESYSTEMSCANNER_HPP

#include "PathFilter.hpp"
#include "types.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace flatsync {

/**
 * FileSystemScanner walks file and directory roots depth-first, in lexical
 * order per directory level, and emits (absolute, root-relative) pairs for
 * every file the filter accepts. Excluded directories are pruned and
 * symlinked directories are not followed.
 */
class FileSystemScanner {
public:
  explicit FileSystemScanner(PathFilter filter);
  ~FileSystemScanner();

  ScanResult scan(const std::vector<ScanRoot> &roots);
  ScanResult scanRoot(const ScanRoot &root);

  // Current size and modification time, or nullopt if the path is gone.
  static std::optional<FileStat> statFile(const std::string &absPath);
  // Stats a user-supplied path and tags it; nullopt when it does not exist.
  static std::optional<ScanRoot> classifyPath(const std::string &path);

  const PathFilter &filter() const { return m_filter; }

private:
  PathFilter m_filter;
  void walkDirectory(const std::filesystem::path &dir,
                     const std::filesystem::path &relative,
                     ScanResult &result);
  std::string normalizePathSeparators(const std::string &path);
};

} // namespace flatsync

#endif // FILESYSTEMSCANNER_HPP
