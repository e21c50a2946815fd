#ifndef PATHFILTER_HPP
#define PATHFILTER_HPP

#include "types.hpp"
#include <string>

namespace flatsync {

/**
 * PathFilter decides which directories are descended into and which files are
 * accepted during a scan. Extensions are compared case-insensitively and
 * include the leading dot ("" for extensionless files).
 */
class PathFilter {
public:
  explicit PathFilter(FilterConfig config);

  // True when a directory with this base name must not be descended into.
  bool isDirectoryExcluded(const std::string &dirName) const;
  bool acceptsFile(const std::string &fileName) const;
  bool acceptsExtension(const std::string &extension) const;

  const FilterConfig &config() const { return m_config; }

  static std::string extensionOf(const std::string &fileName);
  static std::string normalizeExtension(const std::string &extension);

private:
  FilterConfig m_config;
};

} // namespace flatsync

#endif // PATHFILTER_HPP
