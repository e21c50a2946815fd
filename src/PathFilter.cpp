#include "PathFilter.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace flatsync {

PathFilter::PathFilter(FilterConfig config) : m_config(std::move(config)) {
  auto normalizeAll = [](std::vector<std::string> &exts) {
    for (auto &e : exts)
      e = normalizeExtension(e);
  };
  if (m_config.includeExtensions)
    normalizeAll(*m_config.includeExtensions);
  normalizeAll(m_config.excludeExtensions);
}

std::string PathFilter::normalizeExtension(const std::string &extension) {
  std::string result = extension;
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (!result.empty() && result.front() != '.')
    result.insert(result.begin(), '.');
  return result;
}

std::string PathFilter::extensionOf(const std::string &fileName) {
  return normalizeExtension(fs::path(fileName).extension().string());
}

bool PathFilter::isDirectoryExcluded(const std::string &dirName) const {
  return std::any_of(
      m_config.excludeDirNames.begin(), m_config.excludeDirNames.end(),
      [&](const std::string &excluded) {
        if (excluded.empty())
          return false;
        if (dirName == excluded)
          return true;
        // Prefix form ("vendor/") for namespaced folders
        if (dirName.size() > excluded.size() &&
            dirName.compare(0, excluded.size(), excluded) == 0) {
          char next = dirName[excluded.size()];
          return next == '/' || next == '\\';
        }
        return false;
      });
}

bool PathFilter::acceptsExtension(const std::string &extension) const {
  const std::string ext = normalizeExtension(extension);
  const auto &excluded = m_config.excludeExtensions;
  if (std::find(excluded.begin(), excluded.end(), ext) != excluded.end())
    return false;
  if (!m_config.includeExtensions)
    return true;
  const auto &included = *m_config.includeExtensions;
  return std::find(included.begin(), included.end(), ext) != included.end();
}

bool PathFilter::acceptsFile(const std::string &fileName) const {
  return acceptsExtension(extensionOf(fileName));
}

} // namespace flatsync
