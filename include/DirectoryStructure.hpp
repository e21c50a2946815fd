#ifndef DIRECTORYSTRUCTURE_HPP
#define DIRECTORYSTRUCTURE_HPP

#include "types.hpp"
#include <string>
#include <utility>
#include <vector>

namespace flatsync {

/**
 * Renders the human-readable directory-structure view of a workspace:
 * files grouped by original directory, the flattened-storage note, the
 * original -> flattened mapping (twice, the second copy annotated for
 * downstream readers) and per-extension statistics.
 * The output depends only on the inputs, so re-rendering unchanged data is
 * byte-identical.
 */
class DirectoryStructure {
public:
  static std::string render(const std::vector<FileRecord> &files,
                            const std::vector<std::string> &sourceDirectories);

  // Extension counts, most frequent first, ties broken by extension.
  static std::vector<std::pair<std::string, std::size_t>>
  extensionHistogram(const std::vector<FileRecord> &files);
};

} // namespace flatsync

#endif // DIRECTORYSTRUCTURE_HPP
