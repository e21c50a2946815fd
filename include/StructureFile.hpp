#ifndef STRUCTUREFILE_HPP
#define STRUCTUREFILE_HPP

#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace flatsync {

class Project;

// Line markers of the durable text format (structure.txt).
namespace markers {
inline const std::string kProject = "# Project:";
inline const std::string kLastUpdated = "# Last Updated:";
inline const std::string kSourceDirectories = "# Source Directories:";
inline const std::string kFileMapping = "# File Mapping";
inline const std::string kDirectoryStructure = "# Directory Structure";
inline const std::string kArrow = " \xE2\x86\x92 "; // " → "
inline const std::string kAsciiArrow = " -> ";
inline const std::string kListDelimiter = ", ";
} // namespace markers

struct ParsedStructure {
  std::optional<std::string> name;
  std::optional<std::string> lastUpdated;
  std::vector<std::string> sourceDirectories;
  std::vector<FileRecord> files;
  std::string directoryStructure;
};

/**
 * Serializer and line-oriented parser for the durable text tier.
 *
 * The parser is a three-state machine:
 *   Header    -> Mapping    on a "# File Mapping" line
 *   Header    -> Structure  on a "# Directory Structure" line
 *   Mapping   -> Structure  on a "# Directory Structure" line
 * In Mapping, lines holding the arrow become partial FileRecords. Everything
 * after the structure marker is taken verbatim. "# Source Directories:" is
 * honoured in Header and Mapping. Empty or truncated input never throws.
 */
class StructureFile {
public:
  enum class State { Header, Mapping, Structure };

  static std::string serialize(const Project &project);
  static ParsedStructure parse(const std::string &content);

  // Reads only the "# Last Updated:" header line of a document.
  static std::optional<std::string>
  peekLastUpdated(const std::string &content);
};

} // namespace flatsync

#endif // STRUCTUREFILE_HPP
