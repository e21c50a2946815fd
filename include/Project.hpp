#ifndef PROJECT_HPP
#define PROJECT_HPP

#include "types.hpp"
#include <map>
#include <string>
#include <vector>

namespace flatsync {

/**
 * Project is one named workspace: the recorded files, the registered source
 * directories and the derived text views. Files are only mutated through
 * addFiles / updateFileMetadata.
 */
class Project {
public:
  explicit Project(std::string name);

  const std::string &name() const { return m_name; }
  const std::string &createdAt() const { return m_createdAt; }
  const std::string &lastUpdated() const { return m_lastUpdated; }
  const std::vector<FileRecord> &files() const { return m_files; }
  const std::vector<std::string> &sourceDirectories() const {
    return m_sourceDirectories;
  }
  const std::string &directoryStructure() const {
    return m_directoryStructure;
  }
  const std::string &instructions() const { return m_instructions; }

  // Inserts records, replacing any record with the same key.
  void addFiles(const std::vector<FileRecord> &files);
  // Appends unless already registered.
  void addSourceDirectory(const std::string &directory);
  bool removeSourceDirectory(const std::string &directory);
  void setDirectoryStructure(std::string structure);
  void setInstructions(std::string instructions);

  // Overwrite in place after a re-copy; newPath is never changed.
  bool updateFileMetadata(const std::string &key, int64_t size,
                          const std::string &mtime);

  const FileRecord *findFile(const std::string &key) const;
  // Records that carry a fullOriginalPath, keyed by it.
  std::map<std::string, FileRecord> recordsByOriginalPath() const;

  void setTimestamps(std::string createdAt, std::string lastUpdated);
  void touch();

  static std::string recordKey(const FileRecord &record);

private:
  std::string m_name;
  std::string m_createdAt;
  std::string m_lastUpdated;
  std::vector<FileRecord> m_files;
  // recordKey -> position in m_files
  std::map<std::string, std::size_t> m_index;
  std::vector<std::string> m_sourceDirectories;
  std::string m_directoryStructure;
  std::string m_instructions;
};

} // namespace flatsync

#endif // PROJECT_HPP
