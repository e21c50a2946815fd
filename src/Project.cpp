#include "Project.hpp"
#include "TimeUtils.hpp"
#include <algorithm>

namespace flatsync {

Project::Project(std::string name) : m_name(std::move(name)) {
  m_createdAt = m_lastUpdated = TimeUtils::nowIso();
}

std::string Project::recordKey(const FileRecord &record) {
  return record.fullOriginalPath.empty() ? record.originalPath
                                         : record.fullOriginalPath;
}

void Project::addFiles(const std::vector<FileRecord> &files) {
  for (const auto &file : files) {
    auto inserted = m_index.emplace(recordKey(file), m_files.size());
    if (inserted.second)
      m_files.push_back(file);
    else
      m_files[inserted.first->second] = file;
  }
}

void Project::addSourceDirectory(const std::string &directory) {
  if (std::find(m_sourceDirectories.begin(), m_sourceDirectories.end(),
                directory) == m_sourceDirectories.end()) {
    m_sourceDirectories.push_back(directory);
  }
}

bool Project::removeSourceDirectory(const std::string &directory) {
  auto it = std::find(m_sourceDirectories.begin(), m_sourceDirectories.end(),
                      directory);
  if (it == m_sourceDirectories.end())
    return false;
  m_sourceDirectories.erase(it);
  return true;
}

void Project::setDirectoryStructure(std::string structure) {
  m_directoryStructure = std::move(structure);
}

void Project::setInstructions(std::string instructions) {
  m_instructions = std::move(instructions);
}

bool Project::updateFileMetadata(const std::string &key, int64_t size,
                                 const std::string &mtime) {
  auto it = m_index.find(key);
  if (it == m_index.end())
    return false;
  FileRecord &record = m_files[it->second];
  record.size = size;
  record.mtime = mtime;
  return true;
}

const FileRecord *Project::findFile(const std::string &key) const {
  auto it = m_index.find(key);
  return it == m_index.end() ? nullptr : &m_files[it->second];
}

std::map<std::string, FileRecord> Project::recordsByOriginalPath() const {
  std::map<std::string, FileRecord> byPath;
  for (const auto &f : m_files) {
    if (!f.fullOriginalPath.empty())
      byPath[f.fullOriginalPath] = f;
  }
  return byPath;
}

void Project::setTimestamps(std::string createdAt, std::string lastUpdated) {
  m_createdAt = std::move(createdAt);
  m_lastUpdated = std::move(lastUpdated);
}

void Project::touch() { m_lastUpdated = TimeUtils::nowIso(); }

} // namespace flatsync
