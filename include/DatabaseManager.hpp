#pragma once
#include "Project.hpp"
#include <memory>
#include <optional>
#include <string>

namespace flatsync {

/**
 * DatabaseManager is the cache tier of a workspace: one SQLite file holding
 * the project row, its ordered source directories and every FileRecord.
 * Reads never create the database; a missing or unreadable file yields
 * nullopt.
 */
class DatabaseManager {
public:
  explicit DatabaseManager(const std::string &dbPath);
  ~DatabaseManager();

  bool exists() const;
  void initializeSchema();

  std::optional<Project> loadProject();
  // Replaces the whole cached record in one transaction.
  bool storeProject(const Project &project);

private:
  std::string m_dbPath;
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace flatsync
