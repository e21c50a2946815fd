#include "DatabaseManager.hpp"
#include <filesystem>
#include <iostream>
#include <sqlite3.h>
#include <sqlite_orm/sqlite_orm.h>

using namespace sqlite_orm;

namespace flatsync {

struct ProjectRow {
  std::string name;
  std::string createdAt;
  std::string lastUpdated;
};

struct SourceDirectoryRow {
  int64_t position;
  std::string path;
};

struct FileRow {
  int64_t id;
  std::string originalPath;
  std::string fullOriginalPath;
  std::string newPath;
  std::string originalDirectory;
  int64_t size;
  std::optional<std::string> mtime;
};

// Helper to deduce the storage type.
inline auto create_storage_impl(const std::string &path) {
  return make_storage(
      path,
      make_table<ProjectRow>(
          "Project", make_column("name", &ProjectRow::name, primary_key()),
          make_column("createdAt", &ProjectRow::createdAt),
          make_column("lastUpdated", &ProjectRow::lastUpdated)),
      make_table<SourceDirectoryRow>(
          "SourceDirectory",
          make_column("position", &SourceDirectoryRow::position,
                      primary_key()),
          make_column("path", &SourceDirectoryRow::path)),
      make_table<FileRow>(
          "File",
          make_column("id", &FileRow::id, primary_key().autoincrement()),
          make_column("originalPath", &FileRow::originalPath),
          make_column("fullOriginalPath", &FileRow::fullOriginalPath),
          make_column("newPath", &FileRow::newPath),
          make_column("originalDirectory", &FileRow::originalDirectory),
          make_column("size", &FileRow::size),
          make_column("mtime", &FileRow::mtime)));
}

using Storage = decltype(create_storage_impl(""));

struct DatabaseManager::Impl {
  Storage storage;
  Impl(const std::string &path) : storage(create_storage_impl(path)) {}
};

DatabaseManager::DatabaseManager(const std::string &dbPath)
    : m_dbPath(dbPath), m_impl(std::make_unique<Impl>(dbPath)) {}

DatabaseManager::~DatabaseManager() = default;

bool DatabaseManager::exists() const {
  std::error_code ec;
  return std::filesystem::is_regular_file(m_dbPath, ec);
}

void DatabaseManager::initializeSchema() { m_impl->storage.sync_schema(); }

std::optional<Project> DatabaseManager::loadProject() {
  if (!exists())
    return std::nullopt;
  try {
    auto projects = m_impl->storage.get_all<ProjectRow>();
    if (projects.size() != 1) {
      std::cerr << "[Cache] Expected one project row in " << m_dbPath
                << ", found " << projects.size() << std::endl;
      return std::nullopt;
    }
    const ProjectRow &row = projects.front();
    Project project(row.name);
    project.setTimestamps(row.createdAt, row.lastUpdated);

    for (const auto &dir : m_impl->storage.get_all<SourceDirectoryRow>(
             order_by(&SourceDirectoryRow::position))) {
      project.addSourceDirectory(dir.path);
    }

    std::vector<FileRecord> files;
    for (const auto &f :
         m_impl->storage.get_all<FileRow>(order_by(&FileRow::id))) {
      files.push_back({f.originalPath, f.fullOriginalPath, f.newPath,
                       f.originalDirectory, f.size, f.mtime});
    }
    project.addFiles(files);
    return project;
  } catch (const std::exception &e) {
    std::cerr << "[Cache] Unreadable cache " << m_dbPath << ": " << e.what()
              << std::endl;
    return std::nullopt;
  }
}

bool DatabaseManager::storeProject(const Project &project) {
  try {
    initializeSchema();
    m_impl->storage.transaction([&] {
      m_impl->storage.remove_all<FileRow>();
      m_impl->storage.remove_all<SourceDirectoryRow>();
      m_impl->storage.remove_all<ProjectRow>();

      m_impl->storage.replace(ProjectRow{project.name(), project.createdAt(),
                                         project.lastUpdated()});
      int64_t position = 0;
      for (const auto &dir : project.sourceDirectories()) {
        m_impl->storage.replace(SourceDirectoryRow{position++, dir});
      }
      for (const auto &f : project.files()) {
        m_impl->storage.insert(FileRow{0, f.originalPath, f.fullOriginalPath,
                                       f.newPath, f.originalDirectory, f.size,
                                       f.mtime});
      }
      return true;
    });
    return true;
  } catch (const std::exception &e) {
    std::cerr << "[Cache] storeProject Error: " << e.what() << std::endl;
    return false;
  }
}

} // namespace flatsync
