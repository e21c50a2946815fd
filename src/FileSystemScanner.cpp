#include "FileSystemScanner.hpp"
#include "TimeUtils.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#else
#include <sys/stat.h>
#endif

namespace fs = std::filesystem;

namespace flatsync {

FileSystemScanner::FileSystemScanner(PathFilter filter)
    : m_filter(std::move(filter)) {}

FileSystemScanner::~FileSystemScanner() = default;

std::string
FileSystemScanner::normalizePathSeparators(const std::string &path) {
  std::string result = path;
#ifdef _WIN32
  std::replace(result.begin(), result.end(), '\\', '/');
#endif
  return result;
}

std::optional<FileStat> FileSystemScanner::statFile(const std::string &absPath) {
#ifdef _WIN32
  std::error_code ec;
  if (!fs::is_regular_file(absPath, ec))
    return std::nullopt;
  auto size = fs::file_size(absPath, ec);
  if (ec)
    return std::nullopt;
  auto ftime = fs::last_write_time(absPath, ec);
  if (ec)
    return std::nullopt;
  auto now_file = fs::file_time_type::clock::now();
  auto now_sys = std::chrono::system_clock::now();
  auto sys_time =
      now_sys + std::chrono::duration_cast<std::chrono::system_clock::duration>(
                    ftime - now_file);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                    sys_time.time_since_epoch())
                    .count();
  return FileStat{static_cast<int64_t>(size), TimeUtils::toIso(millis)};
#else
  struct stat st;
  if (stat(absPath.c_str(), &st) != 0 || !S_ISREG(st.st_mode))
    return std::nullopt;
#ifdef __APPLE__
  const struct timespec &mtime = st.st_mtimespec;
#else
  const struct timespec &mtime = st.st_mtim;
#endif
  std::int64_t millis = static_cast<std::int64_t>(mtime.tv_sec) * 1000 +
                        mtime.tv_nsec / 1000000;
  return FileStat{static_cast<int64_t>(st.st_size), TimeUtils::toIso(millis)};
#endif
}

std::optional<ScanRoot> FileSystemScanner::classifyPath(const std::string &path) {
  std::error_code ec;
  auto status = fs::status(path, ec);
  if (ec || !fs::exists(status))
    return std::nullopt;
  fs::path absolute = fs::absolute(path, ec);
  if (ec)
    absolute = path;
  absolute = absolute.lexically_normal();
  std::string normalized = absolute.string();
  // lexically_normal keeps a trailing separator on directories
  if (normalized.size() > 1 &&
      (normalized.back() == '/' || normalized.back() == '\\'))
    normalized.pop_back();
  return ScanRoot{normalized, fs::is_directory(status) ? RootKind::Directory
                                                       : RootKind::File};
}

ScanResult FileSystemScanner::scan(const std::vector<ScanRoot> &roots) {
  ScanResult result;
  for (const auto &root : roots) {
    ScanResult partial = scanRoot(root);
    result.files.insert(result.files.end(), partial.files.begin(),
                        partial.files.end());
    result.errors.insert(result.errors.end(), partial.errors.begin(),
                         partial.errors.end());
  }
  return result;
}

ScanResult FileSystemScanner::scanRoot(const ScanRoot &root) {
  ScanResult result;
  if (root.kind == RootKind::File) {
    // Directory exclusions do not apply to an explicitly named file
    fs::path p(root.path);
    std::string name = p.filename().string();
    if (m_filter.acceptsFile(name)) {
      result.files.push_back({root.path, name});
    } else {
      std::cout << "[Scanner] Skipping filtered file: " << root.path
                << std::endl;
    }
    return result;
  }

  walkDirectory(fs::path(root.path), fs::path(), result);
  std::cout << "[Scanner] " << root.path << ": " << result.files.size()
            << " matching files" << std::endl;
  return result;
}

void FileSystemScanner::walkDirectory(const fs::path &dir,
                                      const fs::path &relative,
                                      ScanResult &result) {
  std::vector<fs::directory_entry> entries;
  try {
    for (const auto &entry : fs::directory_iterator(dir)) {
      entries.push_back(entry);
    }
  } catch (const fs::filesystem_error &e) {
    std::cerr << "[Scanner] Cannot read directory: " << dir.string() << " - "
              << e.what() << std::endl;
    result.errors.push_back({dir.string(), e.code().message()});
    return;
  }

  std::sort(entries.begin(), entries.end(),
            [](const fs::directory_entry &a, const fs::directory_entry &b) {
              return a.path().filename().string() <
                     b.path().filename().string();
            });

  for (const auto &entry : entries) {
    const std::string name = entry.path().filename().string();
    std::error_code ec;
    if (entry.is_symlink(ec) && fs::is_directory(entry.path(), ec)) {
      std::cout << "[Scanner] Not following symlinked directory: "
                << entry.path().string() << std::endl;
      continue;
    }
    if (entry.is_directory(ec)) {
      if (m_filter.isDirectoryExcluded(name))
        continue;
      walkDirectory(entry.path(), relative / name, result);
    } else if (entry.is_regular_file(ec)) {
      if (!m_filter.acceptsFile(name))
        continue;
      result.files.push_back(
          {entry.path().string(),
           normalizePathSeparators((relative / name).string())});
    } else if (ec) {
      std::cerr << "[Scanner] Error scanning item: " << entry.path().string()
                << " - " << ec.message() << std::endl;
      result.errors.push_back({entry.path().string(), ec.message()});
    }
  }
}

} // namespace flatsync
