#include "DirectoryStructure.hpp"
#include "Project.hpp"
#include <algorithm>
#include <filesystem>
#include <map>
#include <sstream>

namespace fs = std::filesystem;

namespace flatsync {

namespace {

std::string baseName(const std::string &path) {
  return fs::path(path).filename().string();
}

} // namespace

std::vector<std::pair<std::string, std::size_t>>
DirectoryStructure::extensionHistogram(const std::vector<FileRecord> &files) {
  std::map<std::string, std::size_t> counts;
  for (const auto &f : files) {
    counts[fs::path(f.originalPath).extension().string()]++;
  }
  std::vector<std::pair<std::string, std::size_t>> sorted(counts.begin(),
                                                          counts.end());
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const auto &a, const auto &b) { return a.second > b.second; });
  return sorted;
}

std::string
DirectoryStructure::render(const std::vector<FileRecord> &files,
                           const std::vector<std::string> &sourceDirectories) {
  std::ostringstream out;
  out << "# Project Structure and File Mapping\n\n";

  // Part 1: original layout, grouped by directory
  out << "## Original Directory Structure\n\n";
  if (!sourceDirectories.empty()) {
    out << "Source directories:\n";
    for (const auto &dir : sourceDirectories)
      out << "- " << dir << "\n";
    out << "\n";
  }

  std::map<std::string, std::vector<const FileRecord *>> byDirectory;
  for (const auto &f : files) {
    if (f.originalDirectory.empty())
      continue;
    byDirectory[f.originalDirectory].push_back(&f);
  }
  for (auto &[dir, group] : byDirectory) {
    std::sort(group.begin(), group.end(),
              [](const FileRecord *a, const FileRecord *b) {
                auto an = baseName(a->originalPath);
                auto bn = baseName(b->originalPath);
                if (an != bn)
                  return an < bn;
                return a->newPath < b->newPath;
              });
    out << "### " << dir << "\n\n";
    for (const auto *f : group)
      out << "- " << baseName(f->originalPath) << "\n";
    out << "\n";
  }

  // Part 2: storage note
  out << "## Project Files (Flattened Structure)\n\n";
  out << "All files are stored with flattened names in the project "
         "directory.\n\n";

  // Part 3: mapping table
  std::vector<const FileRecord *> sorted;
  sorted.reserve(files.size());
  for (const auto &f : files)
    sorted.push_back(&f);
  std::sort(sorted.begin(), sorted.end(),
            [](const FileRecord *a, const FileRecord *b) {
              auto ak = Project::recordKey(*a);
              auto bk = Project::recordKey(*b);
              if (ak != bk)
                return ak < bk;
              return a->newPath < b->newPath;
            });

  out << "## File Mapping\n\n";
  out << "Original Path → Project Path\n\n";
  for (const auto *f : sorted) {
    out << "- `" << Project::recordKey(*f) << "` → `" << f->newPath
        << "`\n";
  }

  // Part 4: the same mapping, for consumers that quote paths back
  out << "\n## Path Reference\n\n";
  out << "IMPORTANT: When referring to files, ALWAYS use the original file "
         "paths (left side) instead of the flattened names (right side).\n";
  out << "Reference files by their original location in the project "
         "structure, e.g. \"src/containers/UserProfile.tsx\" rather than "
         "\"src_containers_UserProfile.tsx\".\n\n";
  out << "Path reference:\n";
  for (const auto *f : sorted) {
    out << f->originalPath << " -> " << f->newPath << "\n";
  }

  // Part 5: statistics
  out << "\n## File Statistics\n\n";
  out << "Total files: " << files.size() << "\n\n";
  out << "Files by extension:\n";
  for (const auto &[ext, count] : extensionHistogram(files)) {
    out << "- " << (ext.empty() ? "(no extension)" : ext) << ": " << count
        << "\n";
  }

  return out.str();
}

} // namespace flatsync
