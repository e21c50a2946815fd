#include "StructureFile.hpp"
#include "Project.hpp"
#include <algorithm>
#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;

namespace flatsync {

namespace {

bool startsWith(const std::string &line, const std::string &prefix) {
  return line.compare(0, prefix.size(), prefix) == 0;
}

std::string trim(const std::string &s) {
  const char *ws = " \t\r\n";
  auto begin = s.find_first_not_of(ws);
  if (begin == std::string::npos)
    return "";
  auto end = s.find_last_not_of(ws);
  return s.substr(begin, end - begin + 1);
}

std::string headerValue(const std::string &line, const std::string &marker) {
  return trim(line.substr(marker.size()));
}

std::vector<std::string> splitList(const std::string &value) {
  std::vector<std::string> items;
  std::size_t start = 0;
  while (start <= value.size()) {
    auto pos = value.find(markers::kListDelimiter, start);
    std::string item = trim(value.substr(
        start, pos == std::string::npos ? std::string::npos : pos - start));
    if (!item.empty())
      items.push_back(item);
    if (pos == std::string::npos)
      break;
    start = pos + markers::kListDelimiter.size();
  }
  return items;
}

std::optional<FileRecord> parseMappingLine(const std::string &line) {
  auto pos = line.find(markers::kArrow);
  std::size_t width = markers::kArrow.size();
  if (pos == std::string::npos) {
    pos = line.find(markers::kAsciiArrow);
    width = markers::kAsciiArrow.size();
  }
  if (pos == std::string::npos)
    return std::nullopt;

  std::string original = trim(line.substr(0, pos));
  std::string flattened = trim(line.substr(pos + width));
  if (original.empty() || flattened.empty())
    return std::nullopt;

  FileRecord record;
  record.newPath = flattened;
  fs::path p(original);
  // Relative keys belong to records that never had an absolute source.
  if (!p.is_absolute()) {
    record.originalPath = original;
    return record;
  }
  record.originalPath = p.filename().string();
  record.fullOriginalPath = original;
  record.originalDirectory = p.parent_path().string();
  return record;
}

} // namespace

std::string StructureFile::serialize(const Project &project) {
  std::ostringstream out;
  out << markers::kProject << " " << project.name() << "\n";
  out << markers::kLastUpdated << " " << project.lastUpdated() << "\n";
  out << markers::kSourceDirectories << " ";
  const auto &dirs = project.sourceDirectories();
  for (std::size_t i = 0; i < dirs.size(); ++i) {
    if (i > 0)
      out << markers::kListDelimiter;
    out << dirs[i];
  }
  out << "\n\n";

  out << markers::kFileMapping << " (Original Path" << markers::kArrow
      << "Project Path)\n\n";

  std::vector<const FileRecord *> sorted;
  for (const auto &f : project.files())
    sorted.push_back(&f);
  std::sort(sorted.begin(), sorted.end(),
            [](const FileRecord *a, const FileRecord *b) {
              auto ak = Project::recordKey(*a);
              auto bk = Project::recordKey(*b);
              if (ak != bk)
                return ak < bk;
              return a->newPath < b->newPath;
            });
  for (const auto *f : sorted) {
    out << Project::recordKey(*f) << markers::kArrow << f->newPath << "\n";
  }

  const std::string &structure = project.directoryStructure();
  if (!structure.empty()) {
    out << "\n" << markers::kDirectoryStructure << "\n\n" << structure;
    if (structure.back() != '\n')
      out << "\n";
  }
  return out.str();
}

ParsedStructure StructureFile::parse(const std::string &content) {
  ParsedStructure parsed;
  State state = State::Header;

  std::size_t offset = 0;
  while (offset < content.size() && state != State::Structure) {
    auto newline = content.find('\n', offset);
    std::size_t next =
        newline == std::string::npos ? content.size() : newline + 1;
    std::string line = content.substr(offset, next - offset);
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
      line.pop_back();
    offset = next;

    if (startsWith(line, markers::kDirectoryStructure)) {
      state = State::Structure;
      std::string rest = content.substr(offset);
      // One blank separator line follows the marker
      if (startsWith(rest, "\r\n"))
        rest.erase(0, 2);
      else if (startsWith(rest, "\n"))
        rest.erase(0, 1);
      parsed.directoryStructure = rest;
      break;
    }
    if (startsWith(line, markers::kSourceDirectories)) {
      parsed.sourceDirectories =
          splitList(headerValue(line, markers::kSourceDirectories));
      continue;
    }
    if (startsWith(line, markers::kFileMapping)) {
      state = State::Mapping;
      continue;
    }

    switch (state) {
    case State::Header:
      if (startsWith(line, markers::kProject))
        parsed.name = headerValue(line, markers::kProject);
      else if (startsWith(line, markers::kLastUpdated))
        parsed.lastUpdated = headerValue(line, markers::kLastUpdated);
      break;
    case State::Mapping:
      if (auto record = parseMappingLine(line))
        parsed.files.push_back(*record);
      break;
    case State::Structure:
      break;
    }
  }
  return parsed;
}

std::optional<std::string>
StructureFile::peekLastUpdated(const std::string &content) {
  std::istringstream in(content);
  std::string line;
  while (std::getline(in, line)) {
    if (startsWith(line, markers::kLastUpdated))
      return headerValue(line, markers::kLastUpdated);
    if (startsWith(line, markers::kFileMapping) ||
        startsWith(line, markers::kDirectoryStructure))
      break;
  }
  return std::nullopt;
}

} // namespace flatsync
