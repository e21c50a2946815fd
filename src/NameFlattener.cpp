#include "NameFlattener.hpp"
#include <algorithm>
#include <filesystem>
#include <picosha2.h>
#include <vector>

namespace fs = std::filesystem;

namespace flatsync {

std::string NameFlattener::flatten(const std::string &relativePath) {
  std::string result = relativePath;
  std::replace_if(
      result.begin(), result.end(),
      [](char c) { return c == '/' || c == '\\'; }, '_');
  return result;
}

std::string NameFlattener::shortDigest(const std::string &text) {
  std::vector<unsigned char> hash(picosha2::k_digest_size);
  picosha2::hash256(text.begin(), text.end(), hash.begin(), hash.end());
  return picosha2::bytes_to_hex_string(hash.begin(), hash.end()).substr(0, 8);
}

std::string NameFlattener::disambiguate(const std::string &flattenedName,
                                        const std::string &fullOriginalPath) {
  const std::string suffix = "~" + shortDigest(fullOriginalPath);
  std::string ext = fs::path(flattenedName).extension().string();
  if (ext.empty())
    return flattenedName + suffix;
  return flattenedName.substr(0, flattenedName.size() - ext.size()) + suffix +
         ext;
}

} // namespace flatsync
