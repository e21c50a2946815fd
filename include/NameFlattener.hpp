#ifndef NAMEFLATTENER_HPP
#define NAMEFLATTENER_HPP

#include <string>

namespace flatsync {

class NameFlattener {
public:
  // Replaces every path separator with '_'. Never fails and does not try to
  // make the result unique.
  static std::string flatten(const std::string &relativePath);

  // Inserts "~<digest>" before the extension of a flattened name, the digest
  // being the first 8 hex chars of SHA-256(fullOriginalPath).
  static std::string disambiguate(const std::string &flattenedName,
                                  const std::string &fullOriginalPath);

  static std::string shortDigest(const std::string &text);
};

} // namespace flatsync

#endif // NAMEFLATTENER_HPP
