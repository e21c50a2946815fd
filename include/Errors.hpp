#pragma once

#include <stdexcept>
#include <string>

namespace flatsync {

/**
 * Raised when a caller-supplied input makes the requested operation
 * impossible (missing root path, invalid workspace name, ...).
 */
class PreconditionError : public std::runtime_error {
public:
  explicit PreconditionError(const std::string &what)
      : std::runtime_error(what) {}
};

} // namespace flatsync
