#pragma once
#include <optional>
#include <string>

namespace flatsync {

/**
 * Boundary to an external text generator (e.g. an AI service) that turns the
 * rendered directory structure into free-form instructions. nullopt means the
 * generator failed or had nothing to say.
 */
class InstructionGenerator {
public:
  virtual ~InstructionGenerator() = default;
  virtual std::optional<std::string>
  generate(const std::string &projectName,
           const std::string &directoryStructure) = 0;
};

} // namespace flatsync
