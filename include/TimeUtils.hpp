#ifndef TIMEUTILS_HPP
#define TIMEUTILS_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace flatsync {

class TimeUtils {
public:
  static std::int64_t nowMillis();
  static std::string nowIso();
  // Formats as YYYY-MM-DDTHH:MM:SS.mmmZ
  static std::string toIso(std::int64_t epochMillis);
  // Accepts the format above, with or without the millisecond part.
  static std::optional<std::int64_t> parseIso(const std::string &iso);
};

} // namespace flatsync

#endif // TIMEUTILS_HPP
