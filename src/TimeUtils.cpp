#include "TimeUtils.hpp"
#include <chrono>
#include <cstdio>

namespace flatsync {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date.
std::int64_t daysFromCivil(std::int64_t y, unsigned m, unsigned d) {
  y -= m <= 2;
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

void civilFromDays(std::int64_t z, std::int64_t &y, unsigned &m,
                   unsigned &d) {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  d = doy - (153 * mp + 2) / 5 + 1;
  m = mp < 10 ? mp + 3 : mp - 9;
  y = static_cast<std::int64_t>(yoe) + era * 400 + (m <= 2);
}

} // namespace

std::int64_t TimeUtils::nowMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::string TimeUtils::nowIso() { return toIso(nowMillis()); }

std::string TimeUtils::toIso(std::int64_t epochMillis) {
  std::int64_t days = epochMillis / 86400000;
  std::int64_t rem = epochMillis % 86400000;
  if (rem < 0) {
    rem += 86400000;
    days -= 1;
  }
  std::int64_t year;
  unsigned month, day;
  civilFromDays(days, year, month, day);

  const int hours = static_cast<int>(rem / 3600000);
  const int minutes = static_cast<int>((rem / 60000) % 60);
  const int seconds = static_cast<int>((rem / 1000) % 60);
  const int millis = static_cast<int>(rem % 1000);

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02d:%02d:%02d.%03dZ",
                static_cast<long long>(year), month, day, hours, minutes,
                seconds, millis);
  return buf;
}

std::optional<std::int64_t> TimeUtils::parseIso(const std::string &iso) {
  int year = 0;
  unsigned month = 0, day = 0, hours = 0, minutes = 0, seconds = 0;
  int consumed = 0;
  if (std::sscanf(iso.c_str(), "%4d-%2u-%2uT%2u:%2u:%2u%n", &year, &month,
                  &day, &hours, &minutes, &seconds, &consumed) != 6)
    return std::nullopt;
  if (month < 1 || month > 12 || day < 1 || day > 31 || hours > 23 ||
      minutes > 59 || seconds > 60)
    return std::nullopt;

  std::int64_t millis = 0;
  std::size_t pos = static_cast<std::size_t>(consumed);
  if (pos < iso.size() && iso[pos] == '.') {
    ++pos;
    int digits = 0;
    while (pos < iso.size() && iso[pos] >= '0' && iso[pos] <= '9') {
      if (digits < 3)
        millis = millis * 10 + (iso[pos] - '0');
      ++digits;
      ++pos;
    }
    if (digits == 0)
      return std::nullopt;
    for (; digits < 3; ++digits)
      millis *= 10;
  }
  if (pos < iso.size() && iso[pos] == 'Z')
    ++pos;
  if (pos != iso.size())
    return std::nullopt;

  const std::int64_t days = daysFromCivil(year, month, day);
  return days * 86400000 + static_cast<std::int64_t>(hours) * 3600000 +
         static_cast<std::int64_t>(minutes) * 60000 +
         static_cast<std::int64_t>(seconds) * 1000 + millis;
}

} // namespace flatsync
