#include "treefleet/time.hpp"

#include <cstdio>

namespace treefleet::timeutil {

int local_utc_offset_minutes(std::time_t t) {
  std::tm lt{}, gt{};
  localtime_r(&t, &lt);
  gmtime_r(&t, &gt);
  lt.tm_isdst = 0;
  gt.tm_isdst = 0;
  const std::time_t local_epoch = timegm(&lt);
  const std::time_t utc_epoch = timegm(&gt);
  return static_cast<int>((local_epoch - utc_epoch) / 60);
}

std::string tz_offset_string(int minutes) {
  char buf[8];
  const char sign = minutes >= 0 ? '+' : '-';
  const int m = minutes >= 0 ? minutes : -minutes;
  std::snprintf(buf, sizeof(buf), "%c%02d%02d", sign, m / 60, m % 60);
  return std::string(buf);
}

std::string make_signature(const Identity &id, std::time_t when, int tz_minutes) {
  return id.name + " <" + id.email + "> " + std::to_string(static_cast<long long>(when)) + " " +
         tz_offset_string(tz_minutes);
}

std::string signature_now(const Identity &id) {
  const std::time_t now = std::time(nullptr);
  return make_signature(id, now, local_utc_offset_minutes(now));
}

} // namespace treefleet::timeutil
