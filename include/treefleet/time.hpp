#pragma once
#include "treefleet/config.hpp"

#include <ctime>
#include <string>

namespace treefleet::timeutil {

// Minutes east of UTC for the local timezone at `time`.
auto local_utc_offset_minutes(std::time_t time) -> int;

// +180 -> "+0300", -420 -> "-0700"
auto tz_offset_string(int minutes) -> std::string;

// "Name <email> 1714412345 +0300"
auto make_signature(const Identity& identity, std::time_t when, int tz_minutes) -> std::string;

// Signature stamped with the current time.
auto signature_now(const Identity& identity) -> std::string;

} // namespace treefleet::timeutil
