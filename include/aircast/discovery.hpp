// discovery.hpp
// mDNS browsing for receivers advertising _airplay._tcp. Only built when the
// Avahi client library is available (AIRCAST_HAVE_AVAHI).
#pragma once

#include "aircast/device.hpp"

#include <chrono>
#include <vector>

namespace aircast {

// Browse for `timeout` and return every receiver resolved to an IPv4
// address. With `fast`, return as soon as the first one resolves.
// Throws ConnectionError when the Avahi daemon cannot be reached.
std::vector<Device> discover_devices(std::chrono::milliseconds timeout, bool fast = false);

} // namespace aircast
