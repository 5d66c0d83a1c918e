#pragma once

#include <nlohmann/json.hpp>

namespace steward {

// Built-in "headless-mac" profile: prepares a Mac for unattended, always-on
// operation reachable over Tailscale. Same document shape as a config file.
nlohmann::json defaultProfile();

constexpr const char *kDefaultProfileName = "headless-mac";

} // namespace steward
