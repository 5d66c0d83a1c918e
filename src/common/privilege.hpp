#pragma once

#include <string>

#include "common/models.hpp"

namespace steward {

/**
 * Inspect the current process: effective uid decides elevation, while the
 * user name and home follow the invoking user when running under sudo.
 */
PrivilegeContext currentPrivilegeContext();

// True for an elevated process started through sudo by a regular user;
// user-level work is then run as that user instead of root.
bool actsForInvokingUser(const PrivilegeContext &context);

// Expands a leading "~" or "~/" against context.home.
std::string expandHome(const std::string &path, const PrivilegeContext &context);

} // namespace steward
