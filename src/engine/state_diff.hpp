#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace steward {

// List-valued resources are add-only: observed must contain every desired
// element, in any position. Non-array inputs never match.
bool listContainsAll(const nlohmann::json &observed, const nlohmann::json &desired);

// Desired elements absent from existing, in desired order, without duplicates.
nlohmann::json missingEntries(const nlohmann::json &existing, const nlohmann::json &desired);

// Newly required entries first, then every pre-existing entry in its
// original order. Nothing already present is dropped.
nlohmann::json mergeListState(const nlohmann::json &existing, const nlohmann::json &desired);

// Scalar comparison that tolerates "0" vs 0 style config values.
bool scalarEquals(const nlohmann::json &observed, const nlohmann::json &desired);

std::string scalarToString(const nlohmann::json &value);

std::vector<std::string> toStringList(const nlohmann::json &value);

} // namespace steward
