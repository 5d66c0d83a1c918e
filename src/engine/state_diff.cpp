#include "engine/state_diff.hpp"

#include <algorithm>

namespace steward {

namespace {

bool arrayContains(const nlohmann::json &array, const nlohmann::json &value)
{
    return std::find(array.begin(), array.end(), value) != array.end();
}

} // namespace

bool listContainsAll(const nlohmann::json &observed, const nlohmann::json &desired)
{
    if (!observed.is_array() || !desired.is_array()) {
        return false;
    }
    for (const auto &entry : desired) {
        if (!arrayContains(observed, entry)) {
            return false;
        }
    }
    return true;
}

nlohmann::json missingEntries(const nlohmann::json &existing, const nlohmann::json &desired)
{
    nlohmann::json missing = nlohmann::json::array();
    if (!desired.is_array()) {
        return missing;
    }
    const nlohmann::json present = existing.is_array() ? existing : nlohmann::json::array();
    for (const auto &entry : desired) {
        if (!arrayContains(present, entry) && !arrayContains(missing, entry)) {
            missing.push_back(entry);
        }
    }
    return missing;
}

nlohmann::json mergeListState(const nlohmann::json &existing, const nlohmann::json &desired)
{
    nlohmann::json merged = missingEntries(existing, desired);
    if (existing.is_array()) {
        for (const auto &entry : existing) {
            merged.push_back(entry);
        }
    }
    return merged;
}

std::string scalarToString(const nlohmann::json &value)
{
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? "on" : "off";
    }
    if (value.is_null()) {
        return {};
    }
    return value.dump();
}

bool scalarEquals(const nlohmann::json &observed, const nlohmann::json &desired)
{
    if (observed.is_structured() || desired.is_structured()) {
        return observed == desired;
    }
    if (observed.is_null() || desired.is_null()) {
        return observed.is_null() && desired.is_null();
    }
    return scalarToString(observed) == scalarToString(desired);
}

std::vector<std::string> toStringList(const nlohmann::json &value)
{
    std::vector<std::string> out;
    if (!value.is_array()) {
        return out;
    }
    for (const auto &entry : value) {
        out.push_back(scalarToString(entry));
    }
    return out;
}

} // namespace steward
