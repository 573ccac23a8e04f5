/**
 * @file blob_types.cpp
 * @brief Implementation of blob tier type helpers
 */

#include <blobtier/core/blob_types.hpp>

#include <algorithm>
#include <cctype>

namespace blobtier {

namespace {

auto to_lower(std::string_view str) -> std::string {
    std::string lower(str);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

}  // namespace

auto access_tier_from_string(std::string_view str) -> std::optional<access_tier> {
    auto lower = to_lower(str);
    if (lower == "hot") {
        return access_tier::hot;
    }
    if (lower == "cool") {
        return access_tier::cool;
    }
    if (lower == "cold") {
        return access_tier::cold;
    }
    if (lower == "archive") {
        return access_tier::archive;
    }
    return std::nullopt;
}

auto rehydrate_priority_from_string(std::string_view str)
    -> std::optional<rehydrate_priority> {
    auto lower = to_lower(str);
    if (lower == "standard") {
        return rehydrate_priority::standard;
    }
    if (lower == "high") {
        return rehydrate_priority::high;
    }
    return std::nullopt;
}

auto blob_record::display_name() const -> std::string {
    std::string result = container + "/" + name;
    if (version_id.has_value() && !version_id->empty()) {
        result += "@" + *version_id;
    }
    return result;
}

}  // namespace blobtier
