/**
 * @file common.cpp
 * @brief Provider tag parsing
 */

#include "geo_estimator/common.hpp"
#include <algorithm>
#include <cctype>

namespace geo_estimator {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

std::optional<PanoramaProviderKind> parseProviderKind(const std::string& name) {
    std::string lower = toLower(name);
    if (lower == "google") return PanoramaProviderKind::GOOGLE;
    if (lower == "mapillary") return PanoramaProviderKind::MAPILLARY;
    return std::nullopt;
}

std::vector<std::string> normalizeProviderPriority(const std::vector<std::string>& providers) {
    std::vector<std::string> normalized;
    for (const auto& provider : providers) {
        auto kind = parseProviderKind(provider);
        if (!kind) {
            continue;
        }
        std::string tag = toString(*kind);
        if (std::find(normalized.begin(), normalized.end(), tag) == normalized.end()) {
            normalized.push_back(tag);
        }
    }
    return normalized;
}

} // namespace geo_estimator
