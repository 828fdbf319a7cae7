#pragma once

#include "waypoint/routing/Route.hpp"

#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace waypoint::routing {

class PathMatcher {
public:
    explicit PathMatcher(const Route& route);

    // Values of every placeholder when the whole candidate matches.
    std::optional<Parameters> match(const std::string& candidate) const;
    const std::string& pattern() const { return source_; }

private:
    std::string source_;
    std::regex pattern_;
    // Placeholder identifier and the index of its capturing group.
    std::vector<std::pair<std::string, std::size_t>> groups_;
};

std::string escapeRegex(const std::string& literal);

} // namespace waypoint::routing
