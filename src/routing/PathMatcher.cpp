#include "waypoint/routing/PathMatcher.hpp"

#include "waypoint/routing/RoutingError.hpp"

#include <cstring>
#include <sstream>

namespace waypoint::routing {

std::string escapeRegex(const std::string& literal) {
    static constexpr const char* kSpecial = "\\^$.|?*+()[]{}";
    std::string escaped;
    escaped.reserve(literal.size() * 2);
    for (char c : literal) {
        if (c != '\0' && std::strchr(kSpecial, c) != nullptr) {
            escaped.push_back('\\');
        }
        escaped.push_back(c);
    }
    return escaped;
}

PathMatcher::PathMatcher(const Route& route) {
    std::ostringstream regexBuilder;
    std::size_t group = 1;
    for (const auto& segment : route.pathTemplate().segments()) {
        if (segment.kind == PathSegment::Kind::literal) {
            regexBuilder << escapeRegex(segment.text);
            continue;
        }
        regexBuilder << '(' << route.placeholderPattern(segment.text) << ')';
        groups_.emplace_back(segment.text, group);
        group += 1 + route.placeholderGroupCount(segment.text);
    }
    source_ = regexBuilder.str();

    // Requirements were validated one by one, but their concatenation is
    // compiled here for the first time.
    try {
        pattern_ = std::regex(source_, std::regex::ECMAScript);
    } catch (const std::regex_error& ex) {
        throw RoutingError::invalidRoutePattern(route.name(), source_, ex.what());
    }
}

std::optional<Parameters> PathMatcher::match(const std::string& candidate) const {
    std::smatch match;
    if (!std::regex_match(candidate, match, pattern_)) {
        return std::nullopt;
    }
    Parameters params;
    for (const auto& [identifier, index] : groups_) {
        params.emplace(identifier, match[index].str());
    }
    return params;
}

} // namespace waypoint::routing
