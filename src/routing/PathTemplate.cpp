#include "waypoint/routing/PathTemplate.hpp"

#include "waypoint/routing/RoutingError.hpp"

#include <algorithm>
#include <cctype>

namespace waypoint::routing {
namespace {

bool isIdentifierChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

} // namespace

PathTemplate PathTemplate::parse(const std::string& path) {
    PathTemplate result;
    result.source_ = path;

    std::string literal;
    std::size_t pos = 0;
    while (pos < path.size()) {
        const char c = path[pos];
        if (c == '}') {
            throw RoutingError::malformedPathTemplate(path, "unbalanced '}' at offset " + std::to_string(pos));
        }
        if (c != '{') {
            literal.push_back(c);
            ++pos;
            continue;
        }

        auto close = path.find('}', pos + 1);
        if (close == std::string::npos) {
            throw RoutingError::malformedPathTemplate(path, "unterminated placeholder at offset " + std::to_string(pos));
        }
        std::string identifier = path.substr(pos + 1, close - pos - 1);
        if (identifier.empty() || !std::all_of(identifier.begin(), identifier.end(), isIdentifierChar)) {
            throw RoutingError::malformedPathTemplate(path, "invalid placeholder name \"" + identifier + "\"");
        }
        if (result.hasPlaceholder(identifier)) {
            throw RoutingError::duplicatePlaceholder(path, identifier);
        }

        if (!literal.empty()) {
            result.segments_.push_back({PathSegment::Kind::literal, std::move(literal)});
            literal.clear();
        }
        result.placeholders_.push_back(identifier);
        result.segments_.push_back({PathSegment::Kind::placeholder, std::move(identifier)});
        pos = close + 1;
    }
    if (!literal.empty()) {
        result.segments_.push_back({PathSegment::Kind::literal, std::move(literal)});
    }
    return result;
}

bool PathTemplate::hasPlaceholder(const std::string& identifier) const {
    return std::find(placeholders_.begin(), placeholders_.end(), identifier) != placeholders_.end();
}

} // namespace waypoint::routing
