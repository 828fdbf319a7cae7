#pragma once

#include <string>
#include <vector>

namespace waypoint::routing {

struct PathSegment {
    enum class Kind {
        literal,
        placeholder
    };

    Kind kind{Kind::literal};
    // Literal text, or the placeholder identifier without braces.
    std::string text;
};

class PathTemplate {
public:
    // Throws RoutingError (malformedPathTemplate, duplicatePlaceholder).
    static PathTemplate parse(const std::string& path);

    const std::string& source() const { return source_; }
    const std::vector<PathSegment>& segments() const { return segments_; }
    const std::vector<std::string>& placeholders() const { return placeholders_; }
    bool hasPlaceholder(const std::string& identifier) const;

private:
    std::string source_;
    std::vector<PathSegment> segments_;
    std::vector<std::string> placeholders_;
};

} // namespace waypoint::routing
