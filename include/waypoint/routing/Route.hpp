#pragma once

#include "waypoint/routing/PathTemplate.hpp"
#include "waypoint/routing/RouteRecord.hpp"

#include <map>
#include <regex>
#include <set>
#include <string>
#include <unordered_map>

namespace waypoint::routing {

using Parameters = std::unordered_map<std::string, std::string>;

class Route {
public:
    // Normalizes and validates a declared route. Throws RoutingError.
    static Route fromRecord(RouteRecord record);

    const std::string& name() const { return name_; }
    const std::string& path() const { return template_.source(); }
    const std::string& controller() const { return controller_; }
    const std::string& middleware() const { return middleware_; }
    const std::set<std::string>& methods() const { return methods_; }
    const std::map<std::string, std::string>& requirements() const { return requirements_; }
    // Placeholder whose matched value is the request language, or empty.
    const std::string& language() const { return language_; }
    const PathTemplate& pathTemplate() const { return template_; }

    // Expects an already lower-cased method.
    bool allowsMethod(const std::string& method) const { return methods_.count(method) != 0; }

    // Requirement usable as a sub-pattern (outer ^ and $ removed), or [^/]+.
    std::string placeholderPattern(const std::string& identifier) const;
    // Capturing groups the requirement itself declares.
    std::size_t placeholderGroupCount(const std::string& identifier) const;
    // Full-value validation; true when no requirement is declared.
    bool satisfiesRequirement(const std::string& identifier, const std::string& value) const;

private:
    Route() = default;

    std::string name_;
    std::string controller_;
    std::string middleware_;
    std::set<std::string> methods_;
    std::map<std::string, std::string> requirements_;
    std::string language_;
    PathTemplate template_;
    std::unordered_map<std::string, std::string> subpatterns_;
    std::unordered_map<std::string, std::regex> compiled_;
};

std::set<std::string> normalizeMethods(const std::string& declared);

} // namespace waypoint::routing
