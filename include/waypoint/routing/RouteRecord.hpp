#pragma once

#include <map>
#include <optional>
#include <string>

namespace waypoint::routing {

// A route as declared by its source, before normalization and validation.
struct RouteRecord {
    std::string name;
    std::string path;
    std::string controller;
    std::optional<std::string> middleware;
    std::string methods;
    std::map<std::string, std::string> requirements;
    std::optional<std::string> language;
};

} // namespace waypoint::routing
