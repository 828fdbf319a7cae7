#pragma once

#include "waypoint/routing/RouteRecord.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace waypoint::config {

// Reads route declarations from YAML (.yaml, .yml) or JSON (.json) files.
// Every file shares the shape
//
//   routes:
//     - <name>:
//         path: /user/{id}
//         controller: user_controller::crud
//         middleware: user_middleware::test   # optional
//         methods: get, post                  # string or list
//         requirements: { id: "^[0-9]+" }      # optional
//         language: lang                      # optional
//
// Errors are thrown as routing::RoutingError; no partial result is returned.
class RouteLoader {
public:
    // A file, or a directory searched recursively in path order.
    std::vector<routing::RouteRecord> load(const std::filesystem::path& source) const;
    std::vector<routing::RouteRecord> loadFile(const std::filesystem::path& file) const;

    static std::vector<routing::RouteRecord> parseYaml(const std::string& content, const std::string& origin);
    static std::vector<routing::RouteRecord> parseJson(const std::string& content, const std::string& origin);

    static bool isRouteFile(const std::filesystem::path& file);
};

} // namespace waypoint::config
