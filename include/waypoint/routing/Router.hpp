#pragma once

#include "waypoint/routing/PathMatcher.hpp"
#include "waypoint/routing/Route.hpp"
#include "waypoint/routing/RouteRecord.hpp"
#include "waypoint/routing/RouteTable.hpp"

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace waypoint::routing {

struct RouteMatch {
    const Route* route{nullptr};
    Parameters parameters;
    // Value captured by the route's language placeholder.
    std::string language;
};

enum class ResolveStatus {
    matched,
    methodNotAllowed,
    notFound
};

struct Resolution {
    ResolveStatus status{ResolveStatus::notFound};
    std::optional<RouteMatch> match;
    // Methods of every route whose path matched, set for methodNotAllowed.
    std::set<std::string> allowedMethods;
};

// Resolves request targets to declared routes and generates URIs from them.
//
// Routes are tried in declaration order and the first one whose method set
// and path template both accept the request wins. The router is immutable
// after construction; share it by const reference and rebuild to reload.
class Router {
public:
    explicit Router(std::vector<RouteRecord> records);
    explicit Router(RouteTable table);

    // Reads a YAML/JSON file or a directory of them.
    static Router fromSource(const std::filesystem::path& source);

    // First route accepting both path and method, or nullptr. A path served
    // only under other methods is reported the same as an unknown path; use
    // resolve() to tell them apart.
    const Route* getRoute(const std::string& path, const std::string& method) const;
    std::optional<RouteMatch> match(const std::string& path, const std::string& method) const;
    Resolution resolve(const std::string& path, const std::string& method) const;

    // Substitutes parameters into the named route's template. Unused
    // parameters are ignored. Throws RoutingError (routeNotFound,
    // missingParameter, parameterDoesNotMatchRequirement).
    std::string getUri(const std::string& name, const Parameters& parameters) const;

    const RouteTable& table() const { return table_; }

private:
    RouteMatch makeMatch(const Route& route, Parameters parameters) const;

    RouteTable table_;
    std::vector<PathMatcher> matchers_;
};

} // namespace waypoint::routing
