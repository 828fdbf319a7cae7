#include "waypoint/routing/Router.hpp"

#include "waypoint/config/RouteLoader.hpp"
#include "waypoint/routing/RoutingError.hpp"
#include "waypoint/util/Logging.hpp"
#include "waypoint/util/StringUtil.hpp"

#include <utility>

namespace waypoint::routing {

Router::Router(std::vector<RouteRecord> records)
    : Router(RouteTable::build(std::move(records))) {}

Router::Router(RouteTable table)
    : table_(std::move(table)) {
    matchers_.reserve(table_.size());
    for (const auto& route : table_.routes()) {
        matchers_.emplace_back(route);
        if (util::shouldLog(util::LogLevel::debug)) {
            util::log(util::LogLevel::debug,
                      "Compiled route \"" + route.name() + "\" as " + matchers_.back().pattern());
        }
    }
}

Router Router::fromSource(const std::filesystem::path& source) {
    return Router(config::RouteLoader{}.load(source));
}

const Route* Router::getRoute(const std::string& path, const std::string& method) const {
    auto found = match(path, method);
    return found ? found->route : nullptr;
}

std::optional<RouteMatch> Router::match(const std::string& path, const std::string& method) const {
    const auto normalized = util::toLower(method);
    const bool trace = util::shouldLog(util::LogLevel::trace);
    if (trace) {
        util::log(util::LogLevel::trace, "Finding a route for \"" + path + "\"...");
    }
    const auto& routes = table_.routes();
    for (std::size_t i = 0; i < routes.size(); ++i) {
        if (!routes[i].allowsMethod(normalized)) {
            continue;
        }
        if (trace) {
            util::log(util::LogLevel::trace, "Checking route \"" + routes[i].name() + "\"...");
        }
        if (auto params = matchers_[i].match(path)) {
            if (trace) {
                util::log(util::LogLevel::trace, "Route \"" + routes[i].name() + "\" matches \"" + path + "\".");
            }
            return makeMatch(routes[i], std::move(*params));
        }
    }
    return std::nullopt;
}

Resolution Router::resolve(const std::string& path, const std::string& method) const {
    const auto normalized = util::toLower(method);
    Resolution resolution;
    const auto& routes = table_.routes();
    for (std::size_t i = 0; i < routes.size(); ++i) {
        auto params = matchers_[i].match(path);
        if (!params) {
            continue;
        }
        if (routes[i].allowsMethod(normalized)) {
            resolution.status = ResolveStatus::matched;
            resolution.match = makeMatch(routes[i], std::move(*params));
            resolution.allowedMethods.clear();
            return resolution;
        }
        resolution.status = ResolveStatus::methodNotAllowed;
        resolution.allowedMethods.insert(routes[i].methods().begin(), routes[i].methods().end());
    }
    return resolution;
}

std::string Router::getUri(const std::string& name, const Parameters& parameters) const {
    const Route* route = table_.findByName(name);
    if (route == nullptr) {
        throw RoutingError::routeNotFound(name);
    }

    std::string uri;
    for (const auto& segment : route->pathTemplate().segments()) {
        if (segment.kind == PathSegment::Kind::literal) {
            uri += segment.text;
            continue;
        }
        auto it = parameters.find(segment.text);
        if (it == parameters.end()) {
            throw RoutingError::missingParameter(segment.text);
        }
        if (!route->satisfiesRequirement(segment.text, it->second)) {
            throw RoutingError::parameterDoesNotMatchRequirement(
                segment.text, it->second, route->requirements().at(segment.text));
        }
        uri += it->second;
    }
    return uri;
}

RouteMatch Router::makeMatch(const Route& route, Parameters parameters) const {
    RouteMatch result;
    result.route = &route;
    if (!route.language().empty()) {
        if (auto it = parameters.find(route.language()); it != parameters.end()) {
            result.language = it->second;
        }
    }
    result.parameters = std::move(parameters);
    return result;
}

} // namespace waypoint::routing
