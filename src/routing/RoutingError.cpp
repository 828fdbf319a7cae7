#include "waypoint/routing/RoutingError.hpp"

#include <utility>

namespace waypoint::routing {

const char* toString(ErrorCode code) {
    switch (code) {
    case ErrorCode::duplicateRouteName: return "DuplicateRouteName";
    case ErrorCode::undeclaredPlaceholderRequirement: return "UndeclaredPlaceholderRequirement";
    case ErrorCode::emptyMethodList: return "EmptyMethodList";
    case ErrorCode::invalidRequirementPattern: return "InvalidRequirementPattern";
    case ErrorCode::malformedPathTemplate: return "MalformedPathTemplate";
    case ErrorCode::duplicatePlaceholder: return "DuplicatePlaceholder";
    case ErrorCode::undeclaredLanguagePlaceholder: return "UndeclaredLanguagePlaceholder";
    case ErrorCode::routeSourceNotFound: return "RouteSourceNotFound";
    case ErrorCode::malformedRouteSource: return "MalformedRouteSource";
    case ErrorCode::routeNotFound: return "RouteNotFound";
    case ErrorCode::missingParameter: return "MissingParameter";
    case ErrorCode::parameterDoesNotMatchRequirement: return "ParameterDoesNotMatchRequirement";
    }
    return "Unknown";
}

RoutingError::RoutingError(ErrorCode code,
                           const std::string& message,
                           std::string subject,
                           std::string value,
                           std::string pattern)
    : std::runtime_error(std::string{toString(code)} + ": " + message),
      code_(code),
      subject_(std::move(subject)),
      value_(std::move(value)),
      pattern_(std::move(pattern)) {}

RoutingError RoutingError::duplicateRouteName(const std::string& name) {
    return {ErrorCode::duplicateRouteName, "route \"" + name + "\" is declared more than once", name};
}

RoutingError RoutingError::undeclaredPlaceholderRequirement(const std::string& route, const std::string& placeholder) {
    return {ErrorCode::undeclaredPlaceholderRequirement,
            "route \"" + route + "\" has a requirement for \"" + placeholder + "\" which is not a placeholder of its path",
            placeholder};
}

RoutingError RoutingError::emptyMethodList(const std::string& route) {
    return {ErrorCode::emptyMethodList, "route \"" + route + "\" declares no methods", route};
}

RoutingError RoutingError::invalidRequirementPattern(const std::string& placeholder,
                                                     const std::string& pattern,
                                                     const std::string& reason) {
    return {ErrorCode::invalidRequirementPattern,
            "requirement for \"" + placeholder + "\" is not a valid regex (" + pattern + "): " + reason,
            placeholder, {}, pattern};
}

RoutingError RoutingError::invalidRoutePattern(const std::string& route,
                                               const std::string& pattern,
                                               const std::string& reason) {
    return {ErrorCode::invalidRequirementPattern,
            "route \"" + route + "\" compiles to an invalid regex (" + pattern + "): " + reason,
            route, {}, pattern};
}

RoutingError RoutingError::malformedPathTemplate(const std::string& path, const std::string& reason) {
    return {ErrorCode::malformedPathTemplate, "path \"" + path + "\": " + reason, path};
}

RoutingError RoutingError::duplicatePlaceholder(const std::string& path, const std::string& placeholder) {
    return {ErrorCode::duplicatePlaceholder,
            "placeholder \"" + placeholder + "\" appears more than once in \"" + path + "\"",
            placeholder};
}

RoutingError RoutingError::undeclaredLanguagePlaceholder(const std::string& route, const std::string& placeholder) {
    return {ErrorCode::undeclaredLanguagePlaceholder,
            "route \"" + route + "\" uses \"" + placeholder + "\" as language but its path has no such placeholder",
            placeholder};
}

RoutingError RoutingError::routeSourceNotFound(const std::string& source) {
    return {ErrorCode::routeSourceNotFound, "route source " + source + " not found", source};
}

RoutingError RoutingError::malformedRouteSource(const std::string& source, const std::string& reason) {
    return {ErrorCode::malformedRouteSource, source + ": " + reason, source};
}

RoutingError RoutingError::routeNotFound(const std::string& name) {
    return {ErrorCode::routeNotFound, "route \"" + name + "\" not found", name};
}

RoutingError RoutingError::missingParameter(const std::string& placeholder) {
    return {ErrorCode::missingParameter, "no value supplied for \"" + placeholder + "\"", placeholder};
}

RoutingError RoutingError::parameterDoesNotMatchRequirement(const std::string& placeholder,
                                                            const std::string& value,
                                                            const std::string& pattern) {
    return {ErrorCode::parameterDoesNotMatchRequirement,
            "value \"" + value + "\" for \"" + placeholder + "\" does not match " + pattern,
            placeholder, value, pattern};
}

} // namespace waypoint::routing
