#pragma once

#include <stdexcept>
#include <string>

namespace waypoint::routing {

enum class ErrorCode {
    // Table construction
    duplicateRouteName,
    undeclaredPlaceholderRequirement,
    emptyMethodList,
    invalidRequirementPattern,
    malformedPathTemplate,
    duplicatePlaceholder,
    undeclaredLanguagePlaceholder,
    // Route sources
    routeSourceNotFound,
    malformedRouteSource,
    // URI generation
    routeNotFound,
    missingParameter,
    parameterDoesNotMatchRequirement
};

const char* toString(ErrorCode code);

class RoutingError : public std::runtime_error {
public:
    RoutingError(ErrorCode code,
                 const std::string& message,
                 std::string subject,
                 std::string value = {},
                 std::string pattern = {});

    ErrorCode code() const noexcept { return code_; }
    // Route name, placeholder identifier or source path, depending on code().
    const std::string& subject() const noexcept { return subject_; }
    const std::string& value() const noexcept { return value_; }
    const std::string& pattern() const noexcept { return pattern_; }

    static RoutingError duplicateRouteName(const std::string& name);
    static RoutingError undeclaredPlaceholderRequirement(const std::string& route, const std::string& placeholder);
    static RoutingError emptyMethodList(const std::string& route);
    static RoutingError invalidRequirementPattern(const std::string& placeholder,
                                                  const std::string& pattern,
                                                  const std::string& reason);
    // The route's combined path regex failed to compile; subject() is the route name.
    static RoutingError invalidRoutePattern(const std::string& route,
                                            const std::string& pattern,
                                            const std::string& reason);
    static RoutingError malformedPathTemplate(const std::string& path, const std::string& reason);
    static RoutingError duplicatePlaceholder(const std::string& path, const std::string& placeholder);
    static RoutingError undeclaredLanguagePlaceholder(const std::string& route, const std::string& placeholder);
    static RoutingError routeSourceNotFound(const std::string& source);
    static RoutingError malformedRouteSource(const std::string& source, const std::string& reason);
    static RoutingError routeNotFound(const std::string& name);
    static RoutingError missingParameter(const std::string& placeholder);
    static RoutingError parameterDoesNotMatchRequirement(const std::string& placeholder,
                                                         const std::string& value,
                                                         const std::string& pattern);

private:
    ErrorCode code_;
    std::string subject_;
    std::string value_;
    std::string pattern_;
};

} // namespace waypoint::routing
