#include "waypoint/routing/Route.hpp"

#include "waypoint/routing/RoutingError.hpp"
#include "waypoint/util/StringUtil.hpp"

#include <utility>

namespace waypoint::routing {
namespace {

constexpr const char* kDefaultPlaceholderPattern = "[^/]+";

// The placeholder group already bounds the value, so anchors on the
// requirement would only break the embedding. A '^' opening any alternative
// and a '$' closing one are dropped, outside character classes and escapes.
std::string stripAnchors(const std::string& pattern) {
    std::string stripped;
    stripped.reserve(pattern.size());
    bool inClass = false;
    bool alternativeStart = true;
    for (std::size_t i = 0; i < pattern.size(); ++i) {
        const char c = pattern[i];
        if (c == '\\' && i + 1 < pattern.size()) {
            stripped.push_back(c);
            stripped.push_back(pattern[++i]);
            alternativeStart = false;
            continue;
        }
        if (inClass) {
            stripped.push_back(c);
            inClass = c != ']';
            continue;
        }
        switch (c) {
        case '^':
            if (alternativeStart) {
                continue;
            }
            break;
        case '$':
            if (i + 1 == pattern.size() || pattern[i + 1] == '|' || pattern[i + 1] == ')') {
                continue;
            }
            break;
        case '[':
            inClass = true;
            break;
        case '(':
            stripped.push_back(c);
            // Keep (?: (?= (?! together so the alternative starts after them.
            if (i + 2 < pattern.size() && pattern[i + 1] == '?') {
                stripped.append(pattern, i + 1, 2);
                i += 2;
            }
            alternativeStart = true;
            continue;
        case '|':
            stripped.push_back(c);
            alternativeStart = true;
            continue;
        default:
            break;
        }
        stripped.push_back(c);
        alternativeStart = false;
    }
    return stripped;
}

} // namespace

std::set<std::string> normalizeMethods(const std::string& declared) {
    std::set<std::string> methods;
    for (const auto& token : util::splitList(declared, ',')) {
        methods.insert(util::toLower(token));
    }
    return methods;
}

Route Route::fromRecord(RouteRecord record) {
    Route route;
    route.name_ = std::move(record.name);
    route.template_ = PathTemplate::parse(record.path);
    route.controller_ = util::replaceAll(std::move(record.controller), "/", "::");
    route.middleware_ = record.middleware.value_or(std::string{});

    route.methods_ = normalizeMethods(record.methods);
    if (route.methods_.empty()) {
        throw RoutingError::emptyMethodList(route.name_);
    }

    for (auto& [identifier, pattern] : record.requirements) {
        if (!route.template_.hasPlaceholder(identifier)) {
            throw RoutingError::undeclaredPlaceholderRequirement(route.name_, identifier);
        }
        auto subpattern = stripAnchors(pattern);
        try {
            route.compiled_.emplace(identifier, std::regex(subpattern, std::regex::ECMAScript));
        } catch (const std::regex_error& ex) {
            throw RoutingError::invalidRequirementPattern(identifier, pattern, ex.what());
        }
        route.subpatterns_.emplace(identifier, std::move(subpattern));
    }
    route.requirements_ = std::move(record.requirements);

    if (record.language && !record.language->empty()) {
        if (!route.template_.hasPlaceholder(*record.language)) {
            throw RoutingError::undeclaredLanguagePlaceholder(route.name_, *record.language);
        }
        route.language_ = std::move(*record.language);
    }
    return route;
}

std::string Route::placeholderPattern(const std::string& identifier) const {
    if (auto it = subpatterns_.find(identifier); it != subpatterns_.end()) {
        return it->second;
    }
    return kDefaultPlaceholderPattern;
}

std::size_t Route::placeholderGroupCount(const std::string& identifier) const {
    auto it = compiled_.find(identifier);
    return it == compiled_.end() ? 0 : it->second.mark_count();
}

bool Route::satisfiesRequirement(const std::string& identifier, const std::string& value) const {
    auto it = compiled_.find(identifier);
    if (it == compiled_.end()) {
        return true;
    }
    return std::regex_match(value, it->second);
}

} // namespace waypoint::routing
