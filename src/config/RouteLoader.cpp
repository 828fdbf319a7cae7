#include "waypoint/config/RouteLoader.hpp"

#include "waypoint/routing/RoutingError.hpp"
#include "waypoint/util/Logging.hpp"
#include "waypoint/util/StringUtil.hpp"

#include <boost/json.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <optional>
#include <system_error>

namespace waypoint::config {
namespace {

using routing::RouteRecord;
using routing::RoutingError;

enum class Format {
    yaml,
    json
};

std::optional<Format> formatOf(const std::filesystem::path& file) {
    auto extension = util::toLower(file.extension().string());
    if (extension == ".yaml" || extension == ".yml") return Format::yaml;
    if (extension == ".json") return Format::json;
    return std::nullopt;
}

std::string readFile(const std::filesystem::path& file) {
    std::ifstream ifs(file, std::ios::binary);
    if (!ifs.is_open()) {
        throw RoutingError::malformedRouteSource(file.string(), "cannot open file");
    }
    return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

std::string joinMethods(const std::vector<std::string>& methods) {
    std::string joined;
    for (const auto& method : methods) {
        if (!joined.empty()) {
            joined += ',';
        }
        joined += method;
    }
    return joined;
}

// YAML

std::string yamlScalar(const YAML::Node& node, const std::string& origin, const std::string& field) {
    if (!node.IsScalar()) {
        throw RoutingError::malformedRouteSource(origin, "\"" + field + "\" must be a string");
    }
    return node.as<std::string>();
}

RouteRecord yamlRoute(const std::string& name, const YAML::Node& fields, const std::string& origin) {
    if (!fields.IsMap()) {
        throw RoutingError::malformedRouteSource(origin, "route \"" + name + "\" must be a mapping");
    }
    const auto context = "route \"" + name + "\" ";
    if (!fields["path"]) {
        throw RoutingError::malformedRouteSource(origin, context + "has no path");
    }
    if (!fields["controller"]) {
        throw RoutingError::malformedRouteSource(origin, context + "has no controller");
    }

    RouteRecord record;
    record.name = name;
    record.path = yamlScalar(fields["path"], origin, "path");
    record.controller = yamlScalar(fields["controller"], origin, "controller");
    if (fields["middleware"]) {
        record.middleware = yamlScalar(fields["middleware"], origin, "middleware");
    }
    if (auto methods = fields["methods"]) {
        if (methods.IsSequence()) {
            std::vector<std::string> list;
            for (const auto& method : methods) {
                list.push_back(yamlScalar(method, origin, "methods"));
            }
            record.methods = joinMethods(list);
        } else {
            record.methods = yamlScalar(methods, origin, "methods");
        }
    }
    if (auto requirements = fields["requirements"]) {
        if (!requirements.IsMap()) {
            throw RoutingError::malformedRouteSource(origin, context + "requirements must be a mapping");
        }
        for (const auto& entry : requirements) {
            record.requirements.emplace(entry.first.as<std::string>(),
                                        yamlScalar(entry.second, origin, "requirements"));
        }
    }
    if (fields["language"]) {
        record.language = yamlScalar(fields["language"], origin, "language");
    }
    return record;
}

// JSON

std::string jsonString(const boost::json::value& value, const std::string& origin, const std::string& field) {
    if (!value.is_string()) {
        throw RoutingError::malformedRouteSource(origin, "\"" + field + "\" must be a string");
    }
    return std::string(value.as_string());
}

RouteRecord jsonRoute(const std::string& name, const boost::json::value& value, const std::string& origin) {
    if (!value.is_object()) {
        throw RoutingError::malformedRouteSource(origin, "route \"" + name + "\" must be an object");
    }
    const auto& fields = value.as_object();
    const auto context = "route \"" + name + "\" ";

    RouteRecord record;
    record.name = name;
    if (auto it = fields.if_contains("path")) {
        record.path = jsonString(*it, origin, "path");
    } else {
        throw RoutingError::malformedRouteSource(origin, context + "has no path");
    }
    if (auto it = fields.if_contains("controller")) {
        record.controller = jsonString(*it, origin, "controller");
    } else {
        throw RoutingError::malformedRouteSource(origin, context + "has no controller");
    }
    if (auto it = fields.if_contains("middleware")) {
        record.middleware = jsonString(*it, origin, "middleware");
    }
    if (auto it = fields.if_contains("methods")) {
        if (it->is_array()) {
            std::vector<std::string> list;
            for (const auto& method : it->as_array()) {
                list.push_back(jsonString(method, origin, "methods"));
            }
            record.methods = joinMethods(list);
        } else {
            record.methods = jsonString(*it, origin, "methods");
        }
    }
    if (auto it = fields.if_contains("requirements")) {
        if (!it->is_object()) {
            throw RoutingError::malformedRouteSource(origin, context + "requirements must be an object");
        }
        for (const auto& entry : it->as_object()) {
            record.requirements.emplace(std::string(entry.key()), jsonString(entry.value(), origin, "requirements"));
        }
    }
    if (auto it = fields.if_contains("language")) {
        record.language = jsonString(*it, origin, "language");
    }
    return record;
}

void logParsed(std::size_t count) {
    switch (count) {
    case 0: util::log(util::LogLevel::info, "No routes have been parsed"); break;
    case 1: util::log(util::LogLevel::info, "1 route has been parsed"); break;
    default: util::log(util::LogLevel::info, std::to_string(count) + " routes have been parsed"); break;
    }
}

} // namespace

bool RouteLoader::isRouteFile(const std::filesystem::path& file) {
    return formatOf(file).has_value();
}

std::vector<RouteRecord> RouteLoader::load(const std::filesystem::path& source) const {
    std::error_code ec;
    if (!std::filesystem::exists(source, ec)) {
        throw RoutingError::routeSourceNotFound(source.string());
    }

    std::vector<RouteRecord> records;
    if (!std::filesystem::is_directory(source, ec)) {
        records = loadFile(source);
        logParsed(records.size());
        return records;
    }

    util::log(util::LogLevel::debug, "Reading folder " + source.string() + "...");
    std::vector<std::filesystem::path> files;
    std::filesystem::recursive_directory_iterator it(source, ec);
    if (ec) {
        throw RoutingError::malformedRouteSource(source.string(), ec.message());
    }
    for (const std::filesystem::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            throw RoutingError::malformedRouteSource(source.string(), ec.message());
        }
        const auto& entry = *it;
        // A dangling symlink reports not_found; it is skipped like any other non-file.
        auto status = entry.status(ec);
        if (ec && status.type() != std::filesystem::file_type::not_found) {
            throw RoutingError::malformedRouteSource(entry.path().string(), ec.message());
        }
        ec.clear();
        if (!std::filesystem::is_regular_file(status)) {
            continue;
        }
        if (isRouteFile(entry.path())) {
            files.push_back(entry.path());
        } else {
            util::log(util::LogLevel::debug, entry.path().string() + " is skipped.");
        }
    }
    if (ec) {
        throw RoutingError::malformedRouteSource(source.string(), ec.message());
    }
    std::sort(files.begin(), files.end());

    for (const auto& file : files) {
        auto parsed = loadFile(file);
        records.insert(records.end(),
                       std::make_move_iterator(parsed.begin()),
                       std::make_move_iterator(parsed.end()));
    }
    logParsed(records.size());
    return records;
}

std::vector<RouteRecord> RouteLoader::loadFile(const std::filesystem::path& file) const {
    auto format = formatOf(file);
    if (!format) {
        throw RoutingError::malformedRouteSource(file.string(), "unsupported file extension");
    }
    util::log(util::LogLevel::debug, "Reading file " + file.string() + "...");
    auto content = readFile(file);
    return *format == Format::yaml ? parseYaml(content, file.string()) : parseJson(content, file.string());
}

std::vector<RouteRecord> RouteLoader::parseYaml(const std::string& content, const std::string& origin) {
    YAML::Node root;
    try {
        root = YAML::Load(content);
    } catch (const YAML::Exception& ex) {
        throw RoutingError::malformedRouteSource(origin, ex.what());
    }

    std::vector<RouteRecord> records;
    if (!root.IsMap() || !root["routes"]) {
        util::log(util::LogLevel::warn, origin + " has no routes section");
        return records;
    }
    auto routes = root["routes"];
    if (!routes.IsSequence()) {
        throw RoutingError::malformedRouteSource(origin, "\"routes\" must be a sequence");
    }
    try {
        for (const auto& item : routes) {
            if (!item.IsMap()) {
                throw RoutingError::malformedRouteSource(origin, "each route must be a single-key mapping");
            }
            for (const auto& entry : item) {
                records.push_back(yamlRoute(entry.first.as<std::string>(), entry.second, origin));
            }
        }
    } catch (const YAML::Exception& ex) {
        throw RoutingError::malformedRouteSource(origin, ex.what());
    }
    return records;
}

std::vector<RouteRecord> RouteLoader::parseJson(const std::string& content, const std::string& origin) {
    boost::json::error_code ec;
    auto root = boost::json::parse(content, ec);
    if (ec) {
        throw RoutingError::malformedRouteSource(origin, ec.message());
    }

    std::vector<RouteRecord> records;
    const auto* object = root.if_object();
    const auto* routes = object != nullptr ? object->if_contains("routes") : nullptr;
    if (routes == nullptr) {
        util::log(util::LogLevel::warn, origin + " has no routes section");
        return records;
    }
    if (!routes->is_array()) {
        throw RoutingError::malformedRouteSource(origin, "\"routes\" must be an array");
    }
    for (const auto& item : routes->as_array()) {
        if (!item.is_object()) {
            throw RoutingError::malformedRouteSource(origin, "each route must be a single-key object");
        }
        for (const auto& entry : item.as_object()) {
            records.push_back(jsonRoute(std::string(entry.key()), entry.value(), origin));
        }
    }
    return records;
}

} // namespace waypoint::config
