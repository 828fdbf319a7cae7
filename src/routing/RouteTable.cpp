#include "waypoint/routing/RouteTable.hpp"

#include "waypoint/routing/RoutingError.hpp"

#include <utility>

namespace waypoint::routing {

RouteTable RouteTable::build(std::vector<RouteRecord> records) {
    RouteTable table;
    table.routes_.reserve(records.size());
    for (auto& record : records) {
        if (table.byName_.count(record.name) != 0) {
            throw RoutingError::duplicateRouteName(record.name);
        }
        auto route = Route::fromRecord(std::move(record));
        table.byName_.emplace(route.name(), table.routes_.size());
        table.routes_.push_back(std::move(route));
    }
    return table;
}

const Route* RouteTable::findByName(const std::string& name) const {
    auto it = byName_.find(name);
    if (it == byName_.end()) {
        return nullptr;
    }
    return &routes_[it->second];
}

} // namespace waypoint::routing
