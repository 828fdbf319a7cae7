#pragma once

#include "waypoint/routing/Route.hpp"
#include "waypoint/routing/RouteRecord.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace waypoint::routing {

// Routes in declaration order, which is also their matching precedence.
class RouteTable {
public:
    RouteTable() = default;

    static RouteTable build(std::vector<RouteRecord> records);

    const Route* findByName(const std::string& name) const;
    const std::vector<Route>& routes() const { return routes_; }
    std::size_t size() const { return routes_.size(); }
    bool empty() const { return routes_.empty(); }

private:
    std::vector<Route> routes_;
    std::unordered_map<std::string, std::size_t> byName_;
};

} // namespace waypoint::routing
