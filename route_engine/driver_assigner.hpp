#pragma once
#include "config.hpp"
#include "model.hpp"
#include <string>
#include <vector>

extern const std::vector<std::string> ROUTE_COLORS;

// "Michael Schneider" -> "MS", "Anna" -> "AN", "" -> "R<index+1>".
std::string route_name_for(const std::string& driver_name, int route_index);

// Maps clusters onto available drivers. Returns an empty list when there are no
// clusters or no available drivers; callers report that as infeasible input.
std::vector<RouteAssignment> assign_drivers(const std::vector<Cluster>& clusters,
                                            const std::vector<Driver>& drivers,
                                            const std::vector<Stop>& orders,
                                            AssignmentStrategy strategy);
