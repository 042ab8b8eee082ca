#include "model.hpp"

const char* to_string(DistanceSource s)
{
    switch (s) {
        case DistanceSource::RoadNetwork: return "road-network";
        case DistanceSource::GreatCircleEstimate: return "great-circle-estimate";
    }
    return "unknown";
}

const char* to_string(ParkingSource s)
{
    switch (s) {
        case ParkingSource::Cached: return "cached";
        case ParkingSource::LivePoi: return "live-poi";
        case ParkingSource::SyntheticRoadSnap: return "synthetic-road-snap";
    }
    return "unknown";
}

const char* to_string(WaypointKind k)
{
    switch (k) {
        case WaypointKind::Depot: return "depot";
        case WaypointKind::Parking: return "parking";
        case WaypointKind::Delivery: return "delivery";
    }
    return "unknown";
}
