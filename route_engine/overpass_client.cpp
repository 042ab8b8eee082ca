#include "overpass_client.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>

using json = nlohmann::json;
using namespace std;

const vector<string> PARKING_WAY_TAGS = {
    "parking",
    "parking:lane",
    "parking:condition",
    "street_parking",
    "parking:left",
    "parking:right",
    "parking:both",
};

OverpassClient::OverpassClient(const OverpassConfig& cfg, shared_ptr<HttpClient> http)
    : cfg_(cfg), http_(move(http))
{
}

string build_parking_nearby_query(const GeoPoint& p, int radius_m, int limit)
{
    stringstream around;
    around << fixed << setprecision(7) << "(around:" << radius_m << "," << p.lat << "," << p.lon << ")";

    stringstream q;
    q << "[out:json][timeout:25];(";
    q << "node[\"amenity\"=\"parking\"]" << around.str() << ";";
    q << "way[\"amenity\"=\"parking\"]" << around.str() << ";";
    q << "relation[\"amenity\"=\"parking\"]" << around.str() << ";";
    q << ");out center " << limit << ";";
    return q.str();
}

string build_parking_segments_query(const BoundingBox& box, const vector<string>& tags)
{
    stringstream q;
    q << fixed << setprecision(6);
    q << "[out:json][timeout:180];(";
    for (auto &tag : tags)
        q << "way[\"" << tag << "\"](" << box.south << "," << box.west << ","
          << box.north << "," << box.east << ");";
    q << ");out geom;";
    return q.str();
}

optional<json> OverpassClient::query(const string& ql, long timeout_ms)
{
    HttpResponse res = http_->post_form(cfg_.url, "data", ql, timeout_ms);
    if (!res.ok) {
        cerr << "[overpass] request failed: " << res.error << "\n";
        return nullopt;
    }
    try {
        json j = json::parse(res.body);
        if (!j.contains("elements") || !j["elements"].is_array()) {
            cerr << "[overpass] response without elements\n";
            return nullopt;
        }
        return j;
    } catch (const exception& e) {
        cerr << "[overpass] malformed response: " << e.what() << "\n";
        return nullopt;
    }
}

vector<ParkingPoi> parse_parking_pois(const json& payload, int limit)
{
    vector<ParkingPoi> out;
    if (!payload.contains("elements")) return out;

    for (auto &el : payload["elements"]) {
        const json* src = nullptr;
        if (el.value("type", "") == "node") src = &el;
        else if (el.contains("center")) src = &el["center"];
        if (!src || !src->contains("lat") || !src->contains("lon")) continue;

        ParkingPoi poi;
        poi.location = {(*src)["lat"].get<double>(), (*src)["lon"].get<double>()};
        poi.osm_id = el.value("id", 0LL);
        poi.name = "OSM Parking";
        if (el.contains("tags")) {
            auto &tags = el["tags"];
            poi.name = tags.value("name", poi.name);
            poi.address = tags.value("addr:full", "");
        }
        out.push_back(poi);
        if (limit > 0 && (int)out.size() >= limit) break;
    }
    return out;
}

optional<vector<ParkingPoi>> OverpassClient::parking_nearby(const GeoPoint& p, int radius_m, int limit)
{
    if (!cfg_.enabled) return nullopt;
    auto j = query(build_parking_nearby_query(p, radius_m, limit), cfg_.timeout_ms);
    if (!j) return nullopt;
    try {
        return parse_parking_pois(*j, limit);
    } catch (const exception& e) {
        cerr << "[overpass] malformed parking element: " << e.what() << "\n";
        return nullopt;
    }
}

vector<StreetSegment> parse_street_segments(const json& payload)
{
    vector<StreetSegment> out;
    if (!payload.contains("elements")) return out;

    for (auto &el : payload["elements"]) {
        if (el.value("type", "") != "way" || !el.contains("geometry")) continue;

        StreetSegment seg;
        seg.way_id = el.value("id", 0LL);
        for (auto &node : el["geometry"]) {
            if (!node.contains("lat") || !node.contains("lon")) continue;
            seg.geometry.push_back({node["lat"].get<double>(), node["lon"].get<double>()});
        }
        if (seg.geometry.size() < 2) continue;

        seg.name = "OSM Street Parking";
        if (el.contains("tags")) {
            auto &tags = el["tags"];
            seg.name = tags.value("name", seg.name);
            seg.address = tags.value("addr:full", tags.value("addr:street", ""));
        }
        if (seg.address.empty()) seg.address = "OSM parking way " + std::to_string(seg.way_id);
        out.push_back(move(seg));
    }
    return out;
}

optional<vector<StreetSegment>> OverpassClient::parking_segments(const BoundingBox& box,
                                                                 const vector<string>& tags)
{
    if (!cfg_.enabled) {
        cerr << "[overpass] parking download disabled\n";
        return nullopt;
    }
    auto j = query(build_parking_segments_query(box, tags), cfg_.segments_timeout_ms);
    if (!j) return nullopt;
    try {
        return parse_street_segments(*j);
    } catch (const exception& e) {
        cerr << "[overpass] malformed segment element: " << e.what() << "\n";
        return nullopt;
    }
}
