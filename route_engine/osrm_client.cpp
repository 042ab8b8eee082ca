#include "osrm_client.hpp"
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

using json = nlohmann::json;
using namespace std;

OsrmClient::OsrmClient(const OsrmConfig& cfg, shared_ptr<HttpClient> http)
    : cfg_(cfg), http_(move(http))
{
}

// OSRM wants lon,lat pairs separated by ';'.
string format_coordinates(const vector<GeoPoint>& points)
{
    stringstream ss;
    ss << fixed << setprecision(6);
    for (size_t i = 0; i < points.size(); ++i) {
        if (i) ss << ";";
        ss << points[i].lon << "," << points[i].lat;
    }
    return ss.str();
}

string OsrmClient::service_url(const string& service, const vector<GeoPoint>& points) const
{
    return cfg_.base_url + "/" + service + "/v1/" + cfg_.profile + "/" + format_coordinates(points);
}

static optional<json> fetch_json(HttpClient& http, const string& url, long timeout_ms)
{
    HttpResponse res = http.get(url, timeout_ms);
    if (!res.ok) {
        cerr << "[osrm] request failed: " << res.error << "\n";
        return nullopt;
    }
    try {
        json j = json::parse(res.body);
        if (j.value("code", "") != "Ok") {
            cerr << "[osrm] service answered code " << j.value("code", "<none>") << "\n";
            return nullopt;
        }
        return j;
    } catch (const exception& e) {
        cerr << "[osrm] malformed response: " << e.what() << "\n";
        return nullopt;
    }
}

bool OsrmClient::probe()
{
    if (!cfg_.enabled) return false;
    string url = cfg_.base_url + "/route/v1/" + cfg_.profile + "/9.21,48.78;9.18,48.77?overview=false";
    HttpResponse res = http_->get(url, cfg_.probe_timeout_ms);
    return res.ok;
}

string describe_step(const json& step)
{
    string name = step.value("name", "");
    string type, modifier;
    if (step.contains("maneuver")) {
        type = step["maneuver"].value("type", "");
        modifier = step["maneuver"].value("modifier", "");
    }

    string text;
    if (type == "depart") text = "Head out";
    else if (type == "arrive") text = "Arrive at destination";
    else if (type == "roundabout" || type == "rotary") text = "Take the roundabout";
    else if (type == "turn" || type == "end of road" || type == "fork")
        text = modifier.empty() ? "Turn" : "Turn " + modifier;
    else if (!modifier.empty()) text = "Continue " + modifier;
    else text = "Continue";

    if (!name.empty() && type != "arrive") text += " onto " + name;
    return text;
}

optional<RouteResult> parse_route_response(const json& j)
{
    try {
        if (!j.contains("routes") || j["routes"].empty()) return nullopt;
        const json& r = j["routes"][0];

        RouteResult out;
        out.distance_m = r.at("distance").get<double>();
        out.duration_s = r.at("duration").get<double>();

        if (r.contains("geometry") && r["geometry"].is_object()) {
            for (auto &c : r["geometry"].at("coordinates"))
                out.geometry.push_back({c.at(1).get<double>(), c.at(0).get<double>()});
        }

        if (r.contains("legs")) {
            for (auto &l : r["legs"]) {
                RouteLeg leg;
                leg.distance_m = l.at("distance").get<double>();
                leg.duration_s = l.at("duration").get<double>();
                if (l.contains("steps"))
                    for (auto &s : l["steps"]) leg.instructions.push_back(describe_step(s));
                out.legs.push_back(leg);
            }
        }
        return out;
    } catch (const exception& e) {
        cerr << "[osrm] malformed route payload: " << e.what() << "\n";
        return nullopt;
    }
}

optional<RouteResult> OsrmClient::route(const vector<GeoPoint>& points,
                                        bool with_geometry,
                                        bool with_steps)
{
    if (!cfg_.enabled || points.size() < 2) return nullopt;

    string url = service_url("route", points);
    url += with_geometry ? "?overview=full&geometries=geojson" : "?overview=false";
    url += with_steps ? "&steps=true" : "&steps=false";

    auto j = fetch_json(*http_, url, cfg_.route_timeout_ms);
    if (!j) return nullopt;
    auto out = parse_route_response(*j);
    if (out && out->legs.size() != points.size() - 1) {
        cerr << "[osrm] route has " << out->legs.size() << " legs for "
             << points.size() << " points\n";
        return nullopt;
    }
    return out;
}

static optional<vector<vector<double>>> parse_grid(const json& j, const char* key,
                                                   size_t rows, size_t cols)
{
    if (!j.contains(key) || !j[key].is_array() || j[key].size() != rows) return nullopt;
    vector<vector<double>> grid;
    grid.reserve(rows);
    for (auto &row : j[key]) {
        if (!row.is_array() || row.size() != cols) return nullopt;
        vector<double> r;
        r.reserve(cols);
        for (auto &cell : row) {
            // null marks an unroutable pair; a partial table is useless to us
            if (!cell.is_number()) return nullopt;
            double v = cell.get<double>();
            if (!isfinite(v) || v < 0) return nullopt;
            r.push_back(v);
        }
        grid.push_back(move(r));
    }
    return grid;
}

optional<TableResult> parse_table_response(const json& j, size_t rows, size_t cols)
{
    auto distances = parse_grid(j, "distances", rows, cols);
    auto durations = parse_grid(j, "durations", rows, cols);
    if (!distances || !durations) {
        cerr << "[osrm] table response incomplete\n";
        return nullopt;
    }
    return TableResult{move(*distances), move(*durations)};
}

optional<TableResult> OsrmClient::table(const vector<GeoPoint>& sources,
                                        const vector<GeoPoint>& destinations)
{
    if (!cfg_.enabled || sources.empty()) return nullopt;

    string url;
    size_t cols;
    if (destinations.empty()) {
        url = service_url("table", sources) + "?annotations=distance,duration";
        cols = sources.size();
    } else {
        vector<GeoPoint> all = sources;
        all.insert(all.end(), destinations.begin(), destinations.end());
        stringstream src, dst;
        for (size_t i = 0; i < sources.size(); ++i) src << (i ? ";" : "") << i;
        for (size_t i = 0; i < destinations.size(); ++i)
            dst << (i ? ";" : "") << sources.size() + i;
        url = service_url("table", all) + "?annotations=distance,duration&sources=" +
              src.str() + "&destinations=" + dst.str();
        cols = destinations.size();
    }

    auto j = fetch_json(*http_, url, cfg_.table_timeout_ms);
    if (!j) return nullopt;
    return parse_table_response(*j, sources.size(), cols);
}

optional<GeoPoint> parse_nearest_response(const json& j)
{
    try {
        if (!j.contains("waypoints") || j["waypoints"].empty()) return nullopt;
        auto &loc = j["waypoints"][0].at("location");
        GeoPoint p{loc.at(1).get<double>(), loc.at(0).get<double>()};
        if (!is_valid(p)) return nullopt;
        return p;
    } catch (const exception& e) {
        cerr << "[osrm] malformed nearest payload: " << e.what() << "\n";
        return nullopt;
    }
}

optional<GeoPoint> OsrmClient::nearest(const GeoPoint& p)
{
    if (!cfg_.enabled) return nullopt;
    auto j = fetch_json(*http_, service_url("nearest", {p}) + "?number=1", cfg_.nearest_timeout_ms);
    if (!j) return nullopt;
    return parse_nearest_response(*j);
}
