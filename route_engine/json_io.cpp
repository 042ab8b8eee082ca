#include "json_io.hpp"
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <limits>

using namespace std;
using json = nlohmann::json;

// Days since 1970-01-01 for a proleptic Gregorian date.
static long long days_from_civil(long long y, unsigned m, unsigned d)
{
    y -= m <= 2;
    long long era = (y >= 0 ? y : y - 399) / 400;
    unsigned yoe = (unsigned)(y - era * 400);
    unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + (long long)doe - 719468;
}

static void civil_from_days(long long z, int& y, unsigned& m, unsigned& d)
{
    z += 719468;
    long long era = (z >= 0 ? z : z - 146096) / 146097;
    unsigned doe = (unsigned)(z - era * 146097);
    unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    long long yy = (long long)yoe + era * 400;
    unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = (int)(yy + (m <= 2));
}

static bool is_leap(int y)
{
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

static int days_in_month(int y, int m)
{
    static const int DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return m == 2 && is_leap(y) ? 29 : DAYS[m - 1];
}

bool parse_iso8601(const string& s, Timestamp& out)
{
    int y, mo, d, h, mi, sec;
    int used = -1;
    int n = sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &y, &mo, &d, &h, &mi, &sec, &used);
    if (n != 6 || used < 0) return false;

    string rest = s.substr(used);
    if (!rest.empty() && rest != "Z") return false;
    if (mo < 1 || mo > 12 || h < 0 || h > 23 || mi < 0 || mi > 59 || sec < 0 || sec > 60) return false;
    if (d < 1 || d > days_in_month(y, mo)) return false;

    long long days = days_from_civil(y, mo, d);
    long long secs = days * 86400 + h * 3600 + mi * 60 + sec;
    out = Timestamp(chrono::duration_cast<Timestamp::duration>(chrono::seconds(secs)));
    return true;
}

string format_iso8601(Timestamp t)
{
    long long secs = chrono::duration_cast<chrono::seconds>(t.time_since_epoch()).count();
    long long days = secs / 86400;
    long long rem = secs % 86400;
    if (rem < 0) {
        rem += 86400;
        days -= 1;
    }

    int y;
    unsigned m, d;
    civil_from_days(days, y, m, d);
    char buf[32];
    snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02lld:%02lld:%02lldZ", y, m, d,
             rem / 3600, (rem % 3600) / 60, rem % 60);
    return buf;
}

static double coord(const json& j, const char* key)
{
    if (j.contains(key) && j[key].is_number()) return j[key].get<double>();
    return numeric_limits<double>::quiet_NaN();
}

static string id_string(const json& j, const string& fallback)
{
    if (!j.contains("id")) return fallback;
    if (j["id"].is_string()) return j["id"].get<string>();
    if (j["id"].is_number_integer()) return std::to_string(j["id"].get<long long>());
    return fallback;
}

Stop parse_stop(const json& j, const string& default_id)
{
    Stop s;
    s.id = id_string(j, default_id);
    s.location = {coord(j, "lat"), coord(j, "lon")};
    s.address = j.value("address", string());
    s.name = j.value("name", string());
    return s;
}

Driver parse_driver(const json& j)
{
    Driver d;
    d.id = j.at("id").get<int>();
    d.name = j.value("name", string());
    d.available = j.value("available", true);
    return d;
}

bool parse_plan_options(const json& j, PlanOverrides& out, string& error)
{
    if (j.contains("maxClusterSize")) out.max_cluster_size = j["maxClusterSize"].get<int>();
    if (j.contains("minClusterSize")) out.min_cluster_size = j["minClusterSize"].get<int>();
    if (j.contains("parkingAware")) out.parking_aware = j["parkingAware"].get<bool>();

    if (j.contains("clusteringMethod")) {
        ClusterMethod m;
        string s = j["clusteringMethod"].get<string>();
        if (!parse_cluster_method(s, m)) {
            error = "unknown clustering method: " + s;
            return false;
        }
        out.method = m;
    }
    if (j.contains("assignmentStrategy")) {
        AssignmentStrategy a;
        string s = j["assignmentStrategy"].get<string>();
        if (!parse_assignment_strategy(s, a)) {
            error = "unknown assignment strategy: " + s;
            return false;
        }
        out.strategy = a;
    }
    return true;
}

bool parse_plan_request(const json& j, PlanRequest& req, string& mode, string& error)
{
    mode = j.value("mode", string("plan"));
    if (mode != "plan" && mode != "reoptimize") {
        error = "unknown mode: " + mode;
        return false;
    }

    if (!j.contains("depot")) {
        error = "no depot in request";
        return false;
    }
    req.depot = parse_stop(j["depot"], "depot");

    req.orders.clear();
    if (j.contains("orders")) {
        int i = 0;
        for (auto &o : j["orders"]) req.orders.push_back(parse_stop(o, "order-" + std::to_string(++i)));
    }

    req.drivers.clear();
    if (j.contains("drivers"))
        for (auto &d : j["drivers"]) req.drivers.push_back(parse_driver(d));

    if (j.contains("parking")) req.parking_candidates = parse_parking_candidates(j["parking"]);

    if (j.contains("start_time") && !j["start_time"].is_null()) {
        Timestamp t;
        string s = j["start_time"].get<string>();
        if (!parse_iso8601(s, t)) {
            error = "bad start_time: " + s;
            return false;
        }
        req.start_time = t;
    }

    if (j.contains("options") && !parse_plan_options(j["options"], req.options, error)) return false;
    return true;
}

bool load_plan_request(const string& filename, PlanRequest& req, string& mode)
{
    ifstream fin(filename);
    if (!fin) {
        cerr << "Failed to open request file " << filename << "\n";
        return false;
    }

    json j;
    string error;
    try {
        fin >> j;
        if (!parse_plan_request(j, req, mode, error)) {
            cerr << "Invalid request: " << error << "\n";
            return false;
        }
        if (j.contains("parking_file")) {
            vector<ParkingCandidate> from_file;
            if (!load_parking_candidates(j["parking_file"].get<string>(), from_file)) return false;
            req.parking_candidates.insert(req.parking_candidates.end(), from_file.begin(), from_file.end());
        }
    } catch (const exception& e) {
        cerr << "Error parsing request JSON: " << e.what() << "\n";
        return false;
    }
    return true;
}

vector<ParkingCandidate> parse_parking_candidates(const json& j)
{
    const json& list = j.is_object() && j.contains("parking_points") ? j["parking_points"] : j;
    vector<ParkingCandidate> out;
    if (!list.is_array()) return out;

    for (auto &p : list) {
        ParkingCandidate c;
        c.location = {coord(p, "lat"), coord(p, "lon")};
        if (!is_valid(c.location)) continue;
        c.source = ParkingSource::Cached;
        c.name = p.value("name", string());
        c.address = p.value("address", string());
        out.push_back(c);
    }
    return out;
}

bool load_parking_candidates(const string& filename, vector<ParkingCandidate>& out)
{
    ifstream fin(filename);
    if (!fin) {
        cerr << "Failed to open parking file " << filename << "\n";
        return false;
    }

    json j;
    try {
        fin >> j;
    } catch (const exception& e) {
        cerr << "Error parsing parking JSON: " << e.what() << "\n";
        return false;
    }
    out = parse_parking_candidates(j);
    return true;
}

json sampled_points_to_json(const vector<SampledParkingPoint>& points)
{
    json out;
    out["parking_points"] = json::array();
    for (auto &p : points) {
        out["parking_points"].push_back({
            {"lat", p.location.lat},
            {"lon", p.location.lon},
            {"name", p.name},
            {"address", p.address},
            {"way_id", p.way_id},
            {"point_index", p.point_index},
            {"distance_m", p.distance_m}
        });
    }
    out["count"] = points.size();
    return out;
}

json parking_to_json(const ParkingCandidate& c)
{
    json j = {
        {"lat", c.location.lat},
        {"lon", c.location.lon},
        {"source", to_string(c.source)},
        {"name", c.name},
        {"address", c.address}
    };
    j["distance_m"] = c.distance_m ? json(*c.distance_m) : json(nullptr);
    return j;
}

json route_plan_to_json(const RoutePlan& plan)
{
    json j;
    j["total_distance_km"] = round_to(plan.total_distance_km, 2);
    j["total_time_minutes"] = round_to(plan.total_time_minutes, 1);
    j["distance_source"] = to_string(plan.source);

    j["waypoints"] = json::array();
    for (size_t i = 0; i < plan.waypoints.size(); ++i) {
        const Waypoint& w = plan.waypoints[i];
        json wj = {
            {"sequence", i},
            {"type", to_string(w.kind)},
            {"id", w.stop_id},
            {"name", w.name},
            {"address", w.address},
            {"lat", w.location.lat},
            {"lon", w.location.lon},
            {"cumulative_distance_km", round_to(w.cumulative_distance_km, 2)},
            {"cumulative_time_minutes", round_to(w.cumulative_time_minutes, 1)}
        };
        wj["estimated_arrival"] = w.estimated_arrival ? json(format_iso8601(*w.estimated_arrival)) : json(nullptr);
        j["waypoints"].push_back(wj);
    }

    j["geometry"] = json::array();
    for (auto &p : plan.geometry) j["geometry"].push_back({p.lat, p.lon});
    if (!plan.directions.empty()) j["directions"] = plan.directions;
    return j;
}

json plan_result_to_json(const PlanResult& result)
{
    json out;
    out["ok"] = result.ok;
    if (!result.ok) {
        out["error"] = result.error;
        return out;
    }

    out["routes"] = json::array();
    for (auto &r : result.routes) {
        const RouteAssignment& a = r.assignment;
        json rj = {
            {"driver_id", a.driver_id},
            {"driver_name", a.driver_name},
            {"route_name", a.route_name},
            {"color", a.color},
            {"route_index", a.route_index},
            {"order_count", a.order_ids.size()},
            {"order_ids", a.order_ids},
            {"sequence", r.sequence},
            {"sequencer", to_string(r.tier)}
        };
        json parking = json::array();
        for (auto &p : r.parking) parking.push_back(p ? parking_to_json(*p) : json(nullptr));
        rj["parking"] = parking;
        rj["plan"] = route_plan_to_json(r.plan);
        out["routes"].push_back(rj);
    }

    const RouteStatistics& s = result.statistics;
    out["statistics"] = {
        {"total_routes", s.total_routes},
        {"total_orders", s.total_orders},
        {"unscheduled_orders", s.unscheduled_orders},
        {"drivers_used", s.drivers_used},
        {"total_distance_km", round_to(s.total_distance_km, 2)},
        {"total_time_minutes", round_to(s.total_time_minutes, 1)},
        {"total_time_hours", round_to(s.total_time_minutes / 60.0, 2)},
        {"average_orders_per_route", round_to(s.average_orders_per_route, 1)},
        {"average_distance_per_route", round_to(s.average_distance_per_route, 1)}
    };
    return out;
}

json reoptimize_result_to_json(const ReoptimizeResult& result, const vector<Stop>& stops)
{
    json out;
    out["ok"] = result.ok;
    if (!result.ok) {
        out["error"] = result.error;
        return out;
    }

    vector<string> ids;
    for (int k : result.order) ids.push_back(stops[k].id);
    out["optimized_order"] = result.order;
    out["optimized_order_ids"] = ids;
    out["sequencer"] = to_string(result.tier);
    out["improvement"] = {
        {"original_distance_km", round_to(result.metrics.original_distance_km, 2)},
        {"optimized_distance_km", round_to(result.metrics.optimized_distance_km, 2)},
        {"distance_saved_km", round_to(result.metrics.distance_saved_km, 2)},
        {"improvement_percent", round_to(result.metrics.improvement_percent, 1)}
    };
    out["plan"] = route_plan_to_json(result.plan);
    return out;
}
