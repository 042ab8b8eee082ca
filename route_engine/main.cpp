#include <iostream>
#include <fstream>
#include <vector>
#include <string>
#include <chrono>
#include <csignal>
#include <memory>
#include "config.hpp"
#include "distance_oracle.hpp"
#include "http_client.hpp"
#include "json_io.hpp"
#include "parking_resolver.hpp"
#include "planner.hpp"
#include "nlohmann/json.hpp"

using namespace std;
using json = nlohmann::json;

// Raw pointer so the handler only touches the lock-free flag.
static CancelToken* volatile g_sigint_token = nullptr;

static void on_sigint(int)
{
    CancelToken* token = g_sigint_token;
    if (token) token->cancel();
}

static void report_parking(const vector<optional<ParkingCandidate>>& parking)
{
    int cached = 0, live = 0, synthetic = 0, none = 0;
    for (auto &p : parking) {
        if (!p) none++;
        else if (p->source == ParkingSource::Cached) cached++;
        else if (p->source == ParkingSource::LivePoi) live++;
        else synthetic++;
    }
    cout << "    parking: " << cached << " cached, " << live << " live-poi, "
         << synthetic << " synthetic, " << none << " none\n";
}

int main(int argc, char** argv) {
    if (argc != 4) {
        cerr << "Usage: ./route_planner config.json request.json output.json\n";
        return 1;
    }

    EngineConfig cfg;
    if (!load_config_file(argv[1], cfg)) {
        cerr << "Failed to load config from " << argv[1] << "\n";
        return 1;
    }
    apply_env_overrides(cfg);

    PlanRequest req;
    string mode;
    if (!load_plan_request(argv[2], req, mode)) {
        cerr << "Failed to load request from " << argv[2] << "\n";
        return 1;
    }

    cout << "Loaded " << req.orders.size() << " orders, " << req.drivers.size() << " drivers, "
         << req.parking_candidates.size() << " parking candidates (mode " << mode << ")\n";

    auto cancel_token = make_shared<CancelToken>();
    g_sigint_token = cancel_token.get();
    signal(SIGINT, on_sigint);

    auto http = make_shared<CurlHttpClient>(cancel_token);
    DistanceOracle oracle(cfg, http);
    ParkingResolver parking(cfg, http, oracle);
    RoutePlanner planner(cfg, oracle, parking);

    cout << "Routing service " << cfg.osrm.base_url << ": "
         << (oracle.available() ? "available" : "unavailable, using estimates") << "\n";

    auto start_time = chrono::high_resolution_clock::now();

    json out;
    bool ok = false;
    if (mode == "reoptimize") {
        ReoptimizeResult r = planner.reoptimize(req.depot, req.orders, req.parking_candidates,
                                                req.start_time, cancel_token.get());
        ok = r.ok;
        if (ok) {
            cout << "Sequenced with " << to_string(r.tier) << " on " << to_string(r.plan.source)
                 << " distances\n";
            cout << "Distance " << r.metrics.original_distance_km << " km -> "
                 << r.metrics.optimized_distance_km << " km ("
                 << r.metrics.improvement_percent << "% saved)\n";
        } else {
            cerr << "Re-optimization failed: " << r.error << "\n";
        }
        out = reoptimize_result_to_json(r, req.orders);
    } else {
        PlanResult r = planner.plan(req, cancel_token.get());
        ok = r.ok;
        if (ok) {
            for (auto &route : r.routes) {
                cout << "  " << route.assignment.route_name << " (" << route.assignment.driver_name << "): "
                     << route.sequence.size() << " orders, " << route.plan.total_distance_km << " km, "
                     << to_string(route.tier) << ", " << to_string(route.plan.source) << "\n";
                if (!route.parking.empty()) report_parking(route.parking);
            }
            cout << "Planned " << r.statistics.total_routes << " routes for "
                 << r.statistics.drivers_used << " drivers, " << r.statistics.total_distance_km
                 << " km total\n";
        } else {
            cerr << "Planning failed: " << r.error << "\n";
        }
        out = plan_result_to_json(r);
    }

    auto end_time = chrono::high_resolution_clock::now();
    auto duration = chrono::duration_cast<chrono::milliseconds>(end_time - start_time);
    cout << "Completed in " << duration.count() << " ms\n";

    ofstream out_file(argv[3]);
    if (!out_file) {
        cerr << "Failed to open output file " << argv[3] << "\n";
        return 1;
    }

    out_file << out.dump(2);
    out_file.close();

    cout << "Output written to " << argv[3] << "\n";

    return ok ? 0 : 1;
}
