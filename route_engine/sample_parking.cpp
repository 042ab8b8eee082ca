#include <iostream>
#include <fstream>
#include <vector>
#include <string>
#include <chrono>
#include <memory>
#include <algorithm>
#include "config.hpp"
#include "http_client.hpp"
#include "json_io.hpp"
#include "overpass_client.hpp"
#include "segment_sampler.hpp"
#include "nlohmann/json.hpp"

using namespace std;
using json = nlohmann::json;

static bool load_saved_segments(const string& filename, vector<StreetSegment>& out)
{
    ifstream f(filename);
    if (!f) {
        cerr << "Failed to open segments file " << filename << "\n";
        return false;
    }

    json payload;
    try {
        f >> payload;
    } catch (const exception& e) {
        cerr << "Error parsing segments JSON: " << e.what() << "\n";
        return false;
    }
    out = parse_street_segments(payload);
    return true;
}

int main(int argc, char** argv) {
    if (argc != 3 && argc != 4) {
        cerr << "Usage: ./sample_parking config.json parking.json [overpass_payload.json]\n";
        return 1;
    }

    EngineConfig cfg;
    if (!load_config_file(argv[1], cfg)) {
        cerr << "Failed to load config from " << argv[1] << "\n";
        return 1;
    }
    apply_env_overrides(cfg);

    auto start_time = chrono::high_resolution_clock::now();

    vector<StreetSegment> segments;
    if (argc == 4) {
        if (!load_saved_segments(argv[3], segments)) return 1;
    } else {
        if (!cfg.overpass.enabled) {
            cerr << "Overpass is disabled and no saved payload was given\n";
            return 1;
        }
        const BoundingBox& box = cfg.parking.region;
        cout << "Querying " << cfg.overpass.url << " for parking ways in (" << box.south << ", "
             << box.west << ", " << box.north << ", " << box.east << ")\n";

        OverpassClient overpass(cfg.overpass, make_shared<CurlHttpClient>());
        auto fetched = overpass.parking_segments(box, PARKING_WAY_TAGS);
        if (!fetched) {
            cerr << "Overpass query failed\n";
            return 1;
        }
        segments = *fetched;
    }

    cout << "Loaded " << segments.size() << " parking ways\n";

    auto points = sample_segments(segments, cfg.parking.spacing_m, cfg.parking.dedupe_decimals,
                                  (size_t)max(0, cfg.parking.max_points));

    auto end_time = chrono::high_resolution_clock::now();
    auto duration = chrono::duration_cast<chrono::milliseconds>(end_time - start_time);

    cout << "Sampled " << points.size() << " parking points every " << cfg.parking.spacing_m
         << " m in " << duration.count() << " ms\n";

    ofstream out_file(argv[2]);
    if (!out_file) {
        cerr << "Failed to open output file " << argv[2] << "\n";
        return 1;
    }

    out_file << sampled_points_to_json(points).dump(2);
    out_file.close();

    cout << "Output written to " << argv[2] << "\n";

    return 0;
}
