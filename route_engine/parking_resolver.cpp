#include "parking_resolver.hpp"
#include "parallel.hpp"
#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>

using namespace std;

ParkingOptions parking_options_from(const EngineConfig& cfg)
{
    ParkingOptions opt;
    opt.max_radius_m = cfg.parking.max_radius_m;
    opt.live_radius_m = cfg.overpass.radius_m;
    opt.live_limit = cfg.overpass.limit;
    opt.synthetic_radius_m = cfg.parking.synthetic_radius_m;
    opt.synthetic_count = cfg.parking.synthetic_count;
    return opt;
}

string poi_cache_key(const GeoPoint& p, int radius_m)
{
    stringstream ss;
    ss << fixed << setprecision(4) << round_to(p.lat, 4) << ":" << round_to(p.lon, 4) << ":" << radius_m;
    return ss.str();
}

optional<ParkingCandidate> nearest_candidate(const GeoPoint& target,
                                             const vector<ParkingCandidate>& candidates,
                                             double max_radius_m)
{
    double best = numeric_limits<double>::infinity();
    int best_idx = -1;
    for (int i = 0; i < (int)candidates.size(); i++) {
        double d = haversine_m(target, candidates[i].location);
        if (max_radius_m >= 0 && d > max_radius_m) continue;
        if (d < best) {
            best = d;
            best_idx = i;
        }
    }
    if (best_idx == -1) return nullopt;

    ParkingCandidate out = candidates[best_idx];
    out.distance_m = best;
    return out;
}

optional<ParkingCandidate> StaticParkingTier::attempt(const GeoPoint& target,
                                                      const vector<ParkingCandidate>& statics,
                                                      const ParkingOptions& opt)
{
    auto c = nearest_candidate(target, statics, opt.max_radius_m);
    if (c) c->source = ParkingSource::Cached;
    return c;
}

LivePoiTier::LivePoiTier(shared_ptr<OverpassClient> overpass, PoiCache& cache)
    : overpass_(move(overpass)), cache_(cache)
{
}

optional<ParkingCandidate> LivePoiTier::attempt(const GeoPoint& target,
                                                const vector<ParkingCandidate>&,
                                                const ParkingOptions& opt)
{
    if (!overpass_ || !overpass_->enabled()) return nullopt;

    string key = poi_cache_key(target, opt.live_radius_m);
    vector<ParkingPoi> pois;
    if (auto cached = cache_.get(key)) {
        pois = *cached;
    } else {
        auto fetched = overpass_->parking_nearby(target, opt.live_radius_m, opt.live_limit);
        if (!fetched) return nullopt;
        pois = *fetched;
        cache_.put(key, pois);
    }

    vector<ParkingCandidate> candidates;
    candidates.reserve(pois.size());
    for (auto &poi : pois) {
        ParkingCandidate c;
        c.location = poi.location;
        c.name = poi.name;
        c.address = poi.address;
        candidates.push_back(c);
    }

    auto c = nearest_candidate(target, candidates, opt.live_radius_m);
    if (c) c->source = ParkingSource::LivePoi;
    return c;
}

optional<ParkingCandidate> SyntheticParkingTier::attempt(const GeoPoint& target,
                                                         const vector<ParkingCandidate>&,
                                                         const ParkingOptions& opt)
{
    if (opt.synthetic_count <= 0 || opt.synthetic_radius_m <= 0) return nullopt;

    optional<ParkingCandidate> best;
    double best_gap = numeric_limits<double>::infinity();

    for (int i = 0; i < opt.synthetic_count; i++) {
        double bearing = 360.0 * i / opt.synthetic_count;
        GeoPoint ring = destination_point(target, bearing, opt.synthetic_radius_m);

        // An unsnapped ring point may sit in a field or a building; skip it.
        auto snapped = oracle_.try_snap_to_road(ring);
        if (!snapped) continue;

        double d = haversine_m(target, *snapped);
        double gap = fabs(d - opt.synthetic_radius_m);
        if (gap < best_gap) {
            best_gap = gap;
            ParkingCandidate c;
            c.location = *snapped;
            c.source = ParkingSource::SyntheticRoadSnap;
            c.distance_m = d;
            c.name = "Roadside parking";
            best = c;
        }
    }
    return best;
}

ParkingResolver::ParkingResolver(const EngineConfig& cfg, shared_ptr<HttpClient> http, DistanceOracle& oracle)
    : ParkingResolver(make_shared<OverpassClient>(cfg.overpass, move(http)), oracle, cfg.overpass.cache_ttl_s)
{
}

ParkingResolver::ParkingResolver(shared_ptr<OverpassClient> overpass,
                                 DistanceOracle& oracle,
                                 int cache_ttl_s,
                                 NowFn now)
    : poi_cache_(chrono::seconds(cache_ttl_s), move(now))
{
    tiers_.push_back(make_unique<StaticParkingTier>());
    tiers_.push_back(make_unique<LivePoiTier>(move(overpass), poi_cache_));
    tiers_.push_back(make_unique<SyntheticParkingTier>(oracle));
}

optional<ParkingCandidate> ParkingResolver::resolve(const GeoPoint& delivery,
                                                    const vector<ParkingCandidate>& statics,
                                                    const ParkingOptions& opt)
{
    for (auto &tier : tiers_) {
        if (auto c = tier->attempt(delivery, statics, opt)) return c;
    }

    auto fallback = nearest_candidate(delivery, statics, -1.0);
    if (fallback) {
        fallback->source = ParkingSource::Cached;
        cerr << "[parking] no parking within " << opt.max_radius_m << " m, using static candidate "
             << *fallback->distance_m << " m away\n";
    }
    return fallback;
}

vector<optional<ParkingCandidate>> ParkingResolver::resolve_all(const vector<GeoPoint>& deliveries,
                                                                const vector<ParkingCandidate>& statics,
                                                                const ParkingOptions& opt,
                                                                size_t max_workers)
{
    return parallel_map<optional<ParkingCandidate>>(deliveries.size(), max_workers,
        [&](size_t i) { return resolve(deliveries[i], statics, opt); });
}
