#include "distance_oracle.hpp"
#include <iostream>
#include <stdexcept>

using namespace std;

DistanceMatrix::DistanceMatrix(size_t rows, size_t cols, vector<TravelCost> cells, DistanceSource source)
    : rows_(rows), cols_(cols), cells_(move(cells)), source_(source)
{
    if (cells_.size() != rows_ * cols_)
        throw invalid_argument("DistanceMatrix: cell count does not match shape");
}

const TravelCost& DistanceMatrix::at(size_t i, size_t j) const
{
    if (i >= rows_ || j >= cols_)
        throw out_of_range("DistanceMatrix index out of range");
    return cells_[i * cols_ + j];
}

RoadNetworkTier::RoadNetworkTier(shared_ptr<OsrmClient> osrm, function<bool()> available)
    : osrm_(move(osrm)), available_(move(available))
{
}

optional<DistanceMatrix> RoadNetworkTier::attempt(const vector<GeoPoint>& sources,
                                                  const vector<GeoPoint>& destinations,
                                                  bool force_live)
{
    if (!osrm_ || !osrm_->enabled()) return nullopt;
    if (!force_live && !available_()) return nullopt;

    auto table = osrm_->table(sources, destinations);
    if (!table) return nullopt;

    size_t rows = sources.size();
    size_t cols = destinations.empty() ? sources.size() : destinations.size();
    vector<TravelCost> cells;
    cells.reserve(rows * cols);
    for (size_t i = 0; i < rows; ++i)
        for (size_t j = 0; j < cols; ++j)
            cells.push_back({table->distances[i][j], table->durations[i][j]});
    return DistanceMatrix(rows, cols, move(cells), DistanceSource::RoadNetwork);
}

TravelCost GreatCircleTier::estimate(const GeoPoint& a, const GeoPoint& b) const
{
    double d = haversine_m(a, b);
    if (d <= 0) return {0.0, 0.0};
    double speed_ms = cfg_.avg_speed_kmh * 1000.0 / 3600.0;
    return {d, d / speed_ms * cfg_.urban_buffer};
}

optional<DistanceMatrix> GreatCircleTier::attempt(const vector<GeoPoint>& sources,
                                                  const vector<GeoPoint>& destinations,
                                                  bool)
{
    const vector<GeoPoint>& dst = destinations.empty() ? sources : destinations;
    vector<TravelCost> cells;
    cells.reserve(sources.size() * dst.size());
    for (auto &a : sources)
        for (auto &b : dst)
            cells.push_back(estimate(a, b));
    return DistanceMatrix(sources.size(), dst.size(), move(cells), DistanceSource::GreatCircleEstimate);
}

DistanceOracle::DistanceOracle(const EngineConfig& cfg, shared_ptr<HttpClient> http)
    : DistanceOracle(cfg.estimate, make_shared<OsrmClient>(cfg.osrm, move(http)), cfg.osrm.probe_ttl_s)
{
}

DistanceOracle::DistanceOracle(const EstimateConfig& estimate,
                               shared_ptr<OsrmClient> osrm,
                               int probe_ttl_s,
                               NowFn now)
    : osrm_(move(osrm)),
      great_circle_(estimate),
      probe_cache_(chrono::seconds(probe_ttl_s), move(now))
{
    tiers_.push_back(make_unique<RoadNetworkTier>(osrm_, [this] { return available(); }));
    tiers_.push_back(make_unique<GreatCircleTier>(estimate));
}

bool DistanceOracle::available()
{
    if (!osrm_ || !osrm_->enabled()) return false;

    const string& key = osrm_->base_url();
    if (auto cached = probe_cache_.get(key)) return *cached;

    bool up = osrm_->probe();
    if (!up) cerr << "[distance] routing service at " << key << " not available\n";
    probe_cache_.put(key, up);
    return up;
}

DistanceMatrix DistanceOracle::run_tiers(const vector<GeoPoint>& sources,
                                         const vector<GeoPoint>& destinations,
                                         bool force_live)
{
    for (auto &tier : tiers_) {
        if (auto m = tier->attempt(sources, destinations, force_live)) return *m;
        if (tier->source() == DistanceSource::RoadNetwork && osrm_ && osrm_->enabled())
            cerr << "[distance] road-network matrix unavailable for " << sources.size()
                 << " points, falling back\n";
    }
    // not reached: the great-circle tier always answers
    return *great_circle_.attempt(sources, destinations, false);
}

DistanceMatrix DistanceOracle::matrix(const vector<GeoPoint>& points, bool force_live)
{
    return run_tiers(points, {}, force_live);
}

DistanceMatrix DistanceOracle::matrix(const vector<GeoPoint>& sources,
                                      const vector<GeoPoint>& destinations,
                                      bool force_live)
{
    if (destinations.empty()) return DistanceMatrix(sources.size(), 0, {}, DistanceSource::GreatCircleEstimate);
    return run_tiers(sources, destinations, force_live);
}

PairCost DistanceOracle::pair(const GeoPoint& a, const GeoPoint& b, bool force_live)
{
    DistanceMatrix m = run_tiers({a}, {b}, force_live);
    return {m.distance(0, 0), m.duration(0, 0), m.source()};
}

optional<GeoPoint> DistanceOracle::try_snap_to_road(const GeoPoint& p)
{
    if (!available()) return nullopt;
    return osrm_->nearest(p);
}

GeoPoint DistanceOracle::snap_to_road(const GeoPoint& p)
{
    auto snapped = try_snap_to_road(p);
    return snapped ? *snapped : p;
}

optional<RouteResult> DistanceOracle::path(const vector<GeoPoint>& points, bool with_geometry)
{
    if (points.size() < 2 || !available()) return nullopt;
    return osrm_->route(points, with_geometry, false);
}

optional<vector<string>> DistanceOracle::directions(const GeoPoint& a, const GeoPoint& b)
{
    if (!available()) return nullopt;
    auto r = osrm_->route({a, b}, false, true);
    if (!r || r->legs.empty()) return nullopt;
    return r->legs[0].instructions;
}
