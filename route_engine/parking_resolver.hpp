#pragma once
#include "config.hpp"
#include "distance_oracle.hpp"
#include "model.hpp"
#include "overpass_client.hpp"
#include "ttl_cache.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct ParkingOptions {
    double max_radius_m = 2000.0;      // cutoff for static candidates
    int live_radius_m = 600;
    int live_limit = 10;
    double synthetic_radius_m = 500.0;
    int synthetic_count = 8;
};

ParkingOptions parking_options_from(const EngineConfig& cfg);

class ParkingTier {
public:
    virtual ~ParkingTier() = default;
    virtual ParkingSource source() const = 0;
    virtual std::optional<ParkingCandidate> attempt(const GeoPoint& target,
                                                    const std::vector<ParkingCandidate>& statics,
                                                    const ParkingOptions& opt) = 0;
};

class StaticParkingTier : public ParkingTier {
public:
    ParkingSource source() const override { return ParkingSource::Cached; }
    std::optional<ParkingCandidate> attempt(const GeoPoint& target,
                                            const std::vector<ParkingCandidate>& statics,
                                            const ParkingOptions& opt) override;
};

class LivePoiTier : public ParkingTier {
public:
    using PoiCache = TtlCache<std::string, std::vector<ParkingPoi>>;

    LivePoiTier(std::shared_ptr<OverpassClient> overpass, PoiCache& cache);

    ParkingSource source() const override { return ParkingSource::LivePoi; }
    std::optional<ParkingCandidate> attempt(const GeoPoint& target,
                                            const std::vector<ParkingCandidate>& statics,
                                            const ParkingOptions& opt) override;

private:
    std::shared_ptr<OverpassClient> overpass_;
    PoiCache& cache_;
};

class SyntheticParkingTier : public ParkingTier {
public:
    explicit SyntheticParkingTier(DistanceOracle& oracle) : oracle_(oracle) {}

    ParkingSource source() const override { return ParkingSource::SyntheticRoadSnap; }
    std::optional<ParkingCandidate> attempt(const GeoPoint& target,
                                            const std::vector<ParkingCandidate>& statics,
                                            const ParkingOptions& opt) override;

private:
    DistanceOracle& oracle_;
};

class ParkingResolver {
public:
    using NowFn = LivePoiTier::PoiCache::NowFn;

    ParkingResolver(const EngineConfig& cfg, std::shared_ptr<HttpClient> http, DistanceOracle& oracle);
    ParkingResolver(std::shared_ptr<OverpassClient> overpass,
                    DistanceOracle& oracle,
                    int cache_ttl_s,
                    NowFn now = [] { return std::chrono::steady_clock::now(); });

    // cached -> live-poi -> synthetic-road-snap -> nearest static at any range.
    std::optional<ParkingCandidate> resolve(const GeoPoint& delivery,
                                            const std::vector<ParkingCandidate>& statics,
                                            const ParkingOptions& opt);

    std::vector<std::optional<ParkingCandidate>> resolve_all(const std::vector<GeoPoint>& deliveries,
                                                             const std::vector<ParkingCandidate>& statics,
                                                             const ParkingOptions& opt,
                                                             size_t max_workers);

    size_t cached_queries() const { return poi_cache_.size(); }

private:
    LivePoiTier::PoiCache poi_cache_;
    std::vector<std::unique_ptr<ParkingTier>> tiers_;
};

std::string poi_cache_key(const GeoPoint& p, int radius_m);

// Nearest candidate within max_radius_m; a negative radius disables the cutoff.
std::optional<ParkingCandidate> nearest_candidate(const GeoPoint& target,
                                                  const std::vector<ParkingCandidate>& candidates,
                                                  double max_radius_m);
