#include "segment_sampler.hpp"
#include <algorithm>
#include <set>

using namespace std;

static double polyline_length(const vector<GeoPoint>& coords, vector<double>& seg_lengths)
{
    seg_lengths.clear();
    double total = 0.0;
    for (size_t i = 0; i + 1 < coords.size(); ++i) {
        double len = haversine_m(coords[i], coords[i + 1]);
        seg_lengths.push_back(len);
        total += len;
    }
    return total;
}

// targets must be ascending
static vector<GeoPoint> interpolate(const vector<GeoPoint>& coords,
                                    const vector<double>& seg_lengths,
                                    const vector<double>& targets)
{
    vector<GeoPoint> out;
    out.reserve(targets.size());
    double accum = 0.0;
    size_t seg = 0;

    for (double t : targets) {
        while (seg < seg_lengths.size() && accum + seg_lengths[seg] < t) {
            accum += seg_lengths[seg];
            seg++;
        }
        if (seg >= seg_lengths.size()) {
            out.push_back(coords.back());
            continue;
        }
        if (seg_lengths[seg] == 0) {
            out.push_back(coords[seg + 1]);
            continue;
        }
        double ratio = max(0.0, min(1.0, (t - accum) / seg_lengths[seg]));
        const GeoPoint& a = coords[seg];
        const GeoPoint& b = coords[seg + 1];
        out.push_back({a.lat + (b.lat - a.lat) * ratio, a.lon + (b.lon - a.lon) * ratio});
    }
    return out;
}

vector<SampledParkingPoint> sample_segments(const vector<StreetSegment>& segments,
                                            double spacing_m,
                                            int dedupe_decimals,
                                            size_t max_points)
{
    vector<SampledParkingPoint> points;
    set<pair<double, double>> seen;
    vector<double> seg_lengths;

    for (auto &s : segments) {
        if (s.geometry.size() < 2) continue;

        double total = polyline_length(s.geometry, seg_lengths);
        if (total == 0) continue;

        int steps = max(1, (int)(total / max(1.0, spacing_m)));
        vector<double> targets;
        targets.reserve(steps + 1);
        for (int i = 0; i <= steps; i++) targets.push_back(total * i / steps);
        targets.back() = total;

        vector<GeoPoint> sampled = interpolate(s.geometry, seg_lengths, targets);
        for (int i = 0; i < (int)sampled.size(); i++) {
            auto key = make_pair(round_to(sampled[i].lat, dedupe_decimals),
                                 round_to(sampled[i].lon, dedupe_decimals));
            if (!seen.insert(key).second) continue;

            points.push_back({sampled[i], s.name, s.address, s.way_id, i, targets[i]});
            if (max_points && points.size() >= max_points) return points;
        }
    }
    return points;
}

vector<ParkingCandidate> to_candidates(const vector<SampledParkingPoint>& points)
{
    vector<ParkingCandidate> out;
    out.reserve(points.size());
    for (auto &p : points) {
        ParkingCandidate c;
        c.location = p.location;
        c.source = ParkingSource::Cached;
        c.name = p.name;
        c.address = p.address;
        out.push_back(c);
    }
    return out;
}
