#include "clustering.hpp"
#include <algorithm>
#include <deque>
#include <iostream>
#include <limits>

using namespace std;

static const int UNVISITED = -2;
static const int NOISE = -1;

ClusterOptions cluster_options_from(const ClusteringConfig& cfg)
{
    ClusterOptions opt;
    opt.method = cfg.method;
    opt.max_cluster_size = cfg.max_cluster_size;
    opt.min_cluster_size = cfg.min_cluster_size;
    opt.radius_km = cfg.radius_km;
    opt.num_clusters = cfg.num_clusters;
    opt.max_iterations = cfg.max_iterations;
    opt.convergence_m = cfg.convergence_m;
    return opt;
}

static vector<int> neighbors_of(const DistanceMatrix& m, int p, double radius_m)
{
    vector<int> out;
    for (int j = 0; j < (int)m.cols(); j++)
        if (j != p && m.distance(p, j) <= radius_m) out.push_back(j);
    return out;
}

static double average_distance(const DistanceMatrix& m, int p, const Cluster& c)
{
    double total = 0.0;
    for (int q : c) total += m.distance(p, q);
    return c.empty() ? numeric_limits<double>::infinity() : total / c.size();
}

vector<Cluster> density_clusters(const DistanceMatrix& m, double radius_m, int min_size)
{
    int n = m.rows();
    int min_neighbors = max(0, min_size - 1);
    vector<int> label(n, UNVISITED);
    vector<Cluster> clusters;

    for (int i = 0; i < n; i++) {
        if (label[i] != UNVISITED) continue;

        vector<int> nb = neighbors_of(m, i, radius_m);
        if ((int)nb.size() < min_neighbors) {
            label[i] = NOISE;
            continue;
        }

        int cid = clusters.size();
        clusters.push_back({i});
        label[i] = cid;

        deque<int> frontier(nb.begin(), nb.end());
        while (!frontier.empty()) {
            int q = frontier.front();
            frontier.pop_front();

            if (label[q] == NOISE) {
                // border point: reachable but not itself dense
                label[q] = cid;
                clusters[cid].push_back(q);
                continue;
            }
            if (label[q] != UNVISITED) continue;

            label[q] = cid;
            clusters[cid].push_back(q);
            vector<int> qn = neighbors_of(m, q, radius_m);
            if ((int)qn.size() >= min_neighbors)
                frontier.insert(frontier.end(), qn.begin(), qn.end());
        }
    }

    vector<Cluster> kept;
    vector<int> noise;
    for (auto &c : clusters) {
        if ((int)c.size() >= min_size) kept.push_back(c);
        else noise.insert(noise.end(), c.begin(), c.end());
    }
    for (int i = 0; i < n; i++)
        if (label[i] == NOISE) noise.push_back(i);
    sort(noise.begin(), noise.end());

    for (int p : noise) {
        if (kept.empty()) {
            kept.push_back({p});
            continue;
        }
        int best = 0;
        double best_avg = numeric_limits<double>::infinity();
        for (int c = 0; c < (int)kept.size(); c++) {
            double avg = average_distance(m, p, kept[c]);
            if (avg < best_avg) {
                best_avg = avg;
                best = c;
            }
        }
        kept[best].push_back(p);
    }
    return kept;
}

vector<Cluster> centroid_clusters(const vector<GeoPoint>& points,
                                  int k,
                                  int max_iterations,
                                  double convergence_m)
{
    int n = points.size();
    vector<Cluster> out;
    if (n == 0 || k <= 0) return out;
    if (n <= k) {
        for (int i = 0; i < n; i++) out.push_back({i});
        return out;
    }

    // Farthest-first seeding keeps the run deterministic.
    vector<GeoPoint> centroids = {points[0]};
    vector<double> closest(n, numeric_limits<double>::infinity());
    while ((int)centroids.size() < k) {
        int far = 0;
        double far_d = -1.0;
        for (int i = 0; i < n; i++) {
            closest[i] = min(closest[i], haversine_m(points[i], centroids.back()));
            if (closest[i] > far_d) {
                far_d = closest[i];
                far = i;
            }
        }
        centroids.push_back(points[far]);
    }

    vector<Cluster> clusters(k);
    for (int iter = 0; iter < max_iterations; iter++) {
        vector<Cluster> next(k);
        for (int i = 0; i < n; i++) {
            int best = 0;
            double best_d = numeric_limits<double>::infinity();
            for (int c = 0; c < k; c++) {
                double d = haversine_m(points[i], centroids[c]);
                if (d < best_d) {
                    best_d = d;
                    best = c;
                }
            }
            next[best].push_back(i);
        }

        bool converged = true;
        for (int c = 0; c < k; c++) {
            if (next[c].empty()) continue;
            vector<GeoPoint> members;
            for (int i : next[c]) members.push_back(points[i]);
            GeoPoint moved = centroid(members);
            if (haversine_m(moved, centroids[c]) > convergence_m) converged = false;
            centroids[c] = moved;
        }

        clusters = move(next);
        if (converged) break;
    }

    for (auto &c : clusters)
        if (!c.empty()) out.push_back(c);
    return out;
}

vector<Cluster> split_oversized(const vector<Cluster>& clusters, int max_size)
{
    if (max_size <= 0) return clusters;

    vector<Cluster> out;
    for (auto &c : clusters) {
        int size = c.size();
        if (size <= max_size) {
            out.push_back(c);
            continue;
        }
        int parts = (size + max_size - 1) / max_size;
        int base = size / parts;
        int extra = size % parts;
        int pos = 0;
        for (int p = 0; p < parts; p++) {
            int len = base + (p < extra ? 1 : 0);
            out.emplace_back(c.begin() + pos, c.begin() + pos + len);
            pos += len;
        }
        cerr << "[cluster] split cluster of " << size << " orders into " << parts << " parts\n";
    }
    return out;
}

vector<Cluster> cluster_points(const vector<GeoPoint>& points,
                               const ClusterOptions& opt,
                               DistanceOracle& oracle)
{
    int n = points.size();
    vector<Cluster> clusters;
    if (n == 0) return clusters;

    if (n < opt.min_cluster_size) {
        for (int i = 0; i < n; i++) clusters.push_back({i});
        return clusters;
    }

    if (opt.method == ClusterMethod::Centroid) {
        int max_size = max(1, opt.max_cluster_size);
        int k = opt.num_clusters > 0 ? opt.num_clusters : (n + max_size - 1) / max_size;
        clusters = centroid_clusters(points, k, opt.max_iterations, opt.convergence_m);
    } else {
        DistanceMatrix m = oracle.matrix(points);
        clusters = density_clusters(m, opt.radius_km * 1000.0, opt.min_cluster_size);
    }

    return split_oversized(clusters, opt.max_cluster_size);
}
