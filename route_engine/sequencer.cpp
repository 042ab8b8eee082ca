#include "sequencer.hpp"
#include <algorithm>
#include <functional>
#include <iostream>
#include <limits>

using namespace std;
using Clock = chrono::steady_clock;

static const double EPS = 1e-9;

const char* to_string(SequencerTier t)
{
    switch (t) {
        case SequencerTier::GuidedLocalSearch: return "guided-local-search";
        case SequencerTier::TwoOpt: return "two-opt";
        case SequencerTier::NearestNeighbor: return "nearest-neighbor";
    }
    return "unknown";
}

SequencerOptions sequencer_options_from(const SequencerConfig& cfg)
{
    SequencerOptions opt;
    opt.use_solver = cfg.use_solver;
    opt.solver_time_limit = chrono::milliseconds(cfg.solver_time_limit_ms);
    opt.solver_max_iterations = cfg.solver_max_iterations;
    opt.two_opt_max_passes = cfg.two_opt_max_passes;
    return opt;
}

static inline int node_of(int stop) { return stop + 1; }

double tour_cost(const vector<int>& tour, const DistanceMatrix& m)
{
    if (tour.empty()) return 0.0;
    double cost = m.distance(0, node_of(tour.front()));
    for (int i = 0; i + 1 < (int)tour.size(); i++)
        cost += m.distance(node_of(tour[i]), node_of(tour[i + 1]));
    cost += m.distance(node_of(tour.back()), 0);
    return cost;
}

vector<int> nearest_neighbor_tour(const DistanceMatrix& m)
{
    int n = (int)m.rows() - 1;
    vector<int> tour;
    if (n <= 0) return tour;

    vector<bool> visited(n, false);
    int current = 0;
    for (int step = 0; step < n; step++) {
        double best = numeric_limits<double>::infinity();
        int best_stop = -1;
        for (int s = 0; s < n; s++) {
            if (visited[s]) continue;
            double d = m.distance(current, node_of(s));
            if (d < best) {
                best = d;
                best_stop = s;
            }
        }
        visited[best_stop] = true;
        tour.push_back(best_stop);
        current = node_of(best_stop);
    }
    return tour;
}

// Cost change of reversing tour[i..j] under edge cost g.
static double reversal_delta(const vector<int>& tour, int i, int j,
                             const function<double(int, int)>& g)
{
    int n = tour.size();
    int prev = i == 0 ? 0 : node_of(tour[i - 1]);
    int next = j == n - 1 ? 0 : node_of(tour[j + 1]);
    int first = node_of(tour[i]);
    int last = node_of(tour[j]);

    double before = g(prev, first) + g(last, next);
    double after = g(prev, last) + g(first, next);
    for (int k = i; k < j; k++) {
        int a = node_of(tour[k]);
        int b = node_of(tour[k + 1]);
        before += g(a, b);
        after += g(b, a);
    }
    return after - before;
}

static bool two_opt_pass(vector<int>& tour, const function<double(int, int)>& g)
{
    bool improved = false;
    int n = tour.size();
    for (int i = 0; i < n - 1; i++) {
        for (int j = i + 1; j < n; j++) {
            if (reversal_delta(tour, i, j, g) < -EPS) {
                reverse(tour.begin() + i, tour.begin() + j + 1);
                improved = true;
            }
        }
    }
    return improved;
}

bool two_opt(vector<int>& tour, const DistanceMatrix& m, int max_passes)
{
    if (tour.size() < 2) return false;

    auto g = [&m](int a, int b) { return m.distance(a, b); };
    bool changed = false;
    for (int pass = 0; pass < max_passes; pass++) {
        if (!two_opt_pass(tour, g)) break;
        changed = true;
    }
    return changed;
}

vector<int> cheapest_insertion_tour(const DistanceMatrix& m)
{
    int n = (int)m.rows() - 1;
    vector<int> tour;
    vector<bool> placed(max(n, 0), false);

    for (int step = 0; step < n; step++) {
        double best = numeric_limits<double>::infinity();
        int best_stop = -1, best_pos = -1;
        for (int s = 0; s < n; s++) {
            if (placed[s]) continue;
            int v = node_of(s);
            for (int p = 0; p <= (int)tour.size(); p++) {
                int a = p == 0 ? 0 : node_of(tour[p - 1]);
                int b = p == (int)tour.size() ? 0 : node_of(tour[p]);
                double cost = m.distance(a, v) + m.distance(v, b) - m.distance(a, b);
                if (cost < best) {
                    best = cost;
                    best_stop = s;
                    best_pos = p;
                }
            }
        }
        placed[best_stop] = true;
        tour.insert(tour.begin() + best_pos, best_stop);
    }
    return tour;
}

// Moves tour[i] to its best position if that lowers the cost under g.
static bool relocate_pass(vector<int>& tour, const function<double(int, int)>& g)
{
    bool improved = false;
    int n = tour.size();
    for (int i = 0; i < n; i++) {
        vector<int> path;
        path.reserve(n + 2);
        path.push_back(0);
        for (int s : tour) path.push_back(node_of(s));
        path.push_back(0);

        int a = path[i], s = path[i + 1], b = path[i + 2];
        double removal = g(a, b) - g(a, s) - g(s, b);

        // reduced path skips index i + 1
        auto reduced = [&](int q) { return q <= i ? path[q] : path[q + 1]; };
        double best = -EPS;
        int best_q = -1;
        for (int q = 0; q < n; q++) {
            if (q == i) continue;
            int x = reduced(q), y = reduced(q + 1);
            double delta = removal + g(x, s) + g(s, y) - g(x, y);
            if (delta < best) {
                best = delta;
                best_q = q;
            }
        }
        if (best_q >= 0) {
            int stop = tour[i];
            tour.erase(tour.begin() + i);
            tour.insert(tour.begin() + best_q, stop);
            improved = true;
        }
    }
    return improved;
}

static void local_search(vector<int>& tour, const function<double(int, int)>& g,
                         Clock::time_point deadline)
{
    int guard = 50 * ((int)tour.size() + 1);
    for (int round = 0; round < guard && Clock::now() < deadline; round++) {
        bool improved = two_opt_pass(tour, g);
        improved = relocate_pass(tour, g) || improved;
        if (!improved) break;
    }
}

optional<vector<int>> guided_local_search(const DistanceMatrix& m,
                                          chrono::milliseconds budget,
                                          int max_iterations)
{
    auto deadline = Clock::now() + budget;
    size_t nodes = m.rows();
    if (nodes <= 1) return vector<int>{};

    vector<int> tour = cheapest_insertion_tour(m);
    if (Clock::now() >= deadline) return nullopt;

    auto plain = [&m](int a, int b) { return m.distance(a, b); };
    local_search(tour, plain, deadline);

    vector<int> best = tour;
    double best_cost = tour_cost(tour, m);
    if (tour.size() < 3) return best;

    // Penalised edges are directed node pairs.
    vector<vector<int>> penalty(nodes, vector<int>(nodes, 0));
    double lambda = 0.3 * best_cost / (double)nodes;
    auto augmented = [&](int a, int b) { return m.distance(a, b) + lambda * penalty[a][b]; };

    for (int iter = 0; iter < max_iterations && Clock::now() < deadline; iter++) {
        vector<int> path;
        path.push_back(0);
        for (int s : tour) path.push_back(node_of(s));
        path.push_back(0);

        double max_util = -1.0;
        for (size_t k = 0; k + 1 < path.size(); k++) {
            int a = path[k], b = path[k + 1];
            max_util = max(max_util, m.distance(a, b) / (1.0 + penalty[a][b]));
        }
        for (size_t k = 0; k + 1 < path.size(); k++) {
            int a = path[k], b = path[k + 1];
            if (m.distance(a, b) / (1.0 + penalty[a][b]) >= max_util - EPS) penalty[a][b]++;
        }

        local_search(tour, augmented, deadline);

        double cost = tour_cost(tour, m);
        if (cost < best_cost - EPS) {
            best_cost = cost;
            best = tour;
        }
    }

    // The best tour was found under penalised costs; settle it under true ones.
    local_search(best, plain, deadline);
    return best;
}

optional<vector<int>> SolverStrategy::attempt(const DistanceMatrix& m)
{
    if (!opt_.use_solver) return nullopt;
    return guided_local_search(m, opt_.solver_time_limit, opt_.solver_max_iterations);
}

optional<vector<int>> TwoOptStrategy::attempt(const DistanceMatrix& m)
{
    vector<int> tour = nearest_neighbor_tour(m);
    two_opt(tour, m, max_passes_);
    return tour;
}

optional<vector<int>> NearestNeighborStrategy::attempt(const DistanceMatrix& m)
{
    return nearest_neighbor_tour(m);
}

SequenceResult sequence_matrix(const DistanceMatrix& m, const SequencerOptions& opt)
{
    vector<unique_ptr<SequencingStrategy>> strategies;
    strategies.push_back(make_unique<SolverStrategy>(opt));
    strategies.push_back(make_unique<TwoOptStrategy>(opt.two_opt_max_passes));
    strategies.push_back(make_unique<NearestNeighborStrategy>());

    for (auto &s : strategies) {
        if (auto tour = s->attempt(m))
            return {*tour, s->tier(), tour_cost(*tour, m), m.source()};
        if (s->tier() == SequencerTier::GuidedLocalSearch && opt.use_solver)
            cerr << "[sequencer] solver found no tour within "
                 << opt.solver_time_limit.count() << " ms, falling back\n";
    }
    // not reached: nearest neighbour always answers
    vector<int> tour = nearest_neighbor_tour(m);
    return {tour, SequencerTier::NearestNeighbor, tour_cost(tour, m), m.source()};
}

vector<GeoPoint> sequence_nodes(const GeoPoint& depot,
                                const vector<Stop>& stops,
                                const vector<optional<ParkingCandidate>>& parking)
{
    vector<GeoPoint> nodes;
    nodes.reserve(stops.size() + 1);
    nodes.push_back(depot);
    for (size_t i = 0; i < stops.size(); ++i) {
        bool parked = i < parking.size() && parking[i].has_value();
        nodes.push_back(parked ? parking[i]->location : stops[i].location);
    }
    return nodes;
}

SequenceResult sequence_stops(const GeoPoint& depot,
                              const vector<Stop>& stops,
                              const vector<optional<ParkingCandidate>>& parking,
                              DistanceOracle& oracle,
                              const SequencerOptions& opt)
{
    if (stops.empty())
        return {{}, SequencerTier::NearestNeighbor, 0.0, DistanceSource::GreatCircleEstimate};

    DistanceMatrix m = oracle.matrix(sequence_nodes(depot, stops, parking));
    return sequence_matrix(m, opt);
}
