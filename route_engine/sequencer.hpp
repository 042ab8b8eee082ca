#pragma once
#include "config.hpp"
#include "distance_oracle.hpp"
#include "model.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <vector>

enum class SequencerTier { GuidedLocalSearch, TwoOpt, NearestNeighbor };

const char* to_string(SequencerTier t);

struct SequencerOptions {
    bool use_solver = true;
    std::chrono::milliseconds solver_time_limit{5000};
    int solver_max_iterations = 200;
    int two_opt_max_passes = 1000;
};

SequencerOptions sequencer_options_from(const SequencerConfig& cfg);

struct SequenceResult {
    std::vector<int> order;         // stop indices in visiting order
    SequencerTier tier;
    double distance_m;              // depot -> stops -> depot
    DistanceSource source;
};

// In every function below, node 0 of the matrix is the depot and node i + 1 is
// stop i. Tours list stop indices and implicitly start and end at the depot.
double tour_cost(const std::vector<int>& tour, const DistanceMatrix& m);

std::vector<int> nearest_neighbor_tour(const DistanceMatrix& m);

// Applies improving segment reversals until a full pass finds none or
// max_passes is reached. Returns true if the tour changed.
bool two_opt(std::vector<int>& tour, const DistanceMatrix& m, int max_passes);

std::vector<int> cheapest_insertion_tour(const DistanceMatrix& m);

// Cheapest insertion followed by guided local search over 2-opt and relocate
// moves. nullopt when the budget runs out before a first tour exists.
std::optional<std::vector<int>> guided_local_search(const DistanceMatrix& m,
                                                    std::chrono::milliseconds budget,
                                                    int max_iterations);

class SequencingStrategy {
public:
    virtual ~SequencingStrategy() = default;
    virtual SequencerTier tier() const = 0;
    virtual std::optional<std::vector<int>> attempt(const DistanceMatrix& m) = 0;
};

class SolverStrategy : public SequencingStrategy {
public:
    explicit SolverStrategy(const SequencerOptions& opt) : opt_(opt) {}
    SequencerTier tier() const override { return SequencerTier::GuidedLocalSearch; }
    std::optional<std::vector<int>> attempt(const DistanceMatrix& m) override;

private:
    SequencerOptions opt_;
};

class TwoOptStrategy : public SequencingStrategy {
public:
    explicit TwoOptStrategy(int max_passes) : max_passes_(max_passes) {}
    SequencerTier tier() const override { return SequencerTier::TwoOpt; }
    std::optional<std::vector<int>> attempt(const DistanceMatrix& m) override;

private:
    int max_passes_;
};

class NearestNeighborStrategy : public SequencingStrategy {
public:
    SequencerTier tier() const override { return SequencerTier::NearestNeighbor; }
    std::optional<std::vector<int>> attempt(const DistanceMatrix& m) override;
};

// Tries solver (when enabled), 2-opt and nearest neighbour in that order.
SequenceResult sequence_matrix(const DistanceMatrix& m, const SequencerOptions& opt);

// Node 0 is the depot, node i + 1 is stop i at its parking point when one is
// given. parking may be empty or hold one entry per stop.
std::vector<GeoPoint> sequence_nodes(const GeoPoint& depot,
                                     const std::vector<Stop>& stops,
                                     const std::vector<std::optional<ParkingCandidate>>& parking);

// Sequences over the matrix of sequence_nodes.
SequenceResult sequence_stops(const GeoPoint& depot,
                              const std::vector<Stop>& stops,
                              const std::vector<std::optional<ParkingCandidate>>& parking,
                              DistanceOracle& oracle,
                              const SequencerOptions& opt);
