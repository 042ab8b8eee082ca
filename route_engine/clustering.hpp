#pragma once
#include "config.hpp"
#include "distance_oracle.hpp"
#include "model.hpp"
#include <vector>

struct ClusterOptions {
    ClusterMethod method = ClusterMethod::Density;
    int max_cluster_size = 40;
    int min_cluster_size = 3;
    double radius_km = 10.0;        // density neighbourhood
    int num_clusters = 0;           // centroid k; 0 derives it from max_cluster_size
    int max_iterations = 100;
    double convergence_m = 10.0;
};

ClusterOptions cluster_options_from(const ClusteringConfig& cfg);

// Partitions point indices into clusters of 1..max_cluster_size members.
// Every index appears in exactly one cluster.
std::vector<Cluster> cluster_points(const std::vector<GeoPoint>& points,
                                    const ClusterOptions& opt,
                                    DistanceOracle& oracle);

std::vector<Cluster> density_clusters(const DistanceMatrix& m, double radius_m, int min_size);
std::vector<Cluster> centroid_clusters(const std::vector<GeoPoint>& points,
                                       int k,
                                       int max_iterations,
                                       double convergence_m);
std::vector<Cluster> split_oversized(const std::vector<Cluster>& clusters, int max_size);
