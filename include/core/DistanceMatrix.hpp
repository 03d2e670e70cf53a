#pragma once

#include <Eigen/Dense>
#include <cmath>
#include <vector>

namespace LoOP {

/**
 * @brief Configuration for distance matrix calculation.
 */
struct DistanceConfig {
    int num_threads = 1;  ///< Number of threads for parallel computation (<= 0: OpenMP default)
};

/**
 * @brief Stores pairwise Euclidean distances between the members of one cluster.
 *
 * Rows/cols are indexed by position within the cluster; row_ids maps them back
 * to rows of the full dataset. A pair involving a missing (NaN) feature has a
 * NaN distance.
 */
class DistanceMatrix {
public:
    int cluster_id = -1;
    std::vector<int> row_ids;     ///< Dataset row indices corresponding to rows/cols
    Eigen::MatrixXd dist_matrix;  ///< Symmetric NxN distance matrix

    // Statistics
    int num_valid_pairs = 0;  ///< Pairs with a finite distance
    int num_nan_pairs = 0;    ///< Pairs involving a missing value

    DistanceMatrix() = default;

    /**
     * @brief Check if the matrix is empty (no observations).
     */
    bool empty() const { return row_ids.empty(); }

    /**
     * @brief Get the number of observations in the matrix.
     */
    int size() const { return static_cast<int>(row_ids.size()); }

    /**
     * @brief Computes pairwise distances over every row of the dataset.
     *
     * @param data n x d feature matrix.
     * @param config Distance calculation configuration.
     */
    void compute(const Eigen::MatrixXd& data, const DistanceConfig& config = DistanceConfig());

    /**
     * @brief Computes pairwise distances for a subset of rows (one cluster).
     *
     * @param data n x d feature matrix.
     * @param row_indices Rows of data to include, in the order they will appear.
     * @param config Distance calculation configuration.
     */
    void compute_subset(const Eigen::MatrixXd& data, const std::vector<int>& row_indices,
                        const DistanceConfig& config = DistanceConfig());

    /**
     * @brief Get distance between two members by their positions in this matrix.
     */
    double get_distance(int i, int j) const {
        if (i < 0 || i >= size() || j < 0 || j >= size()) return NAN;
        return dist_matrix(i, j);
    }

    /**
     * @brief Distances from member i to every other member, ascending.
     *
     * The self distance is excluded by position, so duplicate points still
     * contribute their zero distance. NaN distances sort last.
     */
    std::vector<double> sorted_neighbor_distances(int i) const;
};

}  // namespace LoOP
