#pragma once

#include <Eigen/Dense>
#include <vector>

#include "DistanceMatrix.hpp"
#include "Errors.hpp"
#include "StatisticsTable.hpp"

namespace LoOP {

/**
 * @brief Parameters of the Local Outlier Probability computation.
 */
struct LoopConfig {
    double extent = 0.997;  ///< Statistical extent in (0, 1]
    int n_neighbors = 10;   ///< Neighborhood size, must be < smallest cluster size
    int num_threads = 1;    ///< Threads for distance computation (<= 0: OpenMP default)
};

/**
 * @brief The stages of the probability pipeline.
 *
 * Each stage fills one column of the StatisticsTable from columns filled by
 * earlier stages. They are exposed individually so that each can be run and
 * checked on a hand-built table; LocalOutlierProbability runs them in order.
 */
namespace Pipeline {

/**
 * @brief Checks parameters and input shape against the cluster assignment.
 *
 * @throws ConfigurationError on empty data, zero features, label length
 *         mismatch, extent outside (0, 1], n_neighbors <= 0, or n_neighbors
 *         not smaller than the smallest cluster.
 */
void validate_inputs(const Eigen::MatrixXd& data, const std::vector<int>& cluster_labels, const LoopConfig& config);

/**
 * @brief Stage 1: context_distance and closest_neighbor_distance per cluster.
 *
 * A row with a missing feature keeps NaN. Other rows use their n_neighbors
 * smallest finite distances, or all of them when fewer are finite.
 *
 * @throws DegenerateClusterError if every context distance is exactly zero.
 */
void compute_neighbor_distances(const Eigen::MatrixXd& data, int n_neighbors, StatisticsTable& table,
                                const DistanceConfig& config = DistanceConfig());

/**
 * @brief Stage 2: cluster sum of squared context distances, NaN excluded.
 *
 * @throws DegenerateClusterError naming the cluster if its sum is exactly zero.
 */
void compute_cluster_ssd(StatisticsTable& table);

/**
 * @brief Stage 3: sqrt(cluster_ssd / |context_distance|).
 */
void compute_standard_distances(StatisticsTable& table);

/**
 * @brief Stage 4: 1 / (extent * standard_distance).
 */
void compute_prob_set_distances(StatisticsTable& table, double extent);

/**
 * @brief Stage 5: cluster mean of prob_set_distance, NaN excluded.
 */
void compute_cluster_ev_prob_set_distances(StatisticsTable& table);

/**
 * @brief Stage 6: prob_set_distance / cluster_ev_prob_set_distance - 1.
 */
void compute_plofs(StatisticsTable& table);

/**
 * @brief Stage 7: cluster mean of plof^2, NaN excluded.
 */
void compute_cluster_ev_plof_sq(StatisticsTable& table);

/**
 * @brief Stage 8: extent * sqrt(cluster_ev_plof_sq).
 */
void compute_nplofs(StatisticsTable& table, double extent);

/**
 * @brief Stage 9: max(0, erf(plof / (nplof * sqrt(2)))). NaN stays NaN.
 */
void compute_local_outlier_probabilities(StatisticsTable& table);

}  // namespace Pipeline

/**
 * @brief Local Outlier Probability estimator.
 *
 * Usage:
 * @code
 * LocalOutlierProbability loop(LoopConfig{0.997, 10});
 * Eigen::VectorXd scores = loop.fit(data, labels);
 * @endcode
 */
class LocalOutlierProbability {
public:
    explicit LocalOutlierProbability(const LoopConfig& config = LoopConfig());

    /**
     * @brief Computes the outlier probability of every row of data.
     *
     * @param data n x d feature matrix; NaN marks a missing value.
     * @param cluster_labels Cluster id per row; empty puts all rows in one cluster.
     * @return Scores in [0, 1] (NaN where undefined), in row order.
     * @throws ConfigurationError, DegenerateClusterError
     */
    Eigen::VectorXd fit(const Eigen::MatrixXd& data, const std::vector<int>& cluster_labels = {});

    /**
     * @brief Runs the full pipeline and returns every intermediate column.
     */
    StatisticsTable fit_statistics(const Eigen::MatrixXd& data, const std::vector<int>& cluster_labels = {});

    /**
     * @brief Scores from the most recent successful fit(); empty before.
     */
    const Eigen::VectorXd& local_outlier_probabilities() const { return scores_; }

    const LoopConfig& config() const { return config_; }

private:
    LoopConfig config_;
    Eigen::VectorXd scores_;
};

}  // namespace LoOP
