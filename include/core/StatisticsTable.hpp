#pragma once

#include <Eigen/Dense>
#include <cmath>
#include <map>
#include <string>
#include <vector>

namespace LoOP {

/**
 * @brief Cluster-conditional aggregates, computed once per cluster and
 * broadcast back to its members.
 */
struct ClusterAggregate {
    int cluster_id = -1;
    std::vector<int> members;            ///< Dataset row indices, ascending
    double ssd = NAN;                    ///< Sum of squared context distances (NaN excluded)
    double ev_prob_set_distance = NAN;   ///< Mean probabilistic set distance (NaN excluded)
    double ev_plof_sq = NAN;             ///< Mean squared PLOF (NaN excluded)

    int size() const { return static_cast<int>(members.size()); }
};

/**
 * @brief Working state of one fit: one row per observation, struct of arrays.
 *
 * Every column is allocated and NaN-filled by build(); each pipeline stage
 * fills exactly one column (and, for per-cluster stages, one aggregate field).
 */
class StatisticsTable {
public:
    std::vector<int> cluster_id;                  ///< Cluster of each row
    Eigen::VectorXd context_distance;             ///< Mean distance to the n nearest neighbors
    Eigen::VectorXd closest_neighbor_distance;    ///< Distance to the nearest neighbor (diagnostic)
    Eigen::VectorXd cluster_ssd;                  ///< Broadcast ClusterAggregate::ssd
    Eigen::VectorXd standard_distance;
    Eigen::VectorXd prob_set_distance;
    Eigen::VectorXd cluster_ev_prob_set_distance; ///< Broadcast ClusterAggregate::ev_prob_set_distance
    Eigen::VectorXd plof;
    Eigen::VectorXd cluster_ev_plof_sq;           ///< Broadcast ClusterAggregate::ev_plof_sq
    Eigen::VectorXd nplof;
    Eigen::VectorXd loop_score;                   ///< Local Outlier Probability

    std::map<int, ClusterAggregate> clusters;     ///< Keyed by cluster id

    StatisticsTable() = default;

    /**
     * @brief Builds an empty table for the given assignment.
     *
     * @param labels Cluster id of each row; empty means n rows in cluster 0.
     * @param n Number of rows.
     */
    static StatisticsTable build(const std::vector<int>& labels, int n);

    int size() const { return static_cast<int>(cluster_id.size()); }
    int num_clusters() const { return static_cast<int>(clusters.size()); }

    /**
     * @brief Aggregate record of the cluster that row i belongs to.
     */
    const ClusterAggregate& cluster_of(int i) const { return clusters.at(cluster_id[i]); }

    /**
     * @brief Column names in the order they are populated.
     */
    static const std::vector<std::string>& column_names();

    /**
     * @brief Numeric columns in the order of column_names(), excluding cluster_id.
     */
    std::vector<const Eigen::VectorXd*> numeric_columns() const;
};

}  // namespace LoOP
