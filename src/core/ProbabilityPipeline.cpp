#include "core/ProbabilityPipeline.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <sstream>

#include "utils/Logger.hpp"

namespace LoOP {

namespace {

/**
 * @brief Mean of f(column[i]) over the cluster members whose value is not NaN.
 *
 * NaN when no member has a value.
 */
template <typename Transform>
double nan_excluding_mean(const Eigen::VectorXd& column, const std::vector<int>& members, Transform f) {
    double sum = 0.0;
    int count = 0;
    for (int row : members) {
        double v = column(row);
        if (!std::isnan(v)) {
            sum += f(v);
            count++;
        }
    }
    if (count == 0) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return sum / count;
}

std::string format_value(double v) {
    std::ostringstream ss;
    ss << v;
    return ss.str();
}

}  // namespace

// ============================================================================
// Validation
// ============================================================================

void Pipeline::validate_inputs(const Eigen::MatrixXd& data, const std::vector<int>& cluster_labels,
                               const LoopConfig& config) {
    const int n = static_cast<int>(data.rows());

    if (n == 0) {
        throw ConfigurationError("data", "0 rows", "at least one observation is required");
    }
    if (data.cols() == 0) {
        throw ConfigurationError("data", "0 columns", "at least one feature is required");
    }
    if (!cluster_labels.empty() && static_cast<int>(cluster_labels.size()) != n) {
        throw ConfigurationError("cluster_labels", std::to_string(cluster_labels.size()) + " labels",
                                 "expected one label per observation (" + std::to_string(n) + ")");
    }
    // Written so that NaN fails as well
    if (!(config.extent > 0.0 && config.extent <= 1.0)) {
        throw ConfigurationError("extent", format_value(config.extent), "must be in (0, 1]");
    }
    if (config.n_neighbors <= 0) {
        throw ConfigurationError("n_neighbors", std::to_string(config.n_neighbors), "must be greater than 0");
    }

    std::map<int, int> cluster_sizes;
    if (cluster_labels.empty()) {
        cluster_sizes[0] = n;
    } else {
        for (int label : cluster_labels) {
            cluster_sizes[label]++;
        }
    }

    auto smallest = std::min_element(cluster_sizes.begin(), cluster_sizes.end(),
                                     [](const auto& a, const auto& b) { return a.second < b.second; });
    if (config.n_neighbors >= smallest->second) {
        throw ConfigurationError("n_neighbors", std::to_string(config.n_neighbors),
                                 "must be smaller than the smallest cluster (cluster " +
                                     std::to_string(smallest->first) + " has " + std::to_string(smallest->second) +
                                     " members)");
    }
}

// ============================================================================
// Stages
// ============================================================================

void Pipeline::compute_neighbor_distances(const Eigen::MatrixXd& data, int n_neighbors, StatisticsTable& table,
                                          const DistanceConfig& config) {
    for (const auto& entry : table.clusters) {
        const ClusterAggregate& cluster = entry.second;

        DistanceMatrix dist_mat;
        dist_mat.cluster_id = cluster.cluster_id;
        dist_mat.compute_subset(data, cluster.members, config);

        LOG_DEBUG("Cluster " + std::to_string(cluster.cluster_id) + ": " + std::to_string(cluster.size()) +
                  " members, " + std::to_string(dist_mat.num_nan_pairs) + " pairs with missing values");

        for (int i = 0; i < dist_mat.size(); ++i) {
            const int row = dist_mat.row_ids[i];
            // Rows with a missing feature keep NaN
            if (data.row(row).hasNaN()) {
                continue;
            }

            // Missing neighbors sort last; only the finite prefix forms the neighborhood
            std::vector<double> neighbors = dist_mat.sorted_neighbor_distances(i);
            const int num_finite = static_cast<int>(
                std::find_if(neighbors.begin(), neighbors.end(), [](double d) { return std::isnan(d); }) -
                neighbors.begin());
            const int k = std::min(n_neighbors, num_finite);
            if (k <= 0) {
                continue;
            }

            double sum = 0.0;
            for (int j = 0; j < k; ++j) {
                sum += neighbors[j];
            }
            table.context_distance(row) = sum / k;
            table.closest_neighbor_distance(row) = neighbors[0];
        }
    }

    if ((table.context_distance.array() == 0.0).all()) {
        throw DegenerateClusterError(std::nullopt, "context_distance",
                                     "neighborhood distances are all zero; use a larger value for n_neighbors");
    }
}

void Pipeline::compute_cluster_ssd(StatisticsTable& table) {
    for (auto& entry : table.clusters) {
        ClusterAggregate& cluster = entry.second;

        double ssd = 0.0;
        for (int row : cluster.members) {
            double d = table.context_distance(row);
            if (!std::isnan(d)) {
                ssd += d * d;
            }
        }

        if (ssd == 0.0) {
            throw DegenerateClusterError(cluster.cluster_id, "cluster_ssd",
                                         "sum of squared context distances is zero");
        }
        cluster.ssd = ssd;

        for (int row : cluster.members) {
            table.cluster_ssd(row) = ssd;
        }
    }
}

void Pipeline::compute_standard_distances(StatisticsTable& table) {
    table.standard_distance = (table.cluster_ssd.array() / table.context_distance.array().abs()).sqrt().matrix();
}

void Pipeline::compute_prob_set_distances(StatisticsTable& table, double extent) {
    table.prob_set_distance = (extent * table.standard_distance.array()).inverse().matrix();
}

void Pipeline::compute_cluster_ev_prob_set_distances(StatisticsTable& table) {
    for (auto& entry : table.clusters) {
        ClusterAggregate& cluster = entry.second;
        cluster.ev_prob_set_distance =
            nan_excluding_mean(table.prob_set_distance, cluster.members, [](double v) { return v; });

        for (int row : cluster.members) {
            table.cluster_ev_prob_set_distance(row) = cluster.ev_prob_set_distance;
        }
    }
}

void Pipeline::compute_plofs(StatisticsTable& table) {
    table.plof = (table.prob_set_distance.array() / table.cluster_ev_prob_set_distance.array() - 1.0).matrix();
}

void Pipeline::compute_cluster_ev_plof_sq(StatisticsTable& table) {
    for (auto& entry : table.clusters) {
        ClusterAggregate& cluster = entry.second;
        cluster.ev_plof_sq = nan_excluding_mean(table.plof, cluster.members, [](double v) { return v * v; });

        for (int row : cluster.members) {
            table.cluster_ev_plof_sq(row) = cluster.ev_plof_sq;
        }
    }
}

void Pipeline::compute_nplofs(StatisticsTable& table, double extent) {
    table.nplof = (extent * table.cluster_ev_plof_sq.array().sqrt()).matrix();
}

void Pipeline::compute_local_outlier_probabilities(StatisticsTable& table) {
    const double sqrt2 = std::sqrt(2.0);
    const int n = table.size();

    for (int i = 0; i < n; ++i) {
        double p = std::erf(table.plof(i) / (table.nplof(i) * sqrt2));
        // std::max would turn NaN into 0
        table.loop_score(i) = std::isnan(p) ? p : std::max(0.0, p);
    }
}

// ============================================================================
// LocalOutlierProbability
// ============================================================================

LocalOutlierProbability::LocalOutlierProbability(const LoopConfig& config) : config_(config) {
}

Eigen::VectorXd LocalOutlierProbability::fit(const Eigen::MatrixXd& data, const std::vector<int>& cluster_labels) {
    return fit_statistics(data, cluster_labels).loop_score;
}

StatisticsTable LocalOutlierProbability::fit_statistics(const Eigen::MatrixXd& data,
                                                        const std::vector<int>& cluster_labels) {
    Pipeline::validate_inputs(data, cluster_labels, config_);

    if (data.hasNaN()) {
        LOG_WARNING("Input data contains missing values. Some scores may not be returned.");
    }

    Utils::ScopedLogger scope("LoOP fit (" + std::to_string(data.rows()) + " observations)", LogLevel::LOG_DEBUG);

    StatisticsTable table = StatisticsTable::build(cluster_labels, static_cast<int>(data.rows()));

    DistanceConfig dist_config;
    dist_config.num_threads = config_.num_threads;

    Pipeline::compute_neighbor_distances(data, config_.n_neighbors, table, dist_config);
    Pipeline::compute_cluster_ssd(table);
    Pipeline::compute_standard_distances(table);
    Pipeline::compute_prob_set_distances(table, config_.extent);
    Pipeline::compute_cluster_ev_prob_set_distances(table);
    Pipeline::compute_plofs(table);
    Pipeline::compute_cluster_ev_plof_sq(table);
    Pipeline::compute_nplofs(table, config_.extent);
    Pipeline::compute_local_outlier_probabilities(table);

    LOG_DEBUG("Computed " + std::to_string(table.size()) + " scores over " + std::to_string(table.num_clusters()) +
              " clusters");

    scores_ = table.loop_score;
    return table;
}

}  // namespace LoOP
