#pragma once

#include <Eigen/Dense>
#include <string>

#include "core/ClusterIndex.hpp"
#include "core/StatisticsTable.hpp"

namespace LoOP {

/**
 * @brief Writes pipeline results under an output directory.
 *
 * Output directory layout:
 * ```
 * output/
 *   scores.csv        # row,cluster,loop_score
 *   statistics.tsv    # every StatisticsTable column per row (optional)
 *   clusters.tsv      # per-cluster aggregates (optional)
 * ```
 * NaN values are written as "NA". Cluster ids are written with the label
 * text registered in the ClusterIndex.
 */
class ScoreWriter {
public:
    /**
     * @brief Construct a ScoreWriter, creating output_dir if needed.
     * @param output_dir Output root directory
     * @param precision Decimal places for floating-point values
     */
    explicit ScoreWriter(const std::string& output_dir, int precision = 6);

    /**
     * @brief Writes scores.csv.
     *
     * @param table Fitted statistics table (cluster_id and loop_score are used)
     * @param cluster_index Label text for cluster ids
     * @return Path of the written file
     */
    std::string write_scores(const StatisticsTable& table, const ClusterIndex& cluster_index) const;

    /**
     * @brief Writes statistics.tsv with one line per observation.
     */
    std::string write_statistics(const StatisticsTable& table, const ClusterIndex& cluster_index) const;

    /**
     * @brief Writes clusters.tsv with one line per cluster.
     *
     * Format:
     * cluster  size  ssd  ev_prob_set_distance  ev_plof_sq
     */
    std::string write_cluster_summary(const StatisticsTable& table, const ClusterIndex& cluster_index) const;

    const std::string& output_dir() const { return output_dir_; }

private:
    std::string output_dir_;
    int precision_;

    std::string format_value(double v) const;
};

}  // namespace LoOP
