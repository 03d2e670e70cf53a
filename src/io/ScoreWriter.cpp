#include "io/ScoreWriter.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace LoOP {

namespace {

std::ofstream open_output(const std::string& filepath) {
    std::ofstream ofs(filepath);
    if (!ofs.is_open()) {
        throw std::runtime_error("Cannot open file for writing: " + filepath);
    }
    return ofs;
}

}  // namespace

ScoreWriter::ScoreWriter(const std::string& output_dir, int precision)
    : output_dir_(output_dir), precision_(precision) {
    std::filesystem::create_directories(output_dir_);
}

std::string ScoreWriter::format_value(double v) const {
    if (std::isnan(v)) {
        return "NA";
    }
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision_) << v;
    return ss.str();
}

std::string ScoreWriter::write_scores(const StatisticsTable& table, const ClusterIndex& cluster_index) const {
    const std::string filepath = output_dir_ + "/scores.csv";
    std::ofstream ofs = open_output(filepath);

    ofs << "row,cluster,loop_score\n";
    for (int i = 0; i < table.size(); ++i) {
        ofs << i << "," << cluster_index.get_name(table.cluster_id[i]) << "," << format_value(table.loop_score(i))
            << "\n";
    }

    return filepath;
}

std::string ScoreWriter::write_statistics(const StatisticsTable& table, const ClusterIndex& cluster_index) const {
    const std::string filepath = output_dir_ + "/statistics.tsv";
    std::ofstream ofs = open_output(filepath);

    ofs << "row";
    for (const auto& name : StatisticsTable::column_names()) {
        ofs << "\t" << name;
    }
    ofs << "\n";

    const auto columns = table.numeric_columns();
    for (int i = 0; i < table.size(); ++i) {
        ofs << i << "\t" << cluster_index.get_name(table.cluster_id[i]);
        for (const Eigen::VectorXd* column : columns) {
            ofs << "\t" << format_value((*column)(i));
        }
        ofs << "\n";
    }

    return filepath;
}

std::string ScoreWriter::write_cluster_summary(const StatisticsTable& table,
                                               const ClusterIndex& cluster_index) const {
    const std::string filepath = output_dir_ + "/clusters.tsv";
    std::ofstream ofs = open_output(filepath);

    ofs << "cluster\tsize\tssd\tev_prob_set_distance\tev_plof_sq\n";
    for (const auto& entry : table.clusters) {
        const ClusterAggregate& cluster = entry.second;
        ofs << cluster_index.get_name(cluster.cluster_id) << "\t" << cluster.size() << "\t"
            << format_value(cluster.ssd) << "\t" << format_value(cluster.ev_prob_set_distance) << "\t"
            << format_value(cluster.ev_plof_sq) << "\n";
    }

    return filepath;
}

}  // namespace LoOP
