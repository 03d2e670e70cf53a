#include "core/StatisticsTable.hpp"

#include <limits>
#include <stdexcept>

namespace LoOP {

StatisticsTable StatisticsTable::build(const std::vector<int>& labels, int n) {
    StatisticsTable table;

    if (labels.empty()) {
        table.cluster_id.assign(static_cast<size_t>(n), 0);
    } else if (static_cast<int>(labels.size()) != n) {
        throw std::runtime_error("StatisticsTable::build: " + std::to_string(labels.size()) + " labels for " +
                                 std::to_string(n) + " rows");
    } else {
        table.cluster_id = labels;
    }

    for (int i = 0; i < n; ++i) {
        ClusterAggregate& agg = table.clusters[table.cluster_id[i]];
        agg.cluster_id = table.cluster_id[i];
        agg.members.push_back(i);
    }

    const double nan = std::numeric_limits<double>::quiet_NaN();
    table.context_distance = Eigen::VectorXd::Constant(n, nan);
    table.closest_neighbor_distance = Eigen::VectorXd::Constant(n, nan);
    table.cluster_ssd = Eigen::VectorXd::Constant(n, nan);
    table.standard_distance = Eigen::VectorXd::Constant(n, nan);
    table.prob_set_distance = Eigen::VectorXd::Constant(n, nan);
    table.cluster_ev_prob_set_distance = Eigen::VectorXd::Constant(n, nan);
    table.plof = Eigen::VectorXd::Constant(n, nan);
    table.cluster_ev_plof_sq = Eigen::VectorXd::Constant(n, nan);
    table.nplof = Eigen::VectorXd::Constant(n, nan);
    table.loop_score = Eigen::VectorXd::Constant(n, nan);

    return table;
}

const std::vector<std::string>& StatisticsTable::column_names() {
    static const std::vector<std::string> names = {"cluster_id",
                                                    "context_distance",
                                                    "closest_neighbor_distance",
                                                    "cluster_ssd",
                                                    "standard_distance",
                                                    "prob_set_distance",
                                                    "cluster_ev_prob_set_distance",
                                                    "plof",
                                                    "cluster_ev_plof_sq",
                                                    "nplof",
                                                    "loop_score"};
    return names;
}

std::vector<const Eigen::VectorXd*> StatisticsTable::numeric_columns() const {
    return {&context_distance,  &closest_neighbor_distance, &cluster_ssd, &standard_distance,
            &prob_set_distance, &cluster_ev_prob_set_distance, &plof, &cluster_ev_plof_sq,
            &nplof,             &loop_score};
}

}  // namespace LoOP
