#include "core/DistanceMatrix.hpp"

#include <omp.h>

#include <algorithm>
#include <atomic>
#include <cmath>
#include <numeric>

namespace LoOP {

/**
 * @brief Euclidean distance between two rows of the dataset.
 *
 * L2 = sqrt(sum((x_i - x_j)^2)) over all features. A missing value in either
 * row makes the distance NaN.
 */
static double calculate_euclidean(const Eigen::MatrixXd& data, int row_i, int row_j) {
    double sum_sq_diff = 0.0;
    const int d = static_cast<int>(data.cols());

    for (int k = 0; k < d; ++k) {
        double diff = data(row_i, k) - data(row_j, k);
        sum_sq_diff += diff * diff;
    }

    return std::sqrt(sum_sq_diff);
}

void DistanceMatrix::compute(const Eigen::MatrixXd& data, const DistanceConfig& config) {
    std::vector<int> all_indices(static_cast<size_t>(data.rows()));
    std::iota(all_indices.begin(), all_indices.end(), 0);
    compute_subset(data, all_indices, config);
}

void DistanceMatrix::compute_subset(const Eigen::MatrixXd& data, const std::vector<int>& row_indices,
                                    const DistanceConfig& config) {
    const int n = static_cast<int>(row_indices.size());

    this->row_ids = row_indices;
    this->dist_matrix = Eigen::MatrixXd::Zero(n, n);

    std::atomic<int> valid_pairs{0};
    std::atomic<int> nan_pairs{0};

    int num_threads = config.num_threads > 0 ? config.num_threads : omp_get_max_threads();

// Parallel computation of upper triangle
#pragma omp parallel for schedule(dynamic) num_threads(num_threads)
    for (int i = 0; i < n; ++i) {
        for (int j = i + 1; j < n; ++j) {
            double dist = calculate_euclidean(data, row_indices[i], row_indices[j]);

            if (std::isnan(dist)) {
                nan_pairs++;
            } else {
                valid_pairs++;
            }

            this->dist_matrix(i, j) = dist;
            this->dist_matrix(j, i) = dist;
        }
    }

    // A row with missing features is NaN against itself as well
    for (int i = 0; i < n; ++i) {
        if (data.row(row_indices[i]).hasNaN()) {
            this->dist_matrix(i, i) = NAN;
        }
    }

    this->num_valid_pairs = valid_pairs.load();
    this->num_nan_pairs = nan_pairs.load();
}

std::vector<double> DistanceMatrix::sorted_neighbor_distances(int i) const {
    std::vector<double> distances;
    if (i < 0 || i >= size()) {
        return distances;
    }

    distances.reserve(static_cast<size_t>(size() - 1));
    for (int j = 0; j < size(); ++j) {
        if (j != i) {
            distances.push_back(dist_matrix(i, j));
        }
    }

    std::sort(distances.begin(), distances.end(), [](double a, double b) {
        if (std::isnan(a)) return false;
        if (std::isnan(b)) return true;
        return a < b;
    });

    return distances;
}

}  // namespace LoOP
