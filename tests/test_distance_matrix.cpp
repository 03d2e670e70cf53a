/**
 * @file test_distance_matrix.cpp
 * @brief Unit tests for DistanceMatrix
 *
 * Tests cover:
 * 1. Euclidean distances over all rows and over a subset (one cluster)
 * 2. Missing value propagation
 * 3. Sorted neighbor distances (self excluded, NaN last, duplicates kept)
 * 4. Parallel computation matching sequential computation
 */

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

#include "core/DistanceMatrix.hpp"

using namespace LoOP;

// ============================================================================
// Test Fixtures
// ============================================================================

class DistanceMatrixTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Row 0: (0, 0)
        // Row 1: (3, 4)    -> 5 from row 0
        // Row 2: (6, 8)    -> 10 from row 0, 5 from row 1
        // Row 3: (NaN, 1)  -> missing feature
        // Row 4: (0, 1)    -> 1 from row 0
        data = Eigen::MatrixXd(5, 2);
        data << 0.0, 0.0,
                3.0, 4.0,
                6.0, 8.0,
                NAN, 1.0,
                0.0, 1.0;
    }

    Eigen::MatrixXd data;
};

// ============================================================================
// Basic Computation
// ============================================================================

TEST_F(DistanceMatrixTest, EuclideanAllRows) {
    DistanceMatrix dist_mat;
    dist_mat.compute(data);

    ASSERT_EQ(dist_mat.size(), 5);
    EXPECT_EQ(dist_mat.row_ids, (std::vector<int>{0, 1, 2, 3, 4}));

    EXPECT_DOUBLE_EQ(dist_mat.get_distance(0, 0), 0.0);
    EXPECT_DOUBLE_EQ(dist_mat.get_distance(0, 1), 5.0);
    EXPECT_DOUBLE_EQ(dist_mat.get_distance(0, 2), 10.0);
    EXPECT_DOUBLE_EQ(dist_mat.get_distance(1, 2), 5.0);
    EXPECT_DOUBLE_EQ(dist_mat.get_distance(0, 4), 1.0);

    // Matrix should be symmetric
    EXPECT_DOUBLE_EQ(dist_mat.get_distance(2, 0), dist_mat.get_distance(0, 2));
    EXPECT_DOUBLE_EQ(dist_mat.get_distance(4, 1), dist_mat.get_distance(1, 4));
}

TEST_F(DistanceMatrixTest, ThreeDimensional) {
    Eigen::MatrixXd points(2, 3);
    points << 0.0, 0.0, 0.0,
              1.0, 2.0, 2.0;

    DistanceMatrix dist_mat;
    dist_mat.compute(points);

    EXPECT_DOUBLE_EQ(dist_mat.get_distance(0, 1), 3.0);
}

TEST_F(DistanceMatrixTest, MissingValuesPropagate) {
    DistanceMatrix dist_mat;
    dist_mat.compute(data);

    for (int j = 0; j < dist_mat.size(); ++j) {
        EXPECT_TRUE(std::isnan(dist_mat.get_distance(3, j))) << "column " << j;
        EXPECT_TRUE(std::isnan(dist_mat.get_distance(j, 3))) << "row " << j;
    }

    EXPECT_EQ(dist_mat.num_nan_pairs, 4);
    EXPECT_EQ(dist_mat.num_valid_pairs, 6);
}

TEST_F(DistanceMatrixTest, SubsetKeepsRowOrder) {
    DistanceMatrix dist_mat;
    dist_mat.compute_subset(data, {2, 0, 4});

    ASSERT_EQ(dist_mat.size(), 3);
    EXPECT_EQ(dist_mat.row_ids, (std::vector<int>{2, 0, 4}));
    EXPECT_DOUBLE_EQ(dist_mat.get_distance(0, 1), 10.0);
    EXPECT_DOUBLE_EQ(dist_mat.get_distance(1, 2), 1.0);
    EXPECT_EQ(dist_mat.num_nan_pairs, 0);
    EXPECT_EQ(dist_mat.num_valid_pairs, 3);
}

TEST_F(DistanceMatrixTest, OutOfRangeIsNaN) {
    DistanceMatrix dist_mat;
    dist_mat.compute_subset(data, {0, 1});

    EXPECT_TRUE(std::isnan(dist_mat.get_distance(-1, 0)));
    EXPECT_TRUE(std::isnan(dist_mat.get_distance(0, 2)));
}

TEST_F(DistanceMatrixTest, EmptySubset) {
    DistanceMatrix dist_mat;
    dist_mat.compute_subset(data, {});

    EXPECT_TRUE(dist_mat.empty());
    EXPECT_EQ(dist_mat.num_valid_pairs, 0);
    EXPECT_TRUE(dist_mat.sorted_neighbor_distances(0).empty());
}

// ============================================================================
// Neighbor Distances
// ============================================================================

TEST_F(DistanceMatrixTest, SortedNeighborDistancesNaNLast) {
    DistanceMatrix dist_mat;
    dist_mat.compute(data);

    std::vector<double> neighbors = dist_mat.sorted_neighbor_distances(0);
    ASSERT_EQ(neighbors.size(), 4u);
    EXPECT_DOUBLE_EQ(neighbors[0], 1.0);
    EXPECT_DOUBLE_EQ(neighbors[1], 5.0);
    EXPECT_DOUBLE_EQ(neighbors[2], 10.0);
    EXPECT_TRUE(std::isnan(neighbors[3]));
}

TEST_F(DistanceMatrixTest, SortedNeighborDistancesKeepDuplicates) {
    Eigen::MatrixXd points(3, 1);
    points << 2.0, 2.0, 5.0;

    DistanceMatrix dist_mat;
    dist_mat.compute(points);

    std::vector<double> neighbors = dist_mat.sorted_neighbor_distances(0);
    ASSERT_EQ(neighbors.size(), 2u);
    EXPECT_DOUBLE_EQ(neighbors[0], 0.0);
    EXPECT_DOUBLE_EQ(neighbors[1], 3.0);
}

// ============================================================================
// Parallel Computation
// ============================================================================

TEST_F(DistanceMatrixTest, ParallelMatchesSequential) {
    const int n = 60;
    Eigen::MatrixXd points(n, 3);
    for (int i = 0; i < n; ++i) {
        points(i, 0) = std::sin(0.37 * i);
        points(i, 1) = std::cos(1.13 * i) * 2.0;
        points(i, 2) = 0.05 * i;
    }

    DistanceConfig sequential;
    sequential.num_threads = 1;
    DistanceConfig parallel;
    parallel.num_threads = 4;

    DistanceMatrix a;
    a.compute(points, sequential);
    DistanceMatrix b;
    b.compute(points, parallel);

    ASSERT_EQ(a.size(), b.size());
    EXPECT_TRUE(a.dist_matrix == b.dist_matrix);
    EXPECT_EQ(a.num_valid_pairs, n * (n - 1) / 2);
    EXPECT_EQ(b.num_valid_pairs, a.num_valid_pairs);
}
