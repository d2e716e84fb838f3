#include <gtest/gtest.h>
#include "kmeanix/batching.hpp"
#include "kmeanix/distance.hpp"
#include "kmeanix/errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <vector>

using namespace kmeanix;

namespace {

template <typename T>
std::vector<T> uniform_matrix(size_t rows, size_t cols, unsigned seed) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<T> u(T(-5), T(5));
    std::vector<T> m(rows * cols);
    for (auto& v : m) v = u(rng);
    return m;
}

// Reference squared distances in double.
std::vector<double> brute_force(const std::vector<float>& x, const std::vector<float>& c,
                                size_t n, size_t k, size_t dim) {
    std::vector<double> out(n * k);
    for (size_t i = 0; i < n; ++i)
        for (size_t j = 0; j < k; ++j) {
            double s = 0.0;
            for (size_t d = 0; d < dim; ++d) {
                double t = static_cast<double>(x[i * dim + d]) - c[j * dim + d];
                s += t * t;
            }
            out[i * k + j] = s;
        }
    return out;
}

}  // namespace

TEST(RowBatches, CoversRangeWithShortTail) {
    std::vector<Batch> seen;
    for (Batch b : RowBatches(10, 3)) seen.push_back(b);
    ASSERT_EQ(seen.size(), 4u);
    EXPECT_EQ(seen[0].offset, 0u);
    EXPECT_EQ(seen[1].offset, 3u);
    EXPECT_EQ(seen[3].offset, 9u);
    EXPECT_EQ(seen[3].size, 1u);
    EXPECT_EQ(RowBatches(10, 3).count(), 4u);
}

TEST(RowBatches, EmptyAndOversizedBatch) {
    size_t n = 0;
    for (Batch b : RowBatches(0, 4)) n += b.size;
    EXPECT_EQ(n, 0u);

    std::vector<Batch> seen;
    for (Batch b : RowBatches(5, 100)) seen.push_back(b);
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].size, 5u);
    EXPECT_EQ(RowBatches(5, 100).max_batch(), 5u);

    EXPECT_THROW(RowBatches(5, 0), std::invalid_argument);
}

class DistanceMetricTest : public ::testing::TestWithParam<Metric> {};

TEST_P(DistanceMetricTest, NearestMatchesBruteForce) {
    const size_t n = 257, k = 13, dim = 7;
    auto x = uniform_matrix<float>(n, dim, 1);
    auto c = uniform_matrix<float>(k, dim, 2);
    auto ref = brute_force(x, c, n, k, dim);

    for (size_t bs : {size_t{1}, size_t{16}, size_t{1000}}) {
        for (size_t bc : {size_t{0}, size_t{4}}) {
            DistanceEngine<float> eng(GetParam(), bs, bc);
            std::vector<int> labels(n);
            std::vector<float> dist(n);
            eng.nearest({x.data(), n, dim}, {c.data(), k, dim}, labels.data(), dist.data());

            for (size_t i = 0; i < n; ++i) {
                double best = std::numeric_limits<double>::max();
                for (size_t j = 0; j < k; ++j) best = std::min(best, ref[i * k + j]);
                ASSERT_GE(labels[i], 0);
                ASSERT_LT(labels[i], static_cast<int>(k));
                EXPECT_NEAR(ref[i * k + static_cast<size_t>(labels[i])], best, 1e-3)
                    << "row " << i << " batch " << bs << " tile " << bc;
                EXPECT_NEAR(dist[i], best, 1e-3 * (1.0 + best));
            }
        }
    }
}

TEST_P(DistanceMetricTest, PairwiseEuclideanMatchesBruteForce) {
    const size_t n = 40, k = 6, dim = 5;
    auto x = uniform_matrix<float>(n, dim, 3);
    auto c = uniform_matrix<float>(k, dim, 4);
    auto ref = brute_force(x, c, n, k, dim);

    DistanceEngine<float> eng(GetParam(), 9);
    std::vector<float> out(n * k);
    eng.pairwise({x.data(), n, dim}, {c.data(), k, dim}, out.data(), true);
    for (size_t i = 0; i < n * k; ++i)
        EXPECT_NEAR(out[i], std::sqrt(ref[i]), 1e-3);

    eng.pairwise({x.data(), n, dim}, {c.data(), k, dim}, out.data(), false);
    for (size_t i = 0; i < n * k; ++i)
        EXPECT_NEAR(out[i], ref[i], 1e-3 * (1.0 + ref[i]));
}

TEST_P(DistanceMetricTest, PairwiseAgreesWithNearestUnderTiling) {
    const size_t n = 211, k = 19, dim = 9;
    auto x = uniform_matrix<float>(n, dim, 12);
    auto c = uniform_matrix<float>(k, dim, 13);

    for (size_t bc : {size_t{0}, size_t{4}, size_t{7}}) {
        DistanceEngine<float> eng(GetParam(), 50, bc);
        std::vector<int> labels(n);
        std::vector<float> dist(n);
        eng.nearest({x.data(), n, dim}, {c.data(), k, dim}, labels.data(), dist.data());

        std::vector<float> all(n * k);
        eng.pairwise({x.data(), n, dim}, {c.data(), k, dim}, all.data(), false);
        for (size_t i = 0; i < n; ++i) {
            const float* row = all.data() + i * k;
            const size_t arg = static_cast<size_t>(std::min_element(row, row + k) - row);
            EXPECT_EQ(arg, static_cast<size_t>(labels[i])) << "row " << i << " tile " << bc;
            EXPECT_EQ(row[arg], dist[i]) << "row " << i << " tile " << bc;
        }
    }
}

TEST_P(DistanceMetricTest, TiesResolveToLowestIndex) {
    // Centroids 0 and 2 coincide; centroid 1 is farther from every row.
    std::vector<double> c = {0, 0, 5, 5, 0, 0};
    std::vector<double> x = {0, 0, 0.5, -0.5, -1, 1};

    for (size_t bc : {size_t{0}, size_t{1}, size_t{2}}) {
        DistanceEngine<double> eng(GetParam(), 2, bc);
        std::vector<int> labels(3, -1);
        eng.nearest({x.data(), 3, 2}, {c.data(), 3, 2}, labels.data(), nullptr);
        for (int l : labels) EXPECT_EQ(l, 0) << "tile " << bc;
    }
}

TEST_P(DistanceMetricTest, SelfDistanceIsZeroAndNonNegative) {
    const size_t k = 8, dim = 16;
    auto c = uniform_matrix<float>(k, dim, 5);
    DistanceEngine<float> eng(GetParam(), 3);
    std::vector<int> labels(k);
    std::vector<float> dist(k);
    eng.nearest({c.data(), k, dim}, {c.data(), k, dim}, labels.data(), dist.data());
    for (size_t i = 0; i < k; ++i) {
        EXPECT_EQ(labels[i], static_cast<int>(i));
        EXPECT_GE(dist[i], 0.0f);
        EXPECT_NEAR(dist[i], 0.0f, 1e-3f);
    }
}

TEST_P(DistanceMetricTest, DimensionMismatchThrows) {
    std::vector<float> x(12), c(9);
    DistanceEngine<float> eng(GetParam(), 4);
    std::vector<int> labels(3);
    EXPECT_THROW(eng.nearest({x.data(), 3, 4}, {c.data(), 3, 3}, labels.data(), nullptr),
                 DimensionMismatch);
    std::vector<float> out(9);
    EXPECT_THROW(eng.pairwise({x.data(), 3, 4}, {c.data(), 3, 3}, out.data(), true),
                 DimensionMismatch);
}

INSTANTIATE_TEST_SUITE_P(Metrics, DistanceMetricTest,
                         ::testing::Values(Metric::L2Expanded, Metric::L2Unexpanded));

TEST(DistanceEngine, UnexpandedIsBitwiseBatchInvariant) {
    const size_t n = 301, k = 9, dim = 11;
    auto x = uniform_matrix<float>(n, dim, 6);
    auto c = uniform_matrix<float>(k, dim, 7);

    DistanceEngine<float> ref_eng(Metric::L2Unexpanded, n);
    std::vector<int> ref_l(n);
    std::vector<float> ref_d(n);
    ref_eng.nearest({x.data(), n, dim}, {c.data(), k, dim}, ref_l.data(), ref_d.data());

    for (size_t bs : {size_t{1}, size_t{7}, size_t{64}}) {
        for (size_t bc : {size_t{0}, size_t{2}}) {
            DistanceEngine<float> eng(Metric::L2Unexpanded, bs, bc);
            std::vector<int> l(n);
            std::vector<float> d(n);
            eng.nearest({x.data(), n, dim}, {c.data(), k, dim}, l.data(), d.data());
            EXPECT_EQ(l, ref_l);
            EXPECT_EQ(d, ref_d);
        }
    }
}

TEST(DistanceEngine, StreamsBatchesInOrder) {
    const size_t n = 23, k = 3, dim = 2;
    auto x = uniform_matrix<double>(n, dim, 8);
    auto c = uniform_matrix<double>(k, dim, 9);
    DistanceEngine<double> eng(Metric::L2Expanded, 5);

    size_t expected_offset = 0;
    size_t calls = 0;
    eng.for_each_nearest({x.data(), n, dim}, {c.data(), k, dim},
                         [&](Batch b, const int* labels, const double* d) {
        EXPECT_EQ(b.offset, expected_offset);
        EXPECT_LE(b.size, 5u);
        for (size_t i = 0; i < b.size; ++i) {
            EXPECT_GE(labels[i], 0);
            EXPECT_GE(d[i], 0.0);
        }
        expected_offset += b.size;
        ++calls;
    });
    EXPECT_EQ(expected_offset, n);
    EXPECT_EQ(calls, 5u);
}

TEST(DistanceEngine, ScratchBoundedByBatchNotRows) {
    DistanceEngine<float> eng(Metric::L2Expanded, 1024, 64);
    const size_t small = eng.scratch_bytes(10'000, 256);
    const size_t large = eng.scratch_bytes(100'000'000, 256);
    EXPECT_EQ(small, large);
    EXPECT_LT(large, size_t{1} << 20);
    EXPECT_EQ(eng.centroid_tile(256), 64u);
    EXPECT_EQ(eng.centroid_tile(10), 10u);
}

TEST(DistanceEngine, ZeroBatchRejected) {
    EXPECT_THROW(DistanceEngine<float>(Metric::L2Expanded, 0), ConfigError);
}
