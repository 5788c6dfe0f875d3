#ifndef SPARSECALC_TEST_UTIL_HPP
#define SPARSECALC_TEST_UTIL_HPP

#include <boost/random/uniform_int_distribution.hpp>
#include <gtest/gtest.h>
#include <string>

#include "common.hpp"
#include "sparse_mat.hpp"


/* A matrix of the given shape with roughly `density` of its cells set to
 * small integers, some of them negative. */
inline SparseMat random_sparse_mat(rng_t& rng, index_t rows, index_t cols,
                                   int density_percent = 30)
{
    boost::random::uniform_int_distribution<int> pct(0, 99);
    boost::random::uniform_int_distribution<int> val(-9, 9);

    SparseMat m(rows, cols);
    for (index_t i = 0; i < rows; ++i) {
        for (index_t j = 0; j < cols; ++j) {
            if (pct(rng) < density_percent) m.set(i, j, val(rng));
        }
    }
    return m;
}


/* Compare two matrices cell by cell over their (shared) shape. */
inline ::testing::AssertionResult same_values(const SparseMat& a,
                                              const SparseMat& b)
{
    if (a.shape() != b.shape()) {
        return ::testing::AssertionFailure()
            << "shapes differ: " << a.shape().str() << " vs " << b.shape().str();
    }

    for (index_t i = 0; i < a.rows(); ++i) {
        for (index_t j = 0; j < a.cols(); ++j) {
            if (a.get(i, j) != b.get(i, j)) {
                return ::testing::AssertionFailure()
                    << "differ at (" << i << ", " << j << "): "
                    << a.get(i, j) << " vs " << b.get(i, j);
            }
        }
    }

    return ::testing::AssertionSuccess();
}


/* A path under gtest's temporary directory. */
inline std::string temp_path(const std::string& name)
{
    const ::testing::TestInfo* info =
        ::testing::UnitTest::GetInstance()->current_test_info();
    return ::testing::TempDir() + "sparsecalc_" + info->test_suite_name() +
           "_" + info->name() + "_" + name;
}

#endif

