#ifndef SPARSECALC_COMMON_HPP
#define SPARSECALC_COMMON_HPP


#include <boost/random/mersenne_twister.hpp>
#include <cstdlib>
#include <string>

#include "logger.hpp"

// General purpose rng
typedef boost::mt19937 rng_t;

/* A row or column index. Signed so that bad indices can be caught rather than
 * wrapping around. */
typedef long index_t;

/* Matrices hold integers only. */
typedef long value_t;

/* The (rows, cols) pair of a matrix. */
struct Shape
{
    Shape(index_t rows = 0, index_t cols = 0);

    bool operator == (const Shape& other) const;
    bool operator != (const Shape& other) const;

    /* Formatted as "ROWSxCOLS". */
    std::string str() const;

    index_t rows, cols;
};

/* Strip leading and trailing whitespace. */
std::string trim(const std::string& s);

#endif
