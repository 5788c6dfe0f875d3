#ifndef SPARSECALC_SPARSE_MAT_HPP
#define SPARSECALC_SPARSE_MAT_HPP

#include <boost/unordered_map.hpp>
#include <utility>
#include <vector>

#include "common.hpp"


/* An interface for initializing a sparse matrix with a stream of entries. */
class SparseMatEntryStream
{
    public:
        virtual ~SparseMatEntryStream() {}

        virtual bool finished() = 0;
        virtual void next() = 0;
        virtual index_t row() = 0;
        virtual index_t col() = 0;
        virtual value_t value() = 0;
};


/* One stored (row, col, value) triple. */
struct SparseMatEntry
{
    SparseMatEntry(index_t row, index_t col, value_t value);

    index_t row, col;
    value_t value;
};


/* A very simple sparse integer matrix.
 *
 * Entries are kept in the order they were first set, which is also the order
 * they are iterated over and written out in. Anything not set reads as zero.
 * Setting a zero is allowed and keeps it stored, like any other value.
 *
 * Dimensions are not a bound: setting an entry outside the current shape
 * grows the matrix to fit it.
 */
class SparseMat
{
    public:
        typedef std::vector<SparseMatEntry>::const_iterator const_iterator;

        /* An empty 0 x 0 matrix. */
        SparseMat();

        /* Create an empty sparse matrix.
         *
         * Args:
         *   nrow: Number of rows.
         *   ncol: Number of columns.
         */
        explicit SparseMat(index_t nrow, index_t ncol);

        /* Create a sparse matrix and set every entry from a stream, in the
         * order they are produced. The shape may grow beyond nrow x ncol. */
        SparseMat(index_t nrow, index_t ncol, SparseMatEntryStream& entries);

        /* Value at (i, j), or 0 if nothing is stored there. */
        value_t get(index_t i, index_t j) const;

        /* Store x at (i, j), overwriting anything there, and grow the
         * dimensions if (i, j) lies outside them.
         *
         * Throws:
         *   InvalidIndex if i or j is negative, or the largest index_t.
         */
        void set(index_t i, index_t j, value_t x);

        /* True if an entry is stored at (i, j), even a zero. */
        bool has(index_t i, index_t j) const;

        index_t rows() const;
        index_t cols() const;
        Shape shape() const;

        /* Number of stored entries. */
        size_t nnz() const;

        const_iterator begin() const;
        const_iterator end() const;

    private:
        typedef std::pair<index_t, index_t> Key;
        typedef boost::unordered_map<Key, size_t> EntryIndex;

        index_t nrow, ncol;

        /* Entries in insertion order. */
        std::vector<SparseMatEntry> entries;

        /* Position of each key in `entries`. */
        EntryIndex index;
};


/* Elementwise A + B. Throws DimensionMismatch unless the shapes are equal. */
SparseMat add(const SparseMat& a, const SparseMat& b);

/* Elementwise A - B. Throws DimensionMismatch unless the shapes are equal. */
SparseMat subtract(const SparseMat& a, const SparseMat& b);

/* Matrix product A B, of shape A.rows() x B.cols(). Throws DimensionMismatch
 * unless A.cols() == B.rows(). */
SparseMat multiply(const SparseMat& a, const SparseMat& b);

#endif

