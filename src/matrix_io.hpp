#ifndef SPARSECALC_MATRIX_IO_HPP
#define SPARSECALC_MATRIX_IO_HPP

/* Reading and writing the sparse matrix text format:
 *
 *   rows=3
 *   cols=4
 *   (0, 1, 5)
 *   (2, 3, -2)
 *
 * The two header lines give the dimensions, and every following non-blank line
 * gives one entry. Entries may lie outside the declared dimensions, in which
 * case the matrix grows to fit them.
 */

#include <string>
#include <vector>

#include "sparse_mat.hpp"


/* Streams the entries of a matrix in text form, validating as it goes.
 *
 * The header is parsed on construction. Each entry line is parsed as the
 * stream reaches it, so a SparseMat built from this stream sees either every
 * entry or an exception. */
class MatrixTextReader : public SparseMatEntryStream
{
    public:
        /* Args:
         *   text: Contents of a matrix file.
         *   source: Name of the file, used in error messages.
         *
         * Throws:
         *   MalformedHeader, MalformedEntry
         */
        MatrixTextReader(const std::string& text, const std::string& source);

        /* Dimensions declared by the header. */
        index_t header_rows() const;
        index_t header_cols() const;

        bool finished();
        void next();
        index_t row();
        index_t col();
        value_t value();

    private:
        /* Advance to the next non-blank line, or the end, parsing it. */
        void advance();

        std::vector<std::string> lines;
        std::string source;

        index_t nrow, ncol;

        /* Index into `lines` of the current entry. */
        size_t pos;

        index_t cur_row, cur_col;
        value_t cur_value;
};


/* Parse a matrix from text. `source` names it in error messages. */
SparseMat parse_sparse_mat(const std::string& text,
                           const std::string& source = "<string>");

/* The text form of a matrix, with entries in iteration order and no trailing
 * newline. */
std::string format_sparse_mat(const SparseMat& mat);

/* Entire contents of a file. Throws SourceNotFound if it can't be read. */
std::string read_text(const std::string& path);

/* Replace the contents of a file. Throws WriteFailure. */
void write_text(const std::string& path, const std::string& text);

/* Load a matrix from a file. */
SparseMat read_sparse_mat(const std::string& path);

/* Save a matrix to a file. */
void write_sparse_mat(const std::string& path, const SparseMat& mat);

#endif

