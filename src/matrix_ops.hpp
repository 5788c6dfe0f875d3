#ifndef SPARSECALC_MATRIX_OPS_HPP
#define SPARSECALC_MATRIX_OPS_HPP

#include <cstdio>
#include <string>

#include "sparse_mat.hpp"


typedef SparseMat (*MatrixOpFunc)(const SparseMat&, const SparseMat&);

/* One of the binary operations a user can select. */
struct MatrixOp
{
    /* Key shown in the interactive menu. */
    const char* key;

    /* Full name, e.g. "multiplication". */
    const char* name;

    /* Short name, e.g. "multiply". */
    const char* method;

    MatrixOpFunc func;
};


/* All operations, in menu order. */
extern const MatrixOp matrix_ops[];
extern const size_t num_matrix_ops;

/* Find an operation by menu key, name, or short name.
 *
 * Throws:
 *   InvalidOperation if nothing matches.
 */
const MatrixOp& find_matrix_op(const std::string& choice);

/* Look up `choice` and apply it to a and b. */
SparseMat apply_matrix_op(const std::string& choice,
                          const SparseMat& a, const SparseMat& b);

/* Print the menu of operations. */
void print_matrix_ops(FILE* fout);

#endif

