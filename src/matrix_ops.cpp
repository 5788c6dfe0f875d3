
#include "errors.hpp"
#include "matrix_ops.hpp"


const MatrixOp matrix_ops[] =
{
    {"1", "subtraction",    "subtract", subtract},
    {"2", "multiplication", "multiply", multiply},
    {"3", "addition",       "add",      add}
};

const size_t num_matrix_ops = sizeof(matrix_ops) / sizeof(MatrixOp);


const MatrixOp& find_matrix_op(const std::string& choice)
{
    std::string c = trim(choice);
    for (size_t i = 0; i < num_matrix_ops; ++i) {
        if (c == matrix_ops[i].key ||
            c == matrix_ops[i].name ||
            c == matrix_ops[i].method) {
            return matrix_ops[i];
        }
    }

    throw InvalidOperation(choice);
}


SparseMat apply_matrix_op(const std::string& choice,
                          const SparseMat& a, const SparseMat& b)
{
    const MatrixOp& op = find_matrix_op(choice);
    return op.func(a, b);
}


void print_matrix_ops(FILE* fout)
{
    fprintf(fout, "Available operations:\n");
    for (size_t i = 0; i < num_matrix_ops; ++i) {
        fprintf(fout, "%s: %s\n", matrix_ops[i].key, matrix_ops[i].name);
    }
}

