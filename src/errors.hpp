#ifndef SPARSECALC_ERRORS_HPP
#define SPARSECALC_ERRORS_HPP

#include <stdexcept>
#include <string>

#include "common.hpp"


/* Everything that can go wrong loading, combining, or saving matrices. None of
 * these are recoverable within a single run: they are thrown where the
 * problem is detected and reported by the command line driver. */
class SparseCalcError : public std::runtime_error
{
    public:
        explicit SparseCalcError(const std::string& msg);
};


/* A matrix file could not be opened or read. */
class SourceNotFound : public SparseCalcError
{
    public:
        explicit SourceNotFound(const std::string& path);

        const std::string& path() const;

    private:
        std::string path_;
};


/* The "rows=" / "cols=" header is missing or malformed. */
class MalformedHeader : public SparseCalcError
{
    public:
        MalformedHeader(const std::string& source, const std::string& detail);

        const std::string& source() const;

    private:
        std::string source_;
};


/* An entry line did not have the form "(row, col, value)". */
class MalformedEntry : public SparseCalcError
{
    public:
        MalformedEntry(const std::string& source, size_t line,
                       const std::string& content);

        const std::string& source() const;

        /* 1-based line number within the source. */
        size_t line() const;
        const std::string& content() const;

    private:
        std::string source_;
        size_t line_;
        std::string content_;
};


/* Operand shapes are incompatible with the requested operation.
 *
 * For addition and subtraction, `expected` is the shape of the first operand.
 * For multiplication it is the shape the second operand would need (rows equal
 * to the first operand's columns). `actual` is always the second operand's
 * shape.
 */
class DimensionMismatch : public SparseCalcError
{
    public:
        DimensionMismatch(const std::string& operation,
                          const Shape& expected, const Shape& actual);

        const std::string& operation() const;
        const Shape& expected() const;
        const Shape& actual() const;

    private:
        std::string operation_;
        Shape expected_, actual_;
};


/* An operation was selected that doesn't exist. */
class InvalidOperation : public SparseCalcError
{
    public:
        explicit InvalidOperation(const std::string& choice);

        const std::string& choice() const;

    private:
        std::string choice_;
};


/* The result could not be written. */
class WriteFailure : public SparseCalcError
{
    public:
        explicit WriteFailure(const std::string& path);

        const std::string& path() const;

    private:
        std::string path_;
};


/* A negative or too large row or column index was given to SparseMat::set. */
class InvalidIndex : public SparseCalcError
{
    public:
        InvalidIndex(index_t row, index_t col);

        index_t row() const;
        index_t col() const;

    private:
        index_t row_, col_;
};


/* An arithmetic result does not fit in value_t. */
class ValueOverflow : public SparseCalcError
{
    public:
        ValueOverflow(const std::string& operation, index_t row, index_t col);

        const std::string& operation() const;
        index_t row() const;
        index_t col() const;

    private:
        std::string operation_;
        index_t row_, col_;
};


/* A YAML job file was unreadable or didn't describe a list of jobs. */
class JobFileError : public SparseCalcError
{
    public:
        JobFileError(const std::string& path, const std::string& detail);

        const std::string& path() const;

    private:
        std::string path_;
};

#endif

