
#include <boost/lexical_cast.hpp>
#include <limits>

#include "errors.hpp"


SparseCalcError::SparseCalcError(const std::string& msg)
    : std::runtime_error(msg)
{
}


SourceNotFound::SourceNotFound(const std::string& path)
    : SparseCalcError("File not found: " + path)
    , path_(path)
{
}


const std::string& SourceNotFound::path() const { return path_; }


MalformedHeader::MalformedHeader(const std::string& source,
                                 const std::string& detail)
    : SparseCalcError("Invalid format in " + source + ": " + detail)
    , source_(source)
{
}


const std::string& MalformedHeader::source() const { return source_; }


MalformedEntry::MalformedEntry(const std::string& source, size_t line,
                               const std::string& content)
    : SparseCalcError("Invalid format at line " +
                      boost::lexical_cast<std::string>(line) +
                      " in " + source + ": " + content)
    , source_(source)
    , line_(line)
    , content_(content)
{
}


const std::string& MalformedEntry::source() const { return source_; }
size_t MalformedEntry::line() const { return line_; }
const std::string& MalformedEntry::content() const { return content_; }


DimensionMismatch::DimensionMismatch(const std::string& operation,
                                     const Shape& expected,
                                     const Shape& actual)
    : SparseCalcError("Incompatible dimensions for " + operation +
                      ": expected " + expected.str() +
                      ", got " + actual.str() + ".")
    , operation_(operation)
    , expected_(expected)
    , actual_(actual)
{
}


const std::string& DimensionMismatch::operation() const { return operation_; }
const Shape& DimensionMismatch::expected() const { return expected_; }
const Shape& DimensionMismatch::actual() const { return actual_; }


InvalidOperation::InvalidOperation(const std::string& choice)
    : SparseCalcError("Invalid operation choice: " + choice)
    , choice_(choice)
{
}


const std::string& InvalidOperation::choice() const { return choice_; }


WriteFailure::WriteFailure(const std::string& path)
    : SparseCalcError("Unable to write " + path)
    , path_(path)
{
}


const std::string& WriteFailure::path() const { return path_; }


InvalidIndex::InvalidIndex(index_t row, index_t col)
    : SparseCalcError("Invalid index (" +
                      boost::lexical_cast<std::string>(row) + ", " +
                      boost::lexical_cast<std::string>(col) +
                      "): indices must be non-negative and less than " +
                      boost::lexical_cast<std::string>(
                          std::numeric_limits<index_t>::max()) + ".")
    , row_(row)
    , col_(col)
{
}


index_t InvalidIndex::row() const { return row_; }
index_t InvalidIndex::col() const { return col_; }


ValueOverflow::ValueOverflow(const std::string& operation, index_t row,
                             index_t col)
    : SparseCalcError("Integer overflow in " + operation + " at (" +
                      boost::lexical_cast<std::string>(row) + ", " +
                      boost::lexical_cast<std::string>(col) + ").")
    , operation_(operation)
    , row_(row)
    , col_(col)
{
}


const std::string& ValueOverflow::operation() const { return operation_; }
index_t ValueOverflow::row() const { return row_; }
index_t ValueOverflow::col() const { return col_; }


JobFileError::JobFileError(const std::string& path, const std::string& detail)
    : SparseCalcError("Error parsing " + path + ": " + detail)
    , path_(path)
{
}


const std::string& JobFileError::path() const { return path_; }

