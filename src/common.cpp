
#include <boost/lexical_cast.hpp>
#include <cctype>

#include "common.hpp"


Shape::Shape(index_t rows, index_t cols)
    : rows(rows)
    , cols(cols)
{
}


bool Shape::operator == (const Shape& other) const
{
    return rows == other.rows && cols == other.cols;
}


bool Shape::operator != (const Shape& other) const
{
    return !(*this == other);
}


std::string Shape::str() const
{
    return boost::lexical_cast<std::string>(rows) + "x" +
           boost::lexical_cast<std::string>(cols);
}


std::string trim(const std::string& s)
{
    size_t u = 0, v = s.size();
    while (u < v && isspace(static_cast<unsigned char>(s[u]))) ++u;
    while (v > u && isspace(static_cast<unsigned char>(s[v - 1]))) --v;
    return s.substr(u, v - u);
}

