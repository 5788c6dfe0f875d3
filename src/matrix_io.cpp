
#include <boost/lexical_cast.hpp>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <limits>
#include <sstream>

#include "errors.hpp"
#include "logger.hpp"
#include "matrix_io.hpp"


/* Split on newlines. A trailing newline ends the last line rather than
 * starting an empty one. */
static void split_lines(const std::string& text, std::vector<std::string>& lines)
{
    size_t u = 0;
    while (u < text.size()) {
        size_t v = text.find('\n', u);
        if (v == std::string::npos) {
            lines.push_back(text.substr(u));
            break;
        }
        lines.push_back(text.substr(u, v - u));
        u = v + 1;
    }
}


/* A small cursor over a line, for matching the fixed parts of the format. */
class LineScanner
{
    public:
        LineScanner(const std::string& s)
            : s(s)
            , pos(0)
        {
        }

        bool literal(const char* lit)
        {
            size_t len = strlen(lit);
            if (s.compare(pos, len, lit) != 0) return false;
            pos += len;
            return true;
        }

        void skip_space()
        {
            while (pos < s.size() && isspace(static_cast<unsigned char>(s[pos]))) {
                ++pos;
            }
        }

        /* An optionally negative run of digits that fits in a long. */
        bool integer(long& x, bool allow_negative)
        {
            size_t start = pos;
            if (allow_negative && pos < s.size() && s[pos] == '-') ++pos;

            size_t digits_start = pos;
            while (pos < s.size() && isdigit(static_cast<unsigned char>(s[pos]))) {
                ++pos;
            }
            if (pos == digits_start) return false;

            try {
                x = boost::lexical_cast<long>(s.substr(start, pos - start));
            }
            catch (boost::bad_lexical_cast&) {
                return false;
            }

            return true;
        }

        bool at_end() const
        {
            return pos == s.size();
        }

    private:
        const std::string& s;
        size_t pos;
};


/* Parse "NAME=DIGITS" exactly. */
static bool parse_dimension(const std::string& line, const char* name,
                            index_t& x)
{
    LineScanner scanner(line);
    return scanner.literal(name) &&
           scanner.literal("=") &&
           scanner.integer(x, false) &&
           scanner.at_end();
}


/* Parse "(ROW, COL, VALUE)" exactly. Any amount of whitespace, including
 * none, may follow each comma. The largest index_t is not a usable index,
 * since the shape holding it would be one larger. */
static bool parse_entry(const std::string& line, index_t& i, index_t& j,
                        value_t& x)
{
    LineScanner scanner(line);

    if (!scanner.literal("(") || !scanner.integer(i, false)) return false;
    if (!scanner.literal(",")) return false;
    scanner.skip_space();

    if (!scanner.integer(j, false) || !scanner.literal(",")) return false;
    scanner.skip_space();

    const index_t max_index = std::numeric_limits<index_t>::max();
    return i != max_index && j != max_index &&
           scanner.integer(x, true) &&
           scanner.literal(")") &&
           scanner.at_end();
}


MatrixTextReader::MatrixTextReader(const std::string& text,
                                   const std::string& source)
    : source(source)
    , nrow(0)
    , ncol(0)
    , pos(1)
    , cur_row(0)
    , cur_col(0)
    , cur_value(0)
{
    split_lines(text, lines);

    if (lines.size() < 2) {
        throw MalformedHeader(source,
            "not enough lines for matrix dimensions.");
    }

    if (!parse_dimension(trim(lines[0]), "rows", nrow) ||
        !parse_dimension(trim(lines[1]), "cols", ncol)) {
        throw MalformedHeader(source, "expected 'rows=X' and 'cols=Y'.");
    }

    advance();
}


index_t MatrixTextReader::header_rows() const { return nrow; }
index_t MatrixTextReader::header_cols() const { return ncol; }


bool MatrixTextReader::finished()
{
    return pos >= lines.size();
}


void MatrixTextReader::next()
{
    advance();
}


index_t MatrixTextReader::row() { return cur_row; }
index_t MatrixTextReader::col() { return cur_col; }
value_t MatrixTextReader::value() { return cur_value; }


void MatrixTextReader::advance()
{
    for (++pos; pos < lines.size(); ++pos) {
        std::string line = trim(lines[pos]);
        if (line.empty()) continue;

        if (!parse_entry(line, cur_row, cur_col, cur_value)) {
            throw MalformedEntry(source, pos + 1, line);
        }
        break;
    }
}


SparseMat parse_sparse_mat(const std::string& text, const std::string& source)
{
    MatrixTextReader reader(text, source);
    return SparseMat(reader.header_rows(), reader.header_cols(), reader);
}


std::string format_sparse_mat(const SparseMat& mat)
{
    std::ostringstream out;
    out << "rows=" << mat.rows() << "\n"
        << "cols=" << mat.cols();

    for (SparseMat::const_iterator e = mat.begin(); e != mat.end(); ++e) {
        out << "\n(" << e->row << ", " << e->col << ", " << e->value << ")";
    }

    return out.str();
}


std::string read_text(const std::string& path)
{
    FILE* in = fopen(path.c_str(), "rb");
    if (!in) {
        throw SourceNotFound(path);
    }

    std::string contents;
    char buf[4096];
    size_t n;
    while ((n = fread(buf, 1, sizeof(buf), in)) > 0) {
        contents.append(buf, n);
    }

    /* opening a directory succeeds, reading it does not */
    bool failed = ferror(in) != 0;
    fclose(in);
    if (failed) {
        throw SourceNotFound(path);
    }

    return contents;
}


void write_text(const std::string& path, const std::string& text)
{
    FILE* out = fopen(path.c_str(), "w");
    if (!out) {
        throw WriteFailure(path);
    }

    size_t written = fwrite(text.data(), 1, text.size(), out);
    if (fclose(out) != 0 || written != text.size()) {
        throw WriteFailure(path);
    }
}


SparseMat read_sparse_mat(const std::string& path)
{
    SparseMat mat = parse_sparse_mat(read_text(path), path);
    Logger::debug("Read %s: %s with %lu stored entries.", path.c_str(),
                  mat.shape().str().c_str(), (unsigned long) mat.nnz());
    return mat;
}


void write_sparse_mat(const std::string& path, const SparseMat& mat)
{
    write_text(path, format_sparse_mat(mat));
    Logger::debug("Wrote %s.", path.c_str());
}

