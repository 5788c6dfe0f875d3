
#include <algorithm>
#include <limits>

#include "constants.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "sparse_mat.hpp"


SparseMatEntry::SparseMatEntry(index_t row, index_t col, value_t value)
    : row(row)
    , col(col)
    , value(value)
{
}


SparseMat::SparseMat()
    : nrow(0)
    , ncol(0)
{
}


SparseMat::SparseMat(index_t nrow, index_t ncol)
    : nrow(nrow)
    , ncol(ncol)
{
}


SparseMat::SparseMat(index_t nrow, index_t ncol, SparseMatEntryStream& entries)
    : nrow(nrow)
    , ncol(ncol)
{
    while (!entries.finished()) {
        set(entries.row(), entries.col(), entries.value());
        entries.next();
    }
}


value_t SparseMat::get(index_t i, index_t j) const
{
    EntryIndex::const_iterator k = index.find(Key(i, j));
    if (k == index.end()) return 0;
    return entries[k->second].value;
}


void SparseMat::set(index_t i, index_t j, value_t x)
{
    /* the largest index is excluded so that i + 1 is always a valid shape */
    const index_t max_index = std::numeric_limits<index_t>::max();
    if (i < 0 || j < 0 || i == max_index || j == max_index) {
        throw InvalidIndex(i, j);
    }

    if (i >= nrow) nrow = i + 1;
    if (j >= ncol) ncol = j + 1;

    EntryIndex::iterator k = index.find(Key(i, j));
    if (k != index.end()) {
        entries[k->second].value = x;
    }
    else {
        index.insert(std::make_pair(Key(i, j), entries.size()));
        entries.push_back(SparseMatEntry(i, j, x));
    }
}


bool SparseMat::has(index_t i, index_t j) const
{
    return index.find(Key(i, j)) != index.end();
}


index_t SparseMat::rows() const { return nrow; }
index_t SparseMat::cols() const { return ncol; }
Shape SparseMat::shape() const { return Shape(nrow, ncol); }
size_t SparseMat::nnz() const { return entries.size(); }


SparseMat::const_iterator SparseMat::begin() const { return entries.begin(); }
SparseMat::const_iterator SparseMat::end() const { return entries.end(); }


static value_t checked_add(const char* operation, const SparseMatEntry& e,
                           value_t x, value_t y)
{
    value_t z;
    if (__builtin_add_overflow(x, y, &z)) {
        throw ValueOverflow(operation, e.row, e.col);
    }
    return z;
}


static value_t checked_sub(const char* operation, const SparseMatEntry& e,
                           value_t x, value_t y)
{
    value_t z;
    if (__builtin_sub_overflow(x, y, &z)) {
        throw ValueOverflow(operation, e.row, e.col);
    }
    return z;
}


static value_t checked_mul(const char* operation, const SparseMatEntry& e,
                           value_t x, value_t y)
{
    value_t z;
    if (__builtin_mul_overflow(x, y, &z)) {
        throw ValueOverflow(operation, e.row, e.col);
    }
    return z;
}


/* Shared by add and subtract: copy a, then fold each of b's entries in with
 * addition or subtraction. */
static SparseMat elementwise(const char* operation, const SparseMat& a,
                             const SparseMat& b, bool negate)
{
    if (a.shape() != b.shape()) {
        throw DimensionMismatch(operation, a.shape(), b.shape());
    }

    SparseMat c(a.rows(), a.cols());
    for (SparseMat::const_iterator e = a.begin(); e != a.end(); ++e) {
        c.set(e->row, e->col, e->value);
    }

    for (SparseMat::const_iterator e = b.begin(); e != b.end(); ++e) {
        value_t x = c.get(e->row, e->col);
        c.set(e->row, e->col,
              negate ? checked_sub(operation, *e, x, e->value)
                     : checked_add(operation, *e, x, e->value));
    }

    return c;
}


SparseMat add(const SparseMat& a, const SparseMat& b)
{
    return elementwise("addition", a, b, false);
}


SparseMat subtract(const SparseMat& a, const SparseMat& b)
{
    return elementwise("subtraction", a, b, true);
}


typedef std::pair<index_t, value_t> RowEntry;

static bool row_entry_col_less(const RowEntry& u, const RowEntry& v)
{
    return u.first < v.first;
}


SparseMat multiply(const SparseMat& a, const SparseMat& b)
{
    if (a.cols() != b.rows()) {
        throw DimensionMismatch("multiplication",
                                Shape(a.cols(), b.cols()), b.shape());
    }

    /* Non-zero entries of b, grouped by row and ordered by column. Explicitly
     * stored zeros contribute nothing to the product and are left out. */
    typedef boost::unordered_map<index_t, std::vector<RowEntry> > RowIndex;
    RowIndex b_rows;
    for (SparseMat::const_iterator e = b.begin(); e != b.end(); ++e) {
        if (e->value != 0) {
            b_rows[e->row].push_back(RowEntry(e->col, e->value));
        }
    }

    for (RowIndex::iterator r = b_rows.begin(); r != b_rows.end(); ++r) {
        std::sort(r->second.begin(), r->second.end(), row_entry_col_less);
    }

    const char* task_name = "Multiplying";
    bool show_progress = a.nnz() >= constants::progress_min_entries;
    if (show_progress) {
        Logger::push_task(task_name,
                          a.nnz() / constants::progress_update_interval);
    }

    SparseMat c(a.rows(), b.cols());
    size_t count = 0;
    try {
        for (SparseMat::const_iterator e = a.begin(); e != a.end(); ++e) {
            RowIndex::const_iterator r = b_rows.find(e->col);
            if (r != b_rows.end()) {
                std::vector<RowEntry>::const_iterator f;
                for (f = r->second.begin(); f != r->second.end(); ++f) {
                    SparseMatEntry at(e->row, f->first, 0);
                    value_t x = checked_mul("multiplication", at, e->value, f->second);
                    c.set(e->row, f->first,
                          checked_add("multiplication", at, c.get(e->row, f->first), x));
                }
            }

            if (show_progress && ++count % constants::progress_update_interval == 0) {
                Logger::get_task(task_name).inc();
            }
        }
    }
    catch (SparseCalcError&) {
        if (show_progress) Logger::pop_task(task_name);
        throw;
    }

    if (show_progress) Logger::pop_task(task_name);

    Logger::debug("Product is %s with %lu stored entries.",
                  c.shape().str().c_str(), (unsigned long) c.nnz());

    return c;
}

