#include <boost/lexical_cast.hpp>
#include <gtest/gtest.h>
#include <cstdio>
#include <limits>
#include <string>

#include "errors.hpp"
#include "matrix_io.hpp"
#include "test_util.hpp"


TEST(MatrixIOTest, ParsesHeaderAndEntries) {
    SparseMat m = parse_sparse_mat(
        "rows=3\n"
        "cols=4\n"
        "(0, 1, 5)\n"
        "(2, 3, -2)\n");

    EXPECT_EQ(m.shape(), Shape(3, 4));
    EXPECT_EQ(m.nnz(), 2u);
    EXPECT_EQ(m.get(0, 1), 5);
    EXPECT_EQ(m.get(2, 3), -2);
    EXPECT_EQ(m.get(1, 1), 0);
}


TEST(MatrixIOTest, HeaderOnly) {
    SparseMat m = parse_sparse_mat("rows=0\ncols=0");
    EXPECT_EQ(m.shape(), Shape(0, 0));
    EXPECT_EQ(m.nnz(), 0u);
}


TEST(MatrixIOTest, EntriesGrowDeclaredShape) {
    SparseMat m = parse_sparse_mat("rows=2\ncols=2\n(5, 0, 1)\n(0, 7, 1)\n");
    EXPECT_EQ(m.shape(), Shape(6, 8));
}


TEST(MatrixIOTest, ToleratesWhitespace) {
    SparseMat m = parse_sparse_mat(
        "  rows=2 \r\n"
        "cols=2\r\n"
        "\n"
        "   \n"
        "  (1,1,3)  \r\n"
        "(0,  1,   -4)\n");

    EXPECT_EQ(m.get(1, 1), 3);
    EXPECT_EQ(m.get(0, 1), -4);
    EXPECT_EQ(m.nnz(), 2u);
}


TEST(MatrixIOTest, LaterEntryOverwrites) {
    SparseMat m = parse_sparse_mat("rows=1\ncols=1\n(0, 0, 1)\n(0, 0, 9)\n");
    EXPECT_EQ(m.nnz(), 1u);
    EXPECT_EQ(m.get(0, 0), 9);
}


TEST(MatrixIOTest, MalformedHeader) {
    EXPECT_THROW(parse_sparse_mat("rowz=3\ncols=2\n"), MalformedHeader);
    EXPECT_THROW(parse_sparse_mat("rows=3\ncolumns=2\n"), MalformedHeader);
    EXPECT_THROW(parse_sparse_mat("rows=3x\ncols=2\n"), MalformedHeader);
    EXPECT_THROW(parse_sparse_mat("rows=-3\ncols=2\n"), MalformedHeader);
    EXPECT_THROW(parse_sparse_mat("rows=\ncols=2\n"), MalformedHeader);
    EXPECT_THROW(parse_sparse_mat("cols=2\nrows=3\n"), MalformedHeader);
}


TEST(MatrixIOTest, TooFewLines) {
    EXPECT_THROW(parse_sparse_mat(""), MalformedHeader);
    EXPECT_THROW(parse_sparse_mat("rows=3\n"), MalformedHeader);

    try {
        parse_sparse_mat("rows=3", "a.txt");
        FAIL() << "expected MalformedHeader";
    }
    catch (MalformedHeader& e) {
        EXPECT_EQ(e.source(), "a.txt");
    }
}


TEST(MatrixIOTest, MalformedEntryReportsLine) {
    try {
        parse_sparse_mat("rows=3\ncols=3\n(0, 0, 1)\n\n(1, 2)\n", "m.txt");
        FAIL() << "expected MalformedEntry";
    }
    catch (MalformedEntry& e) {
        EXPECT_EQ(e.line(), 5u);
        EXPECT_EQ(e.content(), "(1, 2)");
        EXPECT_EQ(e.source(), "m.txt");
        EXPECT_NE(std::string(e.what()).find("line 5"), std::string::npos);
    }
}


TEST(MatrixIOTest, RejectsBadEntries) {
    const char* bad[] = {
        "(1, 2, 3",
        "1, 2, 3)",
        "(1, 2, 3) extra",
        "(-1, 2, 3)",
        "(1, -2, 3)",
        "(1, 2, +3)",
        "(1 , 2, 3)",
        "(a, 2, 3)",
        "(1, 2, 3, 4)",
        "(99999999999999999999999, 0, 1)"
    };

    for (size_t i = 0; i < sizeof(bad) / sizeof(bad[0]); ++i) {
        std::string text = std::string("rows=2\ncols=2\n") + bad[i] + "\n";
        EXPECT_THROW(parse_sparse_mat(text), MalformedEntry) << bad[i];
    }
}


TEST(MatrixIOTest, LargestIndexIsMalformed) {
    std::string max_index =
        boost::lexical_cast<std::string>(std::numeric_limits<index_t>::max());

    EXPECT_THROW(parse_sparse_mat("rows=1\ncols=1\n(" + max_index + ", 0, 1)\n"),
                 MalformedEntry);
    EXPECT_THROW(parse_sparse_mat("rows=1\ncols=1\n(0, " + max_index + ", 1)\n"),
                 MalformedEntry);

    // one less still loads, and its shape survives a round trip
    std::string below =
        boost::lexical_cast<std::string>(std::numeric_limits<index_t>::max() - 1);
    SparseMat m = parse_sparse_mat("rows=1\ncols=1\n(" + below + ", 0, 1)\n");
    EXPECT_EQ(m.rows(), std::numeric_limits<index_t>::max());

    SparseMat n = parse_sparse_mat(format_sparse_mat(m));
    EXPECT_EQ(n.shape(), m.shape());
    EXPECT_EQ(n.get(std::numeric_limits<index_t>::max() - 1, 0), 1);
}


TEST(MatrixIOTest, FormatsInInsertionOrder) {
    SparseMat m(2, 3);
    m.set(1, 2, -7);
    m.set(0, 0, 4);

    EXPECT_EQ(format_sparse_mat(m),
              "rows=2\n"
              "cols=3\n"
              "(1, 2, -7)\n"
              "(0, 0, 4)");

    EXPECT_EQ(format_sparse_mat(SparseMat(0, 5)), "rows=0\ncols=5");
}


TEST(MatrixIOTest, FormatThenParsePreservesValues) {
    rng_t rng(1234);
    for (int trial = 0; trial < 10; ++trial) {
        SparseMat m = random_sparse_mat(rng, 6, 4);
        SparseMat n = parse_sparse_mat(format_sparse_mat(m));
        EXPECT_TRUE(same_values(m, n));
        EXPECT_EQ(format_sparse_mat(n), format_sparse_mat(m));
    }
}


TEST(MatrixIOTest, MissingFile) {
    std::string path = temp_path("does-not-exist.txt");
    try {
        read_sparse_mat(path);
        FAIL() << "expected SourceNotFound";
    }
    catch (SourceNotFound& e) {
        EXPECT_EQ(e.path(), path);
    }
}


TEST(MatrixIOTest, DirectoryIsNotASource) {
    std::string dir = ::testing::TempDir();
    EXPECT_THROW(read_text(dir), SourceNotFound);
    EXPECT_THROW(read_sparse_mat(dir), SourceNotFound);
}


TEST(MatrixIOTest, WriteThenRead) {
    std::string path = temp_path("matrix.txt");

    SparseMat m(3, 3);
    m.set(0, 2, 8);
    m.set(2, 1, -1);
    write_sparse_mat(path, m);

    EXPECT_EQ(read_text(path), format_sparse_mat(m));
    EXPECT_TRUE(same_values(read_sparse_mat(path), m));

    remove(path.c_str());
}


TEST(MatrixIOTest, WriteFailure) {
    std::string path = temp_path("no-such-dir/matrix.txt");
    EXPECT_THROW(write_sparse_mat(path, SparseMat(1, 1)), WriteFailure);
}

