#include <gtest/gtest.h>
#include <cstdio>
#include <string>
#include <vector>

#include "constants.hpp"
#include "errors.hpp"
#include "jobs.hpp"
#include "matrix_io.hpp"
#include "test_util.hpp"


class JobsTest : public ::testing::Test {
protected:
    ~JobsTest()
    {
        for (size_t i = 0; i < paths.size(); ++i) {
            remove(paths[i].c_str());
        }
    }

    std::string write_file(const std::string& name, const std::string& text)
    {
        std::string path = temp_path(name);
        write_text(path, text);
        paths.push_back(path);
        return path;
    }

    std::vector<std::string> paths;
};


TEST_F(JobsTest, ReadsJobList) {
    std::string path = write_file("jobs.yml",
        "- first: a.txt\n"
        "  second: b.txt\n"
        "  operation: multiplication\n"
        "  output: ab.txt\n"
        "- first: c.txt\n"
        "  second: d.txt\n"
        "  operation: 3\n");

    std::vector<MatrixJob> jobs;
    read_job_file(path.c_str(), jobs);

    ASSERT_EQ(jobs.size(), 2u);
    EXPECT_EQ(jobs[0].first, "a.txt");
    EXPECT_EQ(jobs[0].second, "b.txt");
    EXPECT_EQ(jobs[0].operation, "multiplication");
    EXPECT_EQ(jobs[0].output, "ab.txt");
    EXPECT_EQ(jobs[1].operation, "3");
    EXPECT_EQ(jobs[1].output, constants::default_output_filename);
}


TEST_F(JobsTest, EmptyList) {
    std::string path = write_file("jobs.yml", "[]\n");
    std::vector<MatrixJob> jobs;
    read_job_file(path.c_str(), jobs);
    EXPECT_TRUE(jobs.empty());
}


TEST_F(JobsTest, MissingField) {
    std::string path = write_file("jobs.yml",
        "- first: a.txt\n"
        "  operation: add\n");

    std::vector<MatrixJob> jobs;
    try {
        read_job_file(path.c_str(), jobs);
        FAIL() << "expected JobFileError";
    }
    catch (JobFileError& e) {
        EXPECT_EQ(e.path(), path);
        EXPECT_NE(std::string(e.what()).find("second"), std::string::npos);
    }
}


TEST_F(JobsTest, UnknownField) {
    std::string path = write_file("jobs.yml",
        "- first: a.txt\n"
        "  second: b.txt\n"
        "  operation: add\n"
        "  colour: blue\n");

    std::vector<MatrixJob> jobs;
    EXPECT_THROW(read_job_file(path.c_str(), jobs), JobFileError);
}


TEST_F(JobsTest, WrongStructure) {
    std::vector<MatrixJob> jobs;

    std::string mapping = write_file("mapping.yml", "first: a.txt\n");
    EXPECT_THROW(read_job_file(mapping.c_str(), jobs), JobFileError);

    std::string nested = write_file("nested.yml",
        "- first: [a.txt, b.txt]\n");
    EXPECT_THROW(read_job_file(nested.c_str(), jobs), JobFileError);

    std::string empty = write_file("empty.yml", "");
    EXPECT_THROW(read_job_file(empty.c_str(), jobs), JobFileError);

    std::string broken = write_file("broken.yml", "- first: [a.txt\n");
    EXPECT_THROW(read_job_file(broken.c_str(), jobs), JobFileError);
}


TEST_F(JobsTest, MissingJobFile) {
    std::vector<MatrixJob> jobs;
    std::string path = temp_path("missing.yml");
    EXPECT_THROW(read_job_file(path.c_str(), jobs), SourceNotFound);
}


TEST_F(JobsTest, RunWritesResult) {
    MatrixJob job;
    job.first = write_file("a.txt", "rows=1\ncols=2\n(0, 0, 1)\n(0, 1, 2)\n");
    job.second = write_file("b.txt", "rows=2\ncols=1\n(0, 0, 3)\n(1, 0, 4)\n");
    job.operation = "multiplication";
    job.output = temp_path("result.txt");
    paths.push_back(job.output);

    SparseMat c = run_matrix_job(job);
    EXPECT_EQ(c.get(0, 0), 11);
    EXPECT_EQ(read_text(job.output), "rows=1\ncols=1\n(0, 0, 11)");
}


TEST_F(JobsTest, DryRunWritesNothing) {
    MatrixJob job;
    job.first = write_file("a.txt", "rows=1\ncols=1\n(0, 0, 1)\n");
    job.second = write_file("b.txt", "rows=1\ncols=1\n(0, 0, 2)\n");
    job.operation = "add";
    job.output = temp_path("result.txt");

    SparseMat c = run_matrix_job(job, true);
    EXPECT_EQ(c.get(0, 0), 3);
    EXPECT_THROW(read_text(job.output), SourceNotFound);
}


TEST_F(JobsTest, FailedRunWritesNothing) {
    MatrixJob job;
    job.first = write_file("a.txt", "rows=2\ncols=3\n");
    job.second = write_file("b.txt", "rows=4\ncols=2\n");
    job.operation = "multiply";
    job.output = temp_path("result.txt");

    EXPECT_THROW(run_matrix_job(job), DimensionMismatch);
    EXPECT_THROW(read_text(job.output), SourceNotFound);

    job.operation = "divide";
    EXPECT_THROW(run_matrix_job(job), InvalidOperation);
}

