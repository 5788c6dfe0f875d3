#ifndef SPARSECALC_JOBS_HPP
#define SPARSECALC_JOBS_HPP

#include <string>
#include <vector>

#include "sparse_mat.hpp"


/* One operation to perform: `output` = `first` <operation> `second`. */
struct MatrixJob
{
    MatrixJob();

    std::string first;
    std::string second;

    /* Menu key, name, or short name of the operation. */
    std::string operation;

    std::string output;
};


/* Parse a YAML file describing a list of jobs, e.g.
 *
 *   - first: a.txt
 *     second: b.txt
 *     operation: multiplication
 *     output: ab.txt
 *
 * `output` is optional and defaults to constants::default_output_filename.
 * Parsed jobs are appended to `jobs`.
 *
 * Throws:
 *   SourceNotFound if the file can't be opened, JobFileError if it doesn't
 *   have this form.
 */
void read_job_file(const char* filename, std::vector<MatrixJob>& jobs);


/* Load both operands, apply the operation, and unless `dryrun` is set write
 * the result to the job's output file. The result is returned either way. */
SparseMat run_matrix_job(const MatrixJob& job, bool dryrun = false);

#endif

