
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <iostream>
#include <string>
#include <vector>

#include "constants.hpp"
#include "errors.hpp"
#include "jobs.hpp"
#include "logger.hpp"
#include "matrix_io.hpp"
#include "matrix_ops.hpp"
#include "sparse_mat.hpp"


static void print_result(FILE* fout, const MatrixOp& op, const SparseMat& c)
{
    fprintf(fout, "Output of %s operation:\n%s\n",
            op.name, format_sparse_mat(c).c_str());
}


static void print_compute_usage(FILE* fout)
{
    fprintf(fout, "Usage: sparsecalc compute [options] a.txt b.txt\n");
}


static void print_compute_help(FILE* fout)
{
    print_compute_usage(fout);
    fprintf(fout,
            "\nOptions:\n"
            "-h, --help                Print this help message\n"
            "-O, --operation=OP        One of addition, subtraction, multiplication\n"
            "                          (or add, subtract, multiply). (default: addition)\n"
            "-o, --output=FILE         Write the result to the given file (default: %s)\n"
            "-n, --dry-run             Print the result but don't write it.\n"
            "-v, --verbose             Print additional information.\n"
            "    --no-color            Don't color log output.\n",
            constants::default_output_filename);
}


static int sparsecalc_compute(int argc, char* argv[])
{
    static struct option long_options[] =
    {
        {"help",      no_argument,       NULL, 'h'},
        {"operation", required_argument, NULL, 'O'},
        {"output",    required_argument, NULL, 'o'},
        {"dry-run",   no_argument,       NULL, 'n'},
        {"verbose",   no_argument,       NULL, 'v'},
        {"no-color",  no_argument,       NULL, 0},
        {0, 0, 0, 0}
    };

    MatrixJob job;
    job.operation = "addition";
    bool dryrun = false;

    int opt;
    int opt_idx;
    while (true) {
        opt = getopt_long(argc, argv, "hO:o:nv", long_options, &opt_idx);

        if (opt == -1) break;

        switch (opt) {
            case 'h':
                print_compute_help(stdout);
                return 0;

            case 'O':
                job.operation = optarg;
                break;

            case 'o':
                job.output = optarg;
                break;

            case 'n':
                dryrun = true;
                break;

            case 'v':
                Logger::set_level(Logger::DEBUG);
                break;

            case 0:
                if (strcmp(long_options[opt_idx].name, "no-color") == 0) {
                    Logger::set_color(false);
                }
                break;

            case '?':
                fprintf(stderr, "\n");
                print_compute_help(stderr);
                return 1;

            default:
                abort();
        }
    }

    if (optind + 2 > argc) {
        fprintf(stderr, "Too few arguments.\n\n");
        print_compute_usage(stderr);
        return 1;
    }
    else if (optind + 2 < argc) {
        fprintf(stderr, "Too many arguments.\n\n");
        print_compute_usage(stderr);
        return 1;
    }

    job.first = argv[optind];
    job.second = argv[optind + 1];

    Logger::start();

    try {
        const MatrixOp& op = find_matrix_op(job.operation);
        SparseMat c = run_matrix_job(job, dryrun);
        print_result(stdout, op, c);
        if (!dryrun) {
            Logger::info("Output file saved at: %s", job.output.c_str());
        }
    }
    catch (SparseCalcError& e) {
        Logger::abort("%s", e.what());
    }

    Logger::end();
    return EXIT_SUCCESS;
}


static void print_interactive_help(FILE* fout)
{
    fprintf(fout,
            "Usage: sparsecalc interactive [options]\n\n"
            "Prompt for two matrix files and an operation, then print the result\n"
            "and save it.\n"
            "\nOptions:\n"
            "-h, --help                Print this help message\n"
            "-o, --output=FILE         Write the result to the given file (default: %s)\n"
            "-v, --verbose             Print additional information.\n"
            "    --no-color            Don't color log output.\n",
            constants::default_output_filename);
}


/* Print a prompt and read one line from standard in. */
static std::string prompt(const char* msg)
{
    fputs(msg, stdout);
    fflush(stdout);

    std::string line;
    if (!std::getline(std::cin, line)) {
        Logger::abort("Unexpected end of input.");
    }

    return line;
}


static int sparsecalc_interactive(int argc, char* argv[])
{
    static struct option long_options[] =
    {
        {"help",     no_argument,       NULL, 'h'},
        {"output",   required_argument, NULL, 'o'},
        {"verbose",  no_argument,       NULL, 'v'},
        {"no-color", no_argument,       NULL, 0},
        {0, 0, 0, 0}
    };

    std::string output_filename = constants::default_output_filename;

    int opt;
    int opt_idx;
    while (true) {
        opt = getopt_long(argc, argv, "ho:v", long_options, &opt_idx);

        if (opt == -1) break;

        switch (opt) {
            case 'h':
                print_interactive_help(stdout);
                return 0;

            case 'o':
                output_filename = optarg;
                break;

            case 'v':
                Logger::set_level(Logger::DEBUG);
                break;

            case 0:
                if (strcmp(long_options[opt_idx].name, "no-color") == 0) {
                    Logger::set_color(false);
                }
                break;

            case '?':
                fprintf(stderr, "\n");
                print_interactive_help(stderr);
                return 1;

            default:
                abort();
        }
    }

    if (optind < argc) {
        fprintf(stderr, "Too many arguments.\n\n");
        print_interactive_help(stderr);
        return 1;
    }

    /* The printer thread isn't started here, so log output doesn't land in
     * the middle of a prompt. Everything queued is printed by Logger::end. */

    try {
        print_matrix_ops(stdout);

        std::string first = prompt("Enter the file path for the first matrix: ");
        SparseMat a = read_sparse_mat(first);
        printf("1st matrix loaded successfully.\n\n");

        std::string second = prompt("Enter the file path for the second matrix: ");
        SparseMat b = read_sparse_mat(second);
        printf("2nd matrix loaded successfully.\n\n");

        std::string choice = prompt("Choose an operation (1, 2, or 3): ");
        const MatrixOp& op = find_matrix_op(choice);

        SparseMat c = op.func(a, b);
        print_result(stdout, op, c);

        write_sparse_mat(output_filename, c);
        printf("Output file saved at: %s\n", output_filename.c_str());
    }
    catch (SparseCalcError& e) {
        Logger::abort("%s", e.what());
    }

    Logger::end();
    return EXIT_SUCCESS;
}


static void print_batch_usage(FILE* fout)
{
    fprintf(fout, "Usage: sparsecalc batch [options] jobs.yml\n");
}


static void print_batch_help(FILE* fout)
{
    print_batch_usage(fout);
    fprintf(fout,
            "\nRun every job listed in a YAML file of the form:\n\n"
            "  - first: a.txt\n"
            "    second: b.txt\n"
            "    operation: multiplication\n"
            "    output: ab.txt\n"
            "\nOptions:\n"
            "-h, --help                Print this help message\n"
            "-n, --dry-run             Compute results but don't write them.\n"
            "-v, --verbose             Print additional information.\n"
            "    --no-color            Don't color log output.\n");
}


static int sparsecalc_batch(int argc, char* argv[])
{
    static struct option long_options[] =
    {
        {"help",     no_argument, NULL, 'h'},
        {"dry-run",  no_argument, NULL, 'n'},
        {"verbose",  no_argument, NULL, 'v'},
        {"no-color", no_argument, NULL, 0},
        {0, 0, 0, 0}
    };

    bool dryrun = false;

    int opt;
    int opt_idx;
    while (true) {
        opt = getopt_long(argc, argv, "hnv", long_options, &opt_idx);

        if (opt == -1) break;

        switch (opt) {
            case 'h':
                print_batch_help(stdout);
                return 0;

            case 'n':
                dryrun = true;
                break;

            case 'v':
                Logger::set_level(Logger::DEBUG);
                break;

            case 0:
                if (strcmp(long_options[opt_idx].name, "no-color") == 0) {
                    Logger::set_color(false);
                }
                break;

            case '?':
                fprintf(stderr, "\n");
                print_batch_help(stderr);
                return 1;

            default:
                abort();
        }
    }

    if (optind + 1 != argc) {
        fputs(optind == argc ? "Too few arguments.\n\n"
                             : "Too many arguments.\n\n", stderr);
        print_batch_usage(stderr);
        return 1;
    }

    const char* job_filename = argv[optind];

    Logger::start();

    try {
        std::vector<MatrixJob> jobs;
        read_job_file(job_filename, jobs);
        Logger::info("Read %lu jobs from %s.",
                     (unsigned long) jobs.size(), job_filename);

        const char* task_name = "Running jobs";
        Logger::push_task(task_name, jobs.size());

        for (size_t i = 0; i < jobs.size(); ++i) {
            run_matrix_job(jobs[i], dryrun);
            if (!dryrun) {
                Logger::info("Output file saved at: %s", jobs[i].output.c_str());
            }
            Logger::get_task(task_name).inc();
        }

        Logger::pop_task(task_name);
    }
    catch (SparseCalcError& e) {
        Logger::abort("%s", e.what());
    }

    Logger::info("Finished %s.", job_filename);
    Logger::end();
    return EXIT_SUCCESS;
}


static void print_describe_usage(FILE* fout)
{
    fprintf(fout, "Usage: sparsecalc describe matrix.txt\n");
}


static int sparsecalc_describe(int argc, char* argv[])
{
    static struct option long_options[] =
    {
        {"help", no_argument, NULL, 'h'},
        {0, 0, 0, 0}
    };

    int opt;
    int opt_idx;
    while (true) {
        opt = getopt_long(argc, argv, "h", long_options, &opt_idx);

        if (opt == -1) break;

        switch (opt) {
            case 'h':
                print_describe_usage(stdout);
                return 0;

            case '?':
                fprintf(stderr, "\n");
                print_describe_usage(stderr);
                return 1;

            default:
                abort();
        }
    }

    /* no positional arguments */
    if (optind == argc) {
        print_describe_usage(stdout);
        return 0;
    }

    /* too many */
    else if (optind + 1 < argc) {
        fprintf(stderr, "Too many arguments.\n\n");
        print_describe_usage(stderr);
        return 1;
    }

    const char* filename = argv[optind];

    try {
        SparseMat mat = read_sparse_mat(filename);

        double cells = (double) mat.rows() * (double) mat.cols();
        printf("%s\n"
               "  rows:           %ld\n"
               "  cols:           %ld\n"
               "  stored entries: %lu\n"
               "  density:        %0.4f%%\n",
               filename, mat.rows(), mat.cols(),
               (unsigned long) mat.nnz(),
               cells > 0 ? 100.0 * (double) mat.nnz() / cells : 0.0);
    }
    catch (SparseCalcError& e) {
        Logger::abort("%s", e.what());
    }

    Logger::end();
    return EXIT_SUCCESS;
}


static void print_usage(FILE* fout)
{
    fprintf(fout,
            "Usage: sparsecalc <command> [<args>]\n\n"
            "Where <command> is one of:\n"
            "    compute           Add, subtract, or multiply two matrix files.\n"
            "    interactive       Choose files and an operation at a prompt.\n"
            "    batch             Run jobs listed in a YAML file.\n"
            "    describe          Print the shape and size of a matrix file.\n"
            "    help              Print this message.\n\n"
            "Run 'sparsecalc <command> --help' for the options of a command.\n");
}


int main(int argc, char* argv[])
{
    if (argc <= 1) {
        print_usage(stdout);
        return EXIT_SUCCESS;
    }

    ++argv;
    --argc;

    if (strcmp(argv[0], "-h") == 0 || strcmp(argv[0], "--help") == 0 ||
        strcmp(argv[0], "help") == 0) {
        print_usage(stdout);
        return EXIT_SUCCESS;
    }

    if (strcmp(argv[0], "compute") == 0) {
        return sparsecalc_compute(argc, argv);
    }
    else if (strcmp(argv[0], "interactive") == 0) {
        return sparsecalc_interactive(argc, argv);
    }
    else if (strcmp(argv[0], "batch") == 0) {
        return sparsecalc_batch(argc, argv);
    }
    else if (strcmp(argv[0], "describe") == 0) {
        return sparsecalc_describe(argc, argv);
    }

    fprintf(stderr, "Unknown command %s.\n\n", argv[0]);
    print_usage(stderr);
    return EXIT_FAILURE;
}

