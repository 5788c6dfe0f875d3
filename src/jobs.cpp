
#include <boost/lexical_cast.hpp>
#include <boost/noncopyable.hpp>
#include <cstdio>
#include <yaml.h>

#include "constants.hpp"
#include "errors.hpp"
#include "jobs.hpp"
#include "logger.hpp"
#include "matrix_io.hpp"
#include "matrix_ops.hpp"


MatrixJob::MatrixJob()
    : output(constants::default_output_filename)
{
}


static std::string yaml_event_name(yaml_event_type_t type)
{
    switch (type) {
        case YAML_STREAM_START_EVENT:
            return "stream start";
        case YAML_STREAM_END_EVENT:
            return "stream end";
        case YAML_DOCUMENT_START_EVENT:
            return "document start";
        case YAML_DOCUMENT_END_EVENT:
            return "document end";
        case YAML_ALIAS_EVENT:
            return "alias";
        case YAML_SCALAR_EVENT:
            return "scalar";
        case YAML_SEQUENCE_START_EVENT:
            return "sequence start";
        case YAML_SEQUENCE_END_EVENT:
            return "sequence end";
        case YAML_MAPPING_START_EVENT:
            return "mapping start";
        case YAML_MAPPING_END_EVENT:
            return "mapping end";
        default:
            return "unknown event";
    }
}


static JobFileError job_file_error(const char* filename, size_t line,
                                   const std::string& detail)
{
    return JobFileError(filename,
                        "line " + boost::lexical_cast<std::string>(line) +
                        ": " + detail);
}


static JobFileError job_file_error(const char* filename, size_t line,
                                   yaml_event_type_t expected,
                                   yaml_event_type_t observed)
{
    return job_file_error(filename, line,
                          "expected " + yaml_event_name(expected) +
                          " but found " + yaml_event_name(observed) + ".");
}


/* Owns the open file and parser for the duration of a parse. */
class YamlFileParser : boost::noncopyable
{
    public:
        YamlFileParser(const char* filename)
            : input(fopen(filename, "rb"))
        {
            if (!input) {
                throw SourceNotFound(filename);
            }

            yaml_parser_initialize(&parser);
            yaml_parser_set_input_file(&parser, input);
        }

        ~YamlFileParser()
        {
            yaml_parser_delete(&parser);
            fclose(input);
        }

        /* Read the next event, keeping only its type, scalar value, and line
         * number. Returns false on a syntax error. */
        bool next(yaml_event_type_t& type, std::string& value, size_t& line)
        {
            yaml_event_t event;
            if (!yaml_parser_parse(&parser, &event)) {
                line = parser.problem_mark.line + 1;
                value = parser.problem ? parser.problem : "syntax error";
                return false;
            }

            type = event.type;
            line = event.start_mark.line + 1;
            if (type == YAML_SCALAR_EVENT) {
                value.assign(reinterpret_cast<char*>(event.data.scalar.value),
                             event.data.scalar.length);
            }
            else value.clear();

            yaml_event_delete(&event);
            return true;
        }

    private:
        FILE* input;
        yaml_parser_t parser;
};


static void finish_job(const char* filename, size_t line,
                       const MatrixJob& job, std::vector<MatrixJob>& jobs)
{
    const char* missing = NULL;
    if      (job.first.empty())     missing = "first";
    else if (job.second.empty())    missing = "second";
    else if (job.operation.empty()) missing = "operation";

    if (missing) {
        throw job_file_error(filename, line,
                             std::string("job is missing '") + missing + "'.");
    }

    jobs.push_back(job);
}


void read_job_file(const char* filename, std::vector<MatrixJob>& jobs)
{
    YamlFileParser parser(filename);

    enum {
        STATE_BEGIN,
        STATE_END,
        STATE_JOB_SEQUENCE,
        STATE_JOB_KEY,
        STATE_JOB_VALUE
    } state = STATE_BEGIN;

    MatrixJob job;
    std::string key;

    yaml_event_type_t type;
    std::string value;
    size_t line;
    bool done = false;
    while (!done) {
        if (!parser.next(type, value, line)) {
            throw job_file_error(filename, line, value);
        }

        switch (state) {
            case STATE_BEGIN:
                if (type == YAML_SEQUENCE_START_EVENT) {
                    state = STATE_JOB_SEQUENCE;
                }
                else if (type == YAML_STREAM_START_EVENT ||
                         type == YAML_DOCUMENT_START_EVENT) {
                }
                else {
                    throw job_file_error(filename, line,
                                         YAML_SEQUENCE_START_EVENT, type);
                }
                break;

            case STATE_JOB_SEQUENCE:
                if (type == YAML_MAPPING_START_EVENT) {
                    job = MatrixJob();
                    state = STATE_JOB_KEY;
                }
                else if (type == YAML_SEQUENCE_END_EVENT) {
                    state = STATE_END;
                }
                else {
                    throw job_file_error(filename, line,
                                         YAML_MAPPING_START_EVENT, type);
                }
                break;

            case STATE_JOB_KEY:
                if (type == YAML_SCALAR_EVENT) {
                    if (value != "first" && value != "second" &&
                        value != "operation" && value != "output") {
                        throw job_file_error(filename, line,
                                             "unknown job field '" + value + "'.");
                    }
                    key = value;
                    state = STATE_JOB_VALUE;
                }
                else if (type == YAML_MAPPING_END_EVENT) {
                    finish_job(filename, line, job, jobs);
                    state = STATE_JOB_SEQUENCE;
                }
                else {
                    throw job_file_error(filename, line,
                                         YAML_SCALAR_EVENT, type);
                }
                break;

            case STATE_JOB_VALUE:
                if (type == YAML_SCALAR_EVENT) {
                    if      (key == "first")     job.first = value;
                    else if (key == "second")    job.second = value;
                    else if (key == "operation") job.operation = value;
                    else                         job.output = value;
                    state = STATE_JOB_KEY;
                }
                else {
                    throw job_file_error(filename, line,
                                         YAML_SCALAR_EVENT, type);
                }
                break;

            case STATE_END:
                if (type == YAML_DOCUMENT_END_EVENT) {
                    done = true;
                }
                else {
                    throw job_file_error(filename, line,
                                         YAML_DOCUMENT_END_EVENT, type);
                }
                break;
        }
    }
}


SparseMat run_matrix_job(const MatrixJob& job, bool dryrun)
{
    const MatrixOp& op = find_matrix_op(job.operation);

    SparseMat a = read_sparse_mat(job.first);
    SparseMat b = read_sparse_mat(job.second);

    Logger::info("Computing %s of %s and %s.", op.name,
                 job.first.c_str(), job.second.c_str());
    SparseMat c = op.func(a, b);

    if (!dryrun) {
        write_sparse_mat(job.output, c);
    }

    return c;
}

