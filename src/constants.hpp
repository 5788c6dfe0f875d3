#ifndef SPARSECALC_CONSTANTS_HPP
#define SPARSECALC_CONSTANTS_HPP

#include <cstdlib>

#include "common.hpp"


/* Tunable values that don't merit a command line option of their own, or that
 * provide the defaults for one. */

namespace constants
{
    /* Where results are written when no output file is given. */
    extern const char* default_output_filename;

    /* Multiplications whose left operand stores at least this many entries
     * report their progress with a progress bar. */
    extern size_t progress_min_entries;

    /* Advance the multiplication progress bar once every this many entries of
     * the left operand. */
    extern size_t progress_update_interval;

    /* How often the logger's printer thread wakes up, in milliseconds. */
    extern unsigned int logger_flush_interval;
}

#endif

