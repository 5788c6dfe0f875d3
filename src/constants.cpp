
#include "constants.hpp"

const char*  constants::default_output_filename  = "result.txt";
size_t       constants::progress_min_entries     = 100000;
size_t       constants::progress_update_interval = 1000;
unsigned int constants::logger_flush_interval    = 250;

