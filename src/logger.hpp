/*
 * This file is part of sparsecalc.
 *
 */

#ifndef SPARSECALC_LOGGER_HPP
#define SPARSECALC_LOGGER_HPP


#include <boost/thread.hpp>
#include <boost/timer/timer.hpp>
#include <cstdarg>
#include <cstdio>
#include <map>
#include <queue>
#include <string>


/* Terminal feedback: leveled log messages and progress bars for long running
 * work. Everything is written to standard error, leaving standard out for
 * matrices. */


/* A named unit of work whose progress the logger reports.
 *
 * This class is not constructed directly, but rather by calling
 * `Logger::push_task`.
 */
class LoggerTask
{
    public:
        LoggerTask(const LoggerTask&);

        /* Update with the completion of d units of work. */
        void inc(size_t d = 1);

        /* Units of work completed so far. */
        size_t count();

    private:
        LoggerTask();
        LoggerTask(const char* name, size_t n);

        /* Start over with n units of work, un-popping the task. */
        void reset(size_t n);

        /* Draw the task. Returns the number of lines written. */
        int print(FILE* fout, bool color);

        boost::timer::cpu_timer timer;

        std::string name;

        /* k of n units completed. n == 0 if the total is unknown. */
        size_t k, n;

        /* Set when popped. Tasks are erased once their lines are cleared. */
        bool popped;

        boost::mutex mut;

        friend class Logger;
};


/**
 * A singleton log writing class.
 *
 */
class Logger
{
    public:
        static Logger& instance();

        /* Start the background thread that prints queued messages. Until this
         * is called messages accumulate and are printed by `end` or `flush`. */
        static void start();

        /* Print anything outstanding and stop the background thread. */
        static void end();

        ~Logger();

        /* Logger levels. */
        enum level
        {
            DEBUG,
            INFO,
            WARN,
            ERROR
        };

        /* Output log info at the given level. */
        static void debug (const char* fmt, ...);
        static void info  (const char* fmt, ...);
        static void warn  (const char* fmt, ...);
        static void error (const char* fmt, ...);

        /* print a message and exit. */
        static void abort (const char* fmt, ...);

        /* Print a log message at the given level. */
        static void put(level, const char* fmt, ...);

        /* Set the logger level. Messages at or above the logger level will be
         * printed. */
        static void set_level(level);

        /* Turn colored output on or off. */
        static void set_color(bool);

        /* Add a task. */
        static void push_task(const char* name, size_t num_steps = 0);

        /* Remove a task by name. */
        static void pop_task(const char* name);

        /* Get a task by name. */
        static LoggerTask& get_task(const char* name);

        /* Print any buffered output. */
        void flush();

    private:
        Logger();
        Logger(Logger const&);
        void operator = (Logger const&);

        /* Print a formatted string at the given level. */
        void put(level, const char* fmt, va_list);

        /* Erase previously drawn progress bars. */
        void clear_tasks();

        /* An infinite loop that runs in the background printing queued
         * messages and progress bars. */
        void print_loop();

        /* Output file. */
        FILE* fout;

        /* Logger level. */
        level L;

        /* True if output should be in color. */
        bool color;

        /* True when the printer thread should terminate. */
        bool finished;

        /* Run the print_loop function in the background. */
        boost::thread* print_thread;

        /* Messages to be printed. */
        std::queue<std::pair<level, std::string> > log_queue;

        /* Tasks indexed by name. */
        std::map<std::string, LoggerTask> tasks;

        /* Number of lines of progress bars currently on the terminal. */
        int task_lines;

        /* Some space used for string formatting. */
        char* msg_buffer;
        static const size_t msg_buffer_len;

        boost::mutex mut;
};



#endif

