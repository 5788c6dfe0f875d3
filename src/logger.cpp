
#include <boost/bind/bind.hpp>
#include <cmath>
#include <cstdlib>
#include <ctime>

#include "constants.hpp"
#include "logger.hpp"


Logger& Logger::instance()
{
    static Logger S;
    return S;
}

const size_t Logger::msg_buffer_len = 1024;


Logger::Logger()
    : fout(stderr)
    , L(INFO)
    , color(true)
    , finished(false)
    , print_thread(NULL)
    , task_lines(0)
    , msg_buffer(new char[msg_buffer_len])
{
}


Logger::~Logger()
{
    if (print_thread) {
        {
            boost::lock_guard<boost::mutex> lock(mut);
            finished = true;
        }
        print_thread->join();
        delete print_thread;
    }
    fflush(fout);
    delete [] msg_buffer;
}


void Logger::start()
{
    boost::lock_guard<boost::mutex> lock(instance().mut);

    if (instance().print_thread == NULL) {
        instance().finished = false;
        instance().print_thread =
            new boost::thread(boost::bind(&Logger::print_loop, &instance()));
    }
}


void Logger::end()
{
    Logger& logger = instance();
    boost::thread* thread;
    {
        boost::lock_guard<boost::mutex> lock(logger.mut);
        logger.finished = true;
        thread = logger.print_thread;
        logger.print_thread = NULL;
    }

    if (thread) {
        thread->join();
        delete thread;
    }

    logger.flush();
}


void Logger::set_level(level L)
{
    boost::lock_guard<boost::mutex> lock(instance().mut);
    instance().L = L;
}


void Logger::set_color(bool color)
{
    boost::lock_guard<boost::mutex> lock(instance().mut);
    instance().color = color;
}


void Logger::debug(const char* fmt, ...)
{
    va_list args;
    va_start(args, fmt);

    Logger::instance().put(DEBUG, fmt, args);

    va_end(args);
}


void Logger::info(const char* fmt, ...)
{
    va_list args;
    va_start(args, fmt);

    Logger::instance().put(INFO, fmt, args);

    va_end(args);
}


void Logger::warn(const char* fmt, ...)
{
    va_list args;
    va_start(args, fmt);

    Logger::instance().put(WARN, fmt, args);

    va_end(args);
}


void Logger::error(const char* fmt, ...)
{
    va_list args;
    va_start(args, fmt);

    Logger::instance().put(ERROR, fmt, args);

    va_end(args);
}


void Logger::abort(const char* fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    Logger::instance().put(ERROR, fmt, args);
    va_end(args);

    end();

    exit(EXIT_FAILURE);
}


void Logger::put(level L, const char* fmt, ...)
{
    va_list args;
    va_start(args, fmt);

    Logger::instance().put(L, fmt, args);

    va_end(args);
}


void Logger::put(level l, const char* fmt, va_list args)
{
    boost::lock_guard<boost::mutex> lock(mut);

    if (l < L) return;

    int len = vsnprintf(msg_buffer, msg_buffer_len - 1, fmt, args);
    if (len < 0) return;
    if ((size_t) len >= msg_buffer_len - 1) len = msg_buffer_len - 2;

    /* make sure there are no trailing newlines */
    while (len > 0 && msg_buffer[len - 1] == '\n') {
        msg_buffer[len - 1] = '\0';
        --len;
    }

    log_queue.push(std::pair<level, std::string>(l, msg_buffer));
}


void Logger::print_loop()
{
    while (true) {
        {
            boost::lock_guard<boost::mutex> lock(mut);
            if (finished) break;
        }

        flush();
        boost::this_thread::sleep(
            boost::posix_time::milliseconds(constants::logger_flush_interval));
    }
}


void Logger::clear_tasks()
{
    for (; task_lines > 0; --task_lines) {
        fprintf(fout, "\033[A\033[2K\033[G"); /* move up, erase line, move to start */
    }

    std::map<std::string, LoggerTask>::iterator i = tasks.begin();
    while (i != tasks.end()) {
        if (i->second.popped) tasks.erase(i++);
        else ++i;
    }
}


void Logger::flush()
{
    boost::lock_guard<boost::mutex> lock(mut);

    static time_t t;
    static struct tm ts;
    static char time_str[200];

    clear_tasks();

    if (!log_queue.empty()) {
        t = time(NULL);
        localtime_r(&t, &ts);
        // RFC-2822 date
        strftime(time_str, 200, "%a, %d %b %Y %T %z", &ts);
    }

    while (!log_queue.empty()) {
        fprintf(fout, "[%s] ", time_str);

        if (color) {
            switch (log_queue.front().first) {
                case DEBUG: fprintf(fout, "\033[37m"); break;
                case INFO:  break;
                case WARN:  fprintf(fout, "\033[33m"); break;
                case ERROR: fprintf(fout, "\033[31m"); break;
            }
        }

        fprintf(fout, "%s\n", log_queue.front().second.c_str());

        if (color) fprintf(fout, "\033[00m");

        log_queue.pop();
    }

    /* progress bars are only drawn while the printer thread is running */
    if (print_thread && !finished) {
        std::map<std::string, LoggerTask>::iterator i;
        for (i = tasks.begin(); i != tasks.end(); ++i) {
            task_lines += i->second.print(fout, color);
        }
    }

    fflush(fout);
}


void Logger::push_task(const char* name, size_t num_steps)
{
    boost::lock_guard<boost::mutex> lock(Logger::instance().mut);

    std::map<std::string, LoggerTask>& tasks = Logger::instance().tasks;
    std::map<std::string, LoggerTask>::iterator i = tasks.find(name);

    /* a task popped but not yet cleared from the terminal is reused */
    if (i != tasks.end()) {
        i->second.reset(num_steps);
    }
    else {
        tasks.insert(
            std::pair<std::string, LoggerTask>(name, LoggerTask(name, num_steps)));
    }
}


void Logger::pop_task(const char* name)
{
    boost::lock_guard<boost::mutex> lock(Logger::instance().mut);

    std::map<std::string, LoggerTask>::iterator i =
        Logger::instance().tasks.find(name);

    if (i != Logger::instance().tasks.end()) {
        i->second.popped = true;
    }
}


LoggerTask& Logger::get_task(const char* name)
{
    boost::lock_guard<boost::mutex> lock(Logger::instance().mut);

    std::map<std::string, LoggerTask>::iterator i =
        Logger::instance().tasks.find(name);

    if (i == Logger::instance().tasks.end()) {
        /* unknown tasks are created on demand rather than failing a
         * computation over a progress bar */
        i = Logger::instance().tasks.insert(
                std::pair<std::string, LoggerTask>(name, LoggerTask(name, 0))).first;
    }
    else if (i->second.popped) {
        /* keep the printer thread from erasing it out from under the caller */
        i->second.reset(0);
    }

    return i->second;
}


LoggerTask::LoggerTask()
    : name()
    , k(0)
    , n(0)
    , popped(false)
{
}


LoggerTask::LoggerTask(const char* name, size_t n)
    : name(name)
    , k(0)
    , n(n)
    , popped(false)
{
}


LoggerTask::LoggerTask(const LoggerTask& other)
    : name(other.name)
    , k(other.k)
    , n(other.n)
    , popped(other.popped)
{
}


void LoggerTask::inc(size_t d)
{
    boost::lock_guard<boost::mutex> lock(mut);

    if (k == 0) {
        timer.start();
    }
    if (k + d <= n || n == 0) k += d;
}


size_t LoggerTask::count()
{
    boost::lock_guard<boost::mutex> lock(mut);
    return k;
}


void LoggerTask::reset(size_t n)
{
    boost::lock_guard<boost::mutex> lock(mut);
    this->n = n;
    k = 0;
    popped = false;
    timer.start();
}


int LoggerTask::print(FILE* fout, bool color)
{
    boost::lock_guard<boost::mutex> lock(mut);

    if (popped) return 0;

    if (n == 0) {
        fprintf(fout, "%s ...", name.c_str());
        for (size_t i = 0; i < k && i < 60; ++i) {
            fputc('.', fout);
        }
        fputc('\n', fout);
        return 1;
    }

    fprintf(fout, "%s:\n    ", name.c_str());

    if (color) fprintf(fout, "\033[32m");

    fputc('[', fout);

    const size_t width = 60;
    size_t filled = (size_t) ((double) k * width / (double) n);
    size_t i = 0;
    if (filled > 0) {
        for (; i < filled - 1; ++i) fputc('=', fout);
        fputc('>', fout);
        ++i;
    }
    for (; i < width; ++i) fputc(' ', fout);

    fprintf(fout, "] ");

    if (color) fprintf(fout, "\033[01m");

    /* percent completed */
    fprintf(fout, "%5.1f%%", 100.0 * (double) k / (double) n);

    /* time remaining */
    if (k <= 1) {
        fprintf(fout, "    ?:?? ETA\n");
    }
    else {
        boost::timer::cpu_times t = timer.elapsed();
        boost::timer::nanosecond_type d = t.wall / (k - 1);
        boost::timer::nanosecond_type remaining = (n - k) * d;
        double rem_sec = (double) remaining / 1e9;
        fprintf(fout, "%5lu:%02lu ETA\n",
                (unsigned long) floor(rem_sec / 60.0),
                (unsigned long) fmod(rem_sec, 60.0));
    }

    if (color) fprintf(fout, "\033[00m");

    return 2;
}

