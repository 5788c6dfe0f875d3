#include <gtest/gtest.h>

#include "logger.hpp"


TEST(LoggerTest, TaskCountsWork) {
    Logger::push_task("counting", 10);
    Logger::get_task("counting").inc();
    Logger::get_task("counting").inc(2);
    EXPECT_EQ(Logger::get_task("counting").count(), 3u);

    // never beyond the total
    Logger::get_task("counting").inc(20);
    EXPECT_EQ(Logger::get_task("counting").count(), 3u);

    Logger::pop_task("counting");
}


TEST(LoggerTest, PushAfterPopStartsOver) {
    Logger::push_task("repeated", 10);
    Logger::get_task("repeated").inc(4);
    Logger::pop_task("repeated");

    // popped, but not yet cleared by a flush
    Logger::push_task("repeated", 10);
    EXPECT_EQ(Logger::get_task("repeated").count(), 0u);

    Logger::get_task("repeated").inc();
    EXPECT_EQ(Logger::get_task("repeated").count(), 1u);

    // the task is live again, so a flush leaves it in place
    Logger::instance().flush();
    EXPECT_EQ(Logger::get_task("repeated").count(), 1u);

    Logger::pop_task("repeated");
    Logger::instance().flush();
}
