/**
 * @file   test_main.cpp
 * @brief  GoogleTest entry point; library logging is silenced unless ARFOCUS_TEST_LOG is set.
 */
#include <gtest/gtest.h>

#include <spdlog/spdlog.h>

#include <cstdlib>

int main (int argc, char **argv)
{
    ::testing::InitGoogleTest (&argc, argv);
    if (!std::getenv ("ARFOCUS_TEST_LOG"))
        spdlog::set_level (spdlog::level::off);
    return RUN_ALL_TESTS ();
}
