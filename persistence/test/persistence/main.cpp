#include "test_remote_options.hpp"
#include "test_configuration.hpp"

#include <log/log.hpp>

#include <gtest/gtest.h>

#include <filesystem>

std::filesystem::path programDirectory;

int main(int argc, char** argv)
{
    programDirectory = std::filesystem::path{argv[0]}.parent_path();
    Log::setLevel(Log::Level::Off);

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
