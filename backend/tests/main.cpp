#include <gtest/gtest.h>

#include "../src/utils/logging.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    Log::init("gdauth_tests.log", spdlog::level::debug);
    return RUN_ALL_TESTS();
}
