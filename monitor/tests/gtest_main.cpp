#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    // Components log through the default logger; keep test output readable
    spdlog::set_level(spdlog::level::warn);

    return RUN_ALL_TESTS();
}
