#include <glog/logging.h>
#include <filesystem>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "ojudge/config.hpp"

class GlobalEnv : public ::testing::Environment {
public:
    void SetUp() override {
        // 选手程序的运行目录与正式评测隔离
        ojudge::RUN_DIR = std::filesystem::temp_directory_path() / "ojudge-unit-test";
        std::filesystem::create_directories(ojudge::RUN_DIR);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(ojudge::RUN_DIR, ec);
    }
};

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);
    AddGlobalTestEnvironment(new GlobalEnv);
    ::testing::InitGoogleMock(&argc, argv);
    return RUN_ALL_TESTS();
}
