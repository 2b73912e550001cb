#include <glog/logging.h>
#include <filesystem>
#include "codejudge/config.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

class GlobalEnv : public ::testing::Environment {
 public:
  virtual void SetUp() {
    codejudge::RUN_DIR = std::filesystem::temp_directory_path() / "codejudge-test";
    std::filesystem::create_directories(codejudge::RUN_DIR);
    codejudge::MAX_PROCESSES = 4;
  }
  virtual void TearDown() {
    std::error_code ec;
    std::filesystem::remove_all(codejudge::RUN_DIR, ec);
  }
};

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
