#include <glog/logging.h>
#include <filesystem>
#include "gmock/gmock.h"
#include "gtest/gtest.h"

class GlobalEnv : public ::testing::Environment {
 public:
  virtual void SetUp() {
    std::filesystem::create_directories(std::filesystem::temp_directory_path() / "sandbox_unit_test");
  }
  virtual void TearDown() {
    std::error_code ec;
    std::filesystem::remove_all(std::filesystem::temp_directory_path() / "sandbox_unit_test", ec);
  }
};

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
