#include <glog/logging.h>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "grading/language.hpp"

class GlobalEnv : public ::testing::Environment {
 public:
  virtual void SetUp() {
    funcjudge::grading::register_builtin_languages();
  }
  virtual void TearDown() {
    //  Stub
  }
};

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
