#include <glog/logging.h>
#include <curl/curl.h>
#include "gmock/gmock.h"
#include "gtest/gtest.h"

/**
 * @brief 测试只输出警告以上的日志，PistonTest 需要 curl 的全局初始化
 */
class LadderTestEnvironment : public ::testing::Environment {
 public:
  void SetUp() override {
    FLAGS_logtostderr = true;
    FLAGS_minloglevel = google::GLOG_WARNING;
    curl_global_init(CURL_GLOBAL_DEFAULT);
  }

  void TearDown() override {
    curl_global_cleanup();
  }
};

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  ::testing::InitGoogleMock(&argc, argv);
  ::testing::AddGlobalTestEnvironment(new LadderTestEnvironment);
  return RUN_ALL_TESTS();
}
