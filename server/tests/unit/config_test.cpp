#include <cstdlib>

#include <gtest/gtest.h>

#include "checkers/config.hpp"

namespace {

const char* kKeys[] = {"SERVER_PORT",  "LOG_LEVEL",      "WS_QUEUE_LIMIT_MESSAGES", "WS_QUEUE_LIMIT_BYTES",
                       "OPS_TOKEN",    "WORKER_THREADS", "NONCAPTURE_MOVE_LIMIT"};

class ConfigFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    for (const char* key : kKeys) {
      unsetenv(key);
    }
  }
  void TearDown() override { SetUp(); }
};

}  // namespace

TEST_F(ConfigFixture, DefaultsWhenUnset) {
  auto cfg = checkers::LoadConfigFromEnv();
  EXPECT_EQ(cfg.port, 8080);
  EXPECT_EQ(cfg.log_level, "info");
  EXPECT_EQ(cfg.ws_queue_limit_messages, 32u);
  EXPECT_EQ(cfg.ws_queue_limit_bytes, 262144u);
  EXPECT_TRUE(cfg.ops_token.empty());
  EXPECT_EQ(cfg.worker_threads, 0u);
  EXPECT_EQ(cfg.noncapture_move_limit, 40);
}

TEST_F(ConfigFixture, ReadsOverrides) {
  setenv("SERVER_PORT", "18100", 1);
  setenv("LOG_LEVEL", "debug", 1);
  setenv("WS_QUEUE_LIMIT_MESSAGES", "4", 1);
  setenv("OPS_TOKEN", "secret", 1);
  setenv("WORKER_THREADS", "2", 1);
  setenv("NONCAPTURE_MOVE_LIMIT", "0", 1);
  auto cfg = checkers::LoadConfigFromEnv();
  EXPECT_EQ(cfg.port, 18100);
  EXPECT_EQ(cfg.log_level, "debug");
  EXPECT_EQ(cfg.ws_queue_limit_messages, 4u);
  EXPECT_EQ(cfg.ws_queue_limit_bytes, 262144u);
  EXPECT_EQ(cfg.ops_token, "secret");
  EXPECT_EQ(cfg.worker_threads, 2u);
  EXPECT_EQ(cfg.noncapture_move_limit, 0);
}
