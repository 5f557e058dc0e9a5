/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp, server/tests/e2e/room_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace checkers {

struct AppConfig {
  unsigned short port;
  std::string log_level;
  std::size_t ws_queue_limit_messages;
  std::size_t ws_queue_limit_bytes;
  std::string ops_token;
  std::size_t worker_threads;
  int noncapture_move_limit;
};

AppConfig LoadConfigFromEnv();

}  // namespace checkers
