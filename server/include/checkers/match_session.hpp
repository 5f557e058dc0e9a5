/*
 * 설명: 한 방(room)의 공유 게임 상태를 보유하고, 명령을 상호배제 하에 코어 모듈로 분기한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/match_session_test.cpp, server/tests/e2e/room_flow_test.cpp
 */
#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <string>

#include <nlohmann/json.hpp>

#include "checkers/rule_engine.hpp"

namespace checkers {

struct CommandRequest {
  std::string command;
  nlohmann::json arguments = nlohmann::json::array();
  int player_slot{0};
};

class MatchSession {
 public:
  MatchSession(std::string key, std::unique_ptr<RuleEngine> engine, std::uint32_t seed);

  MatchSession(const MatchSession&) = delete;
  MatchSession& operator=(const MatchSession&) = delete;

  const std::string& Key() const { return key_; }

  // 실패 시 results는 건드리지 않고 error_code/error_message를 채운다.
  bool Execute(const CommandRequest& request, nlohmann::json& results, std::string& error_code,
               std::string& error_message);

 private:
  bool HandleMakeMoveFromBoard(const CommandRequest& request, nlohmann::json& results, std::string& error_code,
                               std::string& error_message);
  bool HandleValidatePlayerBoard(const CommandRequest& request, nlohmann::json& results, std::string& error_code,
                                 std::string& error_message);
  bool HandleMakeMove(const CommandRequest& request, nlohmann::json& results, std::string& error_code,
                      std::string& error_message);
  nlohmann::json GameStatus() const;

  std::string key_;
  std::unique_ptr<RuleEngine> engine_;
  std::mt19937 rng_;
  std::mutex mutex_;
};

}  // namespace checkers
