/*
 * 설명: 방 키마다 정확히 하나의 MatchSession을 유지하고 접속 인원 수에 따라 생성/제거한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_registry_test.cpp, server/tests/e2e/room_flow_test.cpp
 */
#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>

#include "checkers/coordinate_mapper.hpp"
#include "checkers/match_session.hpp"
#include "checkers/rule_engine.hpp"

namespace checkers {

struct JoinTicket {
  std::shared_ptr<MatchSession> session;
  int player_slot{kUnassignedSlot};
};

class SessionRegistry {
 public:
  using EngineFactory = std::function<std::unique_ptr<RuleEngine>()>;

  explicit SessionRegistry(EngineFactory engine_factory);

  std::shared_ptr<MatchSession> GetOrCreate(const std::string& key);
  // 생성(필요 시)과 인원 증가, 슬롯 배정을 하나의 임계 구역에서 처리한다.
  // 비어 있는 슬롯 중 작은 번호를 주고, 1과 2가 모두 차 있으면 kUnassignedSlot을 준다.
  JoinTicket Join(const std::string& key);
  // player_slot이 1 또는 2이면 그 슬롯을 비운다. 인원이 0 이하가 되면 세션을 제거한다.
  // 없는 키는 무시한다.
  void Release(const std::string& key, int player_slot = kUnassignedSlot);

  std::size_t ActiveSessionCount() const;
  std::optional<int> PartyCount(const std::string& key) const;

 private:
  struct Entry {
    std::shared_ptr<MatchSession> session;
    int party_count{0};
    std::array<bool, 2> seated{false, false};
  };

  Entry& GetOrCreateLocked(const std::string& key);

  EngineFactory engine_factory_;
  std::mt19937 seed_source_;
  std::unordered_map<std::string, Entry> sessions_;
  mutable std::mutex mutex_;
};

}  // namespace checkers
