/*
 * 설명: 방 키 기반 세션 생성/조회/해제와 플레이어 슬롯 배정을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_registry_test.cpp, server/tests/e2e/room_flow_test.cpp
 */
#include "checkers/session_registry.hpp"

namespace checkers {

SessionRegistry::SessionRegistry(EngineFactory engine_factory)
    : engine_factory_(std::move(engine_factory)), seed_source_(std::random_device{}()) {}

std::shared_ptr<MatchSession> SessionRegistry::GetOrCreate(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  return GetOrCreateLocked(key).session;
}

JoinTicket SessionRegistry::Join(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& entry = GetOrCreateLocked(key);
  ++entry.party_count;
  JoinTicket ticket;
  ticket.session = entry.session;
  for (std::size_t i = 0; i < entry.seated.size(); ++i) {
    if (!entry.seated[i]) {
      entry.seated[i] = true;
      ticket.player_slot = static_cast<int>(i) + 1;
      break;
    }
  }
  return ticket;
}

void SessionRegistry::Release(const std::string& key, int player_slot) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(key);
  if (it == sessions_.end()) {
    return;
  }
  if (player_slot == 1 || player_slot == 2) {
    it->second.seated[player_slot - 1] = false;
  }
  --it->second.party_count;
  if (it->second.party_count <= 0) {
    sessions_.erase(it);
  }
}

std::size_t SessionRegistry::ActiveSessionCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

std::optional<int> SessionRegistry::PartyCount(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(key);
  if (it == sessions_.end()) {
    return std::nullopt;
  }
  return it->second.party_count;
}

SessionRegistry::Entry& SessionRegistry::GetOrCreateLocked(const std::string& key) {
  auto it = sessions_.find(key);
  if (it != sessions_.end()) {
    return it->second;
  }
  Entry entry;
  entry.session = std::make_shared<MatchSession>(key, engine_factory_(), seed_source_());
  return sessions_.emplace(key, std::move(entry)).first->second;
}

}  // namespace checkers
