/*
 * 설명: 방에 참가한 WebSocket 연결의 명령 처리, 백프레셔 및 퇴장 처리를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/room_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <string>
#include <string_view>

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <nlohmann/json.hpp>

#include "checkers/match_session.hpp"
#include "checkers/observability.hpp"
#include "checkers/session_registry.hpp"

namespace checkers {

class WebSocketSession : public std::enable_shared_from_this<WebSocketSession> {
 public:
  WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws, std::string room_key,
                   std::shared_ptr<SessionRegistry> registry, std::shared_ptr<Observability> observability,
                   std::size_t max_queue_messages, std::size_t max_queue_bytes);
  ~WebSocketSession();
  void Run();

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleCommand(const nlohmann::json& message);
  void SendError(std::string_view code, std::string_view message);
  void EnqueueMessage(std::string message);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void TriggerBackpressureClose();
  void LogEvent(const std::string& name, LogLevel level, long latency_ms, nlohmann::json detail);

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  std::string room_key_;
  std::shared_ptr<SessionRegistry> registry_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<MatchSession> session_;
  int player_slot_{kUnassignedSlot};
  bool joined_{false};
  std::string trace_id_;
  std::deque<std::string> send_queue_;
  std::size_t queued_bytes_{0};
  bool writing_{false};
  bool closing_{false};
  std::size_t max_queue_messages_;
  std::size_t max_queue_bytes_;
};

}  // namespace checkers
