/*
 * 설명: HTTP 연결을 처리하고 상태/메트릭 엔드포인트와 방 WS 업그레이드를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/room_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "checkers/config.hpp"
#include "checkers/observability.hpp"
#include "checkers/session_registry.hpp"

namespace checkers {

// "/ws/<room>" 경로에서 방 키를 꺼낸다. 1..64자의 [A-Za-z0-9_-]만 허용한다.
std::optional<std::string> ParseRoomTarget(const std::string& target);

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
              std::shared_ptr<SessionRegistry> registry, std::shared_ptr<Observability> observability);
  void Run();

 private:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void SendJson(std::shared_ptr<Response> res, boost::beast::http::status status, const nlohmann::json& body);
  void SendResponse(std::shared_ptr<Response> res);
  void HandleWebSocket();

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  AppConfig config_;
  std::shared_ptr<SessionRegistry> registry_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

}  // namespace checkers
