/*
 * 설명: WebSocket 명령 프레임을 읽어 방 세션으로 분기하고 결과를 순서대로 전송한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/room_flow_test.cpp
 */
#include "checkers/websocket_session.hpp"

#include <chrono>

#include <boost/beast/core/buffers_to_string.hpp>

#include "checkers/api_response.hpp"

namespace checkers {

WebSocketSession::WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                                   std::string room_key, std::shared_ptr<SessionRegistry> registry,
                                   std::shared_ptr<Observability> observability, std::size_t max_queue_messages,
                                   std::size_t max_queue_bytes)
    : ws_(std::move(ws)), room_key_(std::move(room_key)), registry_(std::move(registry)),
      observability_(std::move(observability)), max_queue_messages_(max_queue_messages),
      max_queue_bytes_(max_queue_bytes) {}

WebSocketSession::~WebSocketSession() {
  if (!joined_) {
    return;
  }
  registry_->Release(room_key_, player_slot_);
  observability_->WebsocketClosed();
  LogEvent("room.leave", LogLevel::kInfo, 0, {{"remainingParties", registry_->PartyCount(room_key_).value_or(0)}});
}

void WebSocketSession::Run() {
  trace_id_ = observability_->NextTraceId();
  auto ticket = registry_->Join(room_key_);
  session_ = std::move(ticket.session);
  player_slot_ = ticket.player_slot;
  joined_ = true;
  observability_->WebsocketOpened();
  LogEvent("room.join", LogLevel::kInfo, 0, {{"partyCount", registry_->PartyCount(room_key_).value_or(0)}});
  DoRead();
}

void WebSocketSession::DoRead() {
  if (closing_) {
    return;
  }
  auto self = shared_from_this();
  ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void WebSocketSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::websocket::error::closed || closing_) {
    return;
  }
  if (ec) {
    LogEvent("ws.read_failed", LogLevel::kWarn, 0, {{"error", ec.message()}});
    return;
  }

  auto data = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  try {
    auto message = nlohmann::json::parse(data);
    HandleCommand(message);
  } catch (const nlohmann::json::exception&) {
    observability_->IncrementCommandRejected();
    SendError("bad_request", "JSON 파싱 오류");
  }

  if (!closing_) {
    DoRead();
  }
}

void WebSocketSession::HandleCommand(const nlohmann::json& message) {
  if (!message.is_object()) {
    observability_->IncrementCommandRejected();
    return SendError("bad_request", "잘못된 메시지 형식");
  }
  auto command_it = message.find("command");
  if (command_it == message.end() || !command_it->is_string()) {
    observability_->IncrementCommandRejected();
    return SendError("bad_request", "command 필드가 필요합니다");
  }

  CommandRequest request;
  request.command = command_it->get<std::string>();
  request.player_slot = player_slot_;
  auto args_it = message.find("arguments");
  if (args_it != message.end() && !args_it->is_null()) {
    request.arguments = *args_it;
  }

  const auto start = std::chrono::steady_clock::now();
  observability_->IncrementCommand();
  nlohmann::json results;
  std::string error_code;
  std::string error_message;
  const bool ok = session_->Execute(request, results, error_code, error_message);
  const auto latency =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();

  if (!ok) {
    observability_->IncrementCommandRejected();
    LogEvent("command.rejected", LogLevel::kWarn, static_cast<long>(latency),
             {{"command", request.command}, {"code", error_code}});
    return SendError(error_code, error_message);
  }
  LogEvent("command." + request.command, LogLevel::kDebug, static_cast<long>(latency), nullptr);
  EnqueueMessage(MakeCommandReply(results).dump());
}

void WebSocketSession::SendError(std::string_view code, std::string_view message) {
  EnqueueMessage(MakeCommandError(code, message).dump());
}

void WebSocketSession::EnqueueMessage(std::string message) {
  if (closing_) {
    return;
  }
  const auto message_size = message.size();
  if (send_queue_.size() >= max_queue_messages_ || queued_bytes_ + message_size > max_queue_bytes_) {
    TriggerBackpressureClose();
    return;
  }
  send_queue_.push_back(std::move(message));
  queued_bytes_ += message_size;
  if (!writing_) {
    WriteNext();
  }
}

void WebSocketSession::WriteNext() {
  if (send_queue_.empty() || closing_) {
    return;
  }
  writing_ = true;
  auto self = shared_from_this();
  ws_.text(true);
  ws_.async_write(boost::asio::buffer(send_queue_.front()),
                  [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) { self->OnWrite(ec); });
}

void WebSocketSession::OnWrite(boost::beast::error_code ec) {
  if (!send_queue_.empty()) {
    queued_bytes_ -= send_queue_.front().size();
    send_queue_.pop_front();
  }
  if (ec) {
    closing_ = true;
    LogEvent("ws.write_failed", LogLevel::kWarn, 0, {{"error", ec.message()}});
    return;
  }
  writing_ = false;
  if (!send_queue_.empty()) {
    WriteNext();
  }
}

void WebSocketSession::TriggerBackpressureClose() {
  if (closing_) {
    return;
  }
  closing_ = true;
  // 전송 중인 프레임의 버퍼는 async_write 완료까지 유지해야 한다.
  if (writing_ && !send_queue_.empty()) {
    send_queue_.erase(send_queue_.begin() + 1, send_queue_.end());
    queued_bytes_ = send_queue_.front().size();
  } else {
    send_queue_.clear();
    queued_bytes_ = 0;
  }
  LogEvent("ws.backpressure_close", LogLevel::kWarn, 0, nullptr);
  boost::beast::websocket::close_reason reason{boost::beast::websocket::close_code::policy_error};
  reason.reason = "backpressure_exceeded";
  auto self = shared_from_this();
  ws_.async_close(reason, [self](boost::beast::error_code) {});
}

void WebSocketSession::LogEvent(const std::string& name, LogLevel level, long latency_ms, nlohmann::json detail) {
  if (!observability_->ShouldLog(level)) {
    return;
  }
  LogContext ctx;
  ctx.trace_id = trace_id_;
  ctx.player_slot = player_slot_;
  ctx.room = room_key_;
  ctx.name = name;
  ctx.latency_ms = latency_ms;
  ctx.level = level;
  ctx.detail = std::move(detail);
  observability_->Log(ctx);
}

}  // namespace checkers
