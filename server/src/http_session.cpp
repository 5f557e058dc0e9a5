/*
 * 설명: HTTP 요청을 처리하고 상태/메트릭/운영 엔드포인트와 WS 업그레이드를 분기한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/room_flow_test.cpp
 */
#include "checkers/http_session.hpp"

#include <algorithm>
#include <cctype>

#include <boost/beast/version.hpp>

#include "checkers/api_response.hpp"
#include "checkers/websocket_session.hpp"

namespace checkers {

namespace {
constexpr const char* kServerName = "checkers-board-server";
constexpr const char* kRoomPrefix = "/ws/";
constexpr std::size_t kMaxRoomKeyLength = 64;
}  // namespace

std::optional<std::string> ParseRoomTarget(const std::string& target) {
  const std::string prefix = kRoomPrefix;
  if (target.compare(0, prefix.size(), prefix) != 0) {
    return std::nullopt;
  }
  auto room = target.substr(prefix.size());
  auto qpos = room.find('?');
  if (qpos != std::string::npos) {
    room = room.substr(0, qpos);
  }
  if (!room.empty() && room.back() == '/') {
    room.pop_back();
  }
  if (room.empty() || room.size() > kMaxRoomKeyLength) {
    return std::nullopt;
  }
  const bool valid = std::all_of(room.begin(), room.end(), [](unsigned char ch) {
    return std::isalnum(ch) != 0 || ch == '_' || ch == '-';
  });
  if (!valid) {
    return std::nullopt;
  }
  return room;
}

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<SessionRegistry> registry, std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), config_(config), registry_(std::move(registry)),
      observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
        self->OnRead(ec, bytes_transferred);
      });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }

  if (boost::beast::websocket::is_upgrade(req_)) {
    return HandleWebSocket();
  }

  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_->NextTraceId();
  observability_->IncrementRequest();
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, kServerName);
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string path = std::string(req_.target());
  auto qpos = path.find('?');
  if (qpos != std::string::npos) {
    path = path.substr(0, qpos);
  }

  if (req_.method() == http::verb::get && path == "/api/health") {
    return SendJson(res, http::status::ok, MakeSuccessEnvelope({{"status", "ok"}, {"version", "v1.0.0"}}));
  }

  if (req_.method() == http::verb::get && path == "/metrics") {
    auto snapshot = observability_->Snapshot(registry_->ActiveSessionCount());
    nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                        {"commands", {{"total", snapshot.command_total}, {"rejected", snapshot.command_rejected}}},
                        {"connections", {{"websocket", snapshot.websocket_active}}},
                        {"sessions", {{"active", snapshot.active_sessions}}}};
    return SendJson(res, http::status::ok, MakeSuccessEnvelope(data));
  }

  if (req_.method() == http::verb::get && path == "/ops/status") {
    auto header_it = req_.base().find("X-Ops-Token");
    std::string header_token = header_it == req_.base().end() ? std::string() : std::string(header_it->value());
    if (config_.ops_token.empty() || header_token != config_.ops_token) {
      observability_->IncrementError();
      return SendJson(res, http::status::unauthorized, MakeErrorEnvelope("unauthorized", "운영 토큰이 올바르지 않습니다"));
    }
    auto snapshot = observability_->Snapshot(registry_->ActiveSessionCount());
    nlohmann::json data{{"activeSessions", snapshot.active_sessions},
                        {"activeWebsocket", snapshot.websocket_active},
                        {"rejectedCommands", snapshot.command_rejected},
                        {"errorCount", snapshot.request_errors}};
    return SendJson(res, http::status::ok, MakeSuccessEnvelope(data));
  }

  observability_->IncrementError();
  SendJson(res, http::status::not_found, MakeErrorEnvelope("not_found", "경로를 찾을 수 없습니다"));
}

void HttpSession::SendJson(std::shared_ptr<Response> res, boost::beast::http::status status,
                           const nlohmann::json& body) {
  res->result(status);
  res->body() = body.dump();
  res->content_length(res->body().size());
  SendResponse(std::move(res));
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  const auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(
                           std::chrono::steady_clock::now() - request_start_)
                           .count();
  const auto level = res->result_int() >= 400 ? LogLevel::kWarn : LogLevel::kInfo;
  if (observability_->ShouldLog(level)) {
    LogContext ctx;
    ctx.trace_id = trace_id_;
    ctx.name = std::string(req_.target());
    ctx.latency_ms = static_cast<long>(latency);
    ctx.level = level;
    ctx.detail = {{"status", res->result_int()}};
    observability_->Log(ctx);
  }
  boost::beast::http::async_write(
      stream_, *res,
      [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
          return;
        }
        self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
      });
}

void HttpSession::HandleWebSocket() {
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_->NextTraceId();
  auto room = ParseRoomTarget(std::string(req_.target()));
  if (!room) {
    observability_->IncrementError();
    auto res = std::make_shared<Response>();
    res->version(req_.version());
    res->set(boost::beast::http::field::server, kServerName);
    res->set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
    return SendJson(res, boost::beast::http::status::bad_request,
                    MakeErrorEnvelope("invalid_room", "WS 경로는 /ws/<room> 형식이어야 합니다"));
  }
  boost::beast::get_lowest_layer(stream_).expires_never();
  boost::beast::websocket::stream<boost::beast::tcp_stream> ws{std::move(stream_)};
  ws.set_option(boost::beast::websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
  ws.set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::response_type& res) {
    res.set(boost::beast::http::field::server, kServerName);
  }));
  try {
    ws.accept(req_);
    std::make_shared<WebSocketSession>(std::move(ws), *room, registry_, observability_,
                                       config_.ws_queue_limit_messages, config_.ws_queue_limit_bytes)
        ->Run();
  } catch (const boost::system::system_error& ex) {
    LogContext ctx;
    ctx.trace_id = trace_id_;
    ctx.room = *room;
    ctx.name = "ws.accept_failed";
    ctx.level = LogLevel::kWarn;
    ctx.detail = {{"error", ex.what()}};
    observability_->Log(ctx);
  }
}

}  // namespace checkers
