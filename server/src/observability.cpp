/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/observability_test.cpp
 */
#include "checkers/observability.hpp"

#include <chrono>
#include <iostream>
#include <mutex>
#include <sstream>

namespace checkers {
namespace {
std::mutex& SinkMutex() {
  static std::mutex mutex;
  return mutex;
}
}  // namespace

LogLevel ParseLogLevel(std::string_view text) {
  if (text == "debug") {
    return LogLevel::kDebug;
  }
  if (text == "warn" || text == "warning") {
    return LogLevel::kWarn;
  }
  if (text == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

std::string_view ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

Observability::Observability(LogLevel min_level, std::ostream* sink)
    : min_level_(min_level), sink_(sink ? sink : &std::cout) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::IncrementCommand() { command_total_.fetch_add(1); }

void Observability::IncrementCommandRejected() { command_rejected_.fetch_add(1); }

void Observability::WebsocketOpened() { websocket_active_.fetch_add(1); }

void Observability::WebsocketClosed() { websocket_active_.fetch_sub(1); }

MetricsSnapshot Observability::Snapshot(std::uint64_t active_sessions) const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.command_total = command_total_.load();
  snapshot.command_rejected = command_rejected_.load();
  snapshot.websocket_active = websocket_active_.load();
  snapshot.active_sessions = active_sessions;
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (!ShouldLog(ctx.level)) {
    return;
  }
  nlohmann::json log_json;
  log_json["level"] = ToString(ctx.level);
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.player_slot) {
    log_json["playerSlot"] = *ctx.player_slot;
  }
  if (ctx.room) {
    log_json["room"] = *ctx.room;
  }
  if (!ctx.detail.is_null()) {
    log_json["detail"] = ctx.detail;
  }
  std::lock_guard<std::mutex> lock(SinkMutex());
  *sink_ << log_json.dump() << std::endl;
}

}  // namespace checkers
