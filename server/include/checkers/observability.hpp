/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/observability_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace checkers {

enum class LogLevel { kDebug = 0, kInfo, kWarn, kError };

LogLevel ParseLogLevel(std::string_view text);
std::string_view ToString(LogLevel level);

struct LogContext {
  std::string trace_id;
  std::optional<int> player_slot;
  std::optional<std::string> room;
  std::string name;
  long latency_ms{0};
  LogLevel level{LogLevel::kInfo};
  nlohmann::json detail;
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t command_total{0};
  std::uint64_t command_rejected{0};
  std::uint64_t websocket_active{0};
  std::uint64_t active_sessions{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo, std::ostream* sink = nullptr);

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void IncrementCommand();
  void IncrementCommandRejected();
  void WebsocketOpened();
  void WebsocketClosed();
  MetricsSnapshot Snapshot(std::uint64_t active_sessions) const;
  bool ShouldLog(LogLevel level) const { return level >= min_level_; }
  void Log(const LogContext& ctx) const;

 private:
  LogLevel min_level_;
  std::ostream* sink_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> command_total_{0};
  std::atomic<std::uint64_t> command_rejected_{0};
  std::atomic<std::uint64_t> websocket_active_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace checkers
