/*
 * 설명: 방 단위 명령 분기와 인자 검증을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/match_session_test.cpp, server/tests/e2e/room_flow_test.cpp
 */
#include "checkers/match_session.hpp"

#include "checkers/board_reconciler.hpp"
#include "checkers/move_inference.hpp"
#include "checkers/random_player.hpp"
#include "checkers/wire_codec.hpp"

namespace checkers {
namespace {
bool IsSeated(int player_slot) { return player_slot == 1 || player_slot == 2; }

bool RequireArgumentCount(const CommandRequest& request, std::size_t expected, std::string& error_code,
                          std::string& error_message) {
  if (request.arguments.size() == expected) {
    return true;
  }
  error_code = "bad_arguments";
  error_message = request.command + " 명령은 인자 " + std::to_string(expected) + "개가 필요합니다";
  return false;
}

void SetSnapshotError(std::string& error_code, std::string& error_message) {
  error_code = "bad_arguments";
  error_message = "스냅샷은 8x8 불리언 배열이어야 합니다";
}
}  // namespace

MatchSession::MatchSession(std::string key, std::unique_ptr<RuleEngine> engine, std::uint32_t seed)
    : key_(std::move(key)), engine_(std::move(engine)), rng_(seed) {}

bool MatchSession::Execute(const CommandRequest& request, nlohmann::json& results, std::string& error_code,
                           std::string& error_message) {
  if (!request.arguments.is_array()) {
    error_code = "bad_arguments";
    error_message = "arguments는 배열이어야 합니다";
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  const auto& command = request.command;
  nlohmann::json out = nlohmann::json::array();

  if (command == "whose_turn") {
    out.push_back(engine_->TurnOwner());
  } else if (command == "moves") {
    out.push_back(MoveListToJson(IsSeated(request.player_slot) ? engine_->LegalMoves() : std::vector<Move>{}));
  } else if (command == "make_move_from_board") {
    if (!HandleMakeMoveFromBoard(request, out, error_code, error_message)) {
      return false;
    }
  } else if (command == "add_opponent_pieces") {
    out.push_back(SnapshotToJson(ExpectedOpponentBoard(*engine_, request.player_slot)));
  } else if (command == "validate_player_board") {
    if (!HandleValidatePlayerBoard(request, out, error_code, error_message)) {
      return false;
    }
  } else if (command == "random_player_move") {
    out.push_back(IsSeated(request.player_slot) && PlayRandomTurn(*engine_, rng_));
  } else if (command == "is_over") {
    out.push_back(GameStatus());
  } else if (command == "player_num") {
    out.push_back(request.player_slot);
  } else if (command == "make_move") {
    if (!HandleMakeMove(request, out, error_code, error_message)) {
      return false;
    }
  } else if (command == "echo") {
    if (!RequireArgumentCount(request, 1, error_code, error_message)) {
      return false;
    }
    const auto& value = request.arguments[0];
    out.push_back("echoing: " + (value.is_string() ? value.get<std::string>() : value.dump()));
  } else {
    error_code = "unknown_command";
    error_message = "알 수 없는 명령입니다: " + command;
    return false;
  }

  results = std::move(out);
  return true;
}

bool MatchSession::HandleMakeMoveFromBoard(const CommandRequest& request, nlohmann::json& results,
                                           std::string& error_code, std::string& error_message) {
  if (!RequireArgumentCount(request, 2, error_code, error_message)) {
    return false;
  }
  auto prev = ParseSnapshot(request.arguments[0]);
  auto curr = ParseSnapshot(request.arguments[1]);
  if (!prev || !curr) {
    SetSnapshotError(error_code, error_message);
    return false;
  }

  const auto inference = InferAndApplyMove(*engine_, *prev, *curr, request.player_slot);
  nlohmann::json error_location = nlohmann::json::array();
  if (inference.error_square) {
    error_location.push_back(GridToJson(*inference.error_square));
  }
  results.push_back(inference.applied);
  results.push_back(error_location);
  results.push_back(std::string(ToString(inference.outcome)));
  return true;
}

bool MatchSession::HandleValidatePlayerBoard(const CommandRequest& request, nlohmann::json& results,
                                             std::string& error_code, std::string& error_message) {
  if (!RequireArgumentCount(request, 1, error_code, error_message)) {
    return false;
  }
  auto board = ParseSnapshot(request.arguments[0]);
  if (!board) {
    SetSnapshotError(error_code, error_message);
    return false;
  }
  results.push_back(GridListToJson(ValidatePlayerBoard(*engine_, *board, request.player_slot)));
  return true;
}

bool MatchSession::HandleMakeMove(const CommandRequest& request, nlohmann::json& results, std::string& error_code,
                                  std::string& error_message) {
  if (!RequireArgumentCount(request, 1, error_code, error_message)) {
    return false;
  }
  auto move = ParseMove(request.arguments[0]);
  if (!move) {
    error_code = "bad_arguments";
    error_message = "수는 [from, to] 정수 쌍이어야 합니다";
    return false;
  }
  results.push_back(IsSeated(request.player_slot) && engine_->ApplyMove(*move));
  return true;
}

nlohmann::json MatchSession::GameStatus() const {
  if (!engine_->IsOver()) {
    return 0;
  }
  auto winner = engine_->Winner();
  if (!winner) {
    return nullptr;
  }
  return *winner;
}

}  // namespace checkers
