/*
 * 설명: 코어가 사용하는 규칙 엔진 어댑터 인터페이스와 수/말 타입을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/checkers_game_test.cpp, server/tests/unit/move_inference_test.cpp
 */
#pragma once

#include <optional>
#include <vector>

namespace checkers {

struct Move {
  int from{0};
  int to{0};

  bool operator==(const Move&) const = default;
};

struct Piece {
  int player{0};
  int other_player{0};
  int position{0};
  bool captured{false};
  bool king{false};
};

// 구현체는 잘못된 수를 예외 대신 false로 거절해야 한다.
class RuleEngine {
 public:
  virtual ~RuleEngine() = default;

  virtual int TurnOwner() const = 0;
  virtual std::vector<Move> LegalMoves() const = 0;
  virtual bool ApplyMove(const Move& move) = 0;
  virtual bool IsOver() const = 0;
  virtual std::optional<int> Winner() const = 0;
  virtual std::vector<Piece> Pieces() const = 0;
};

}  // namespace checkers
