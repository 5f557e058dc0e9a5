/*
 * 설명: 잉글리시 드래프트 규칙을 따르는 기본 규칙 엔진 구현체.
 *       강제 잡기, 연속 잡기 시 턴 유지, 킹 승격, 무포획 수 제한 무승부를 처리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/checkers_game_test.cpp
 */
#pragma once

#include <optional>
#include <vector>

#include "checkers/rule_engine.hpp"

namespace checkers {

class CheckersGame : public RuleEngine {
 public:
  static constexpr int kDefaultNonCaptureMoveLimit = 40;
  static constexpr int kStartingRows = 3;

  explicit CheckersGame(int non_capture_move_limit = kDefaultNonCaptureMoveLimit);
  // 테스트/픽스처용 임의 배치. pieces의 other_player는 무시하고 다시 계산한다.
  CheckersGame(std::vector<Piece> pieces, int turn, int non_capture_move_limit = kDefaultNonCaptureMoveLimit);

  int TurnOwner() const override { return turn_; }
  std::vector<Move> LegalMoves() const override;
  bool ApplyMove(const Move& move) override;
  bool IsOver() const override;
  std::optional<int> Winner() const override;
  std::vector<Piece> Pieces() const override { return pieces_; }

  int MovesSinceLastCapture() const { return moves_since_capture_; }

 private:
  void AppendCaptureMoves(const Piece& piece, std::vector<Move>& out) const;
  void AppendStepMoves(const Piece& piece, std::vector<Move>& out) const;
  bool CanCapture(const Piece& piece) const;
  Piece* FindActivePiece(int position);
  const Piece* FindActivePiece(int position) const;
  std::optional<int> Neighbor(int position, int row_delta, int col_delta) const;
  std::vector<int> ForwardRowDeltas(const Piece& piece) const;
  bool ReachedCrowningRow(const Piece& piece) const;

  std::vector<Piece> pieces_;
  int turn_{1};
  int non_capture_move_limit_;
  int moves_since_capture_{0};
  std::optional<int> capturing_piece_position_;
};

}  // namespace checkers
