/*
 * 설명: 기대 보드 생성과 물리 보드 불일치 검출을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/board_reconciler_test.cpp
 */
#include "checkers/board_reconciler.hpp"

namespace checkers {

BoardSnapshot ExpectedOpponentBoard(const RuleEngine& engine, int player) {
  auto board = EmptySnapshot();
  for (const auto& piece : engine.Pieces()) {
    if (piece.other_player == player && !piece.captured) {
      const auto grid = NotationToGrid(piece.position, player);
      board[grid.row][grid.col] = true;
    }
  }
  return board;
}

BoardSnapshot ExpectedPlayerBoard(const RuleEngine& engine, int player) {
  auto board = EmptySnapshot();
  for (const auto& piece : engine.Pieces()) {
    if (piece.player == player && !piece.captured) {
      const auto grid = NotationToGrid(piece.position, player);
      board[grid.row][grid.col] = true;
    }
  }
  return board;
}

std::vector<GridPosition> ValidatePlayerBoard(const RuleEngine& engine, const BoardSnapshot& board, int player) {
  std::vector<GridPosition> mismatches;
  auto expected = EmptySnapshot();
  for (const auto& piece : engine.Pieces()) {
    if (piece.player != player || piece.captured) {
      continue;
    }
    const auto grid = NotationToGrid(piece.position, player);
    expected[grid.row][grid.col] = true;
    if (!board[grid.row][grid.col]) {
      mismatches.push_back(grid);
    }
  }

  for (int r = 0; r < kBoardSize; ++r) {
    for (int c = 0; c < kBoardSize; ++c) {
      if (board[r][c] && !expected[r][c]) {
        mismatches.push_back(GridPosition{r, c});
      }
    }
  }
  return mismatches;
}

}  // namespace checkers
