/*
 * 설명: 격자 좌표와 체커 표기 번호 변환, 플레이어별 미러링을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/coordinate_mapper_test.cpp
 */
#include "checkers/coordinate_mapper.hpp"

namespace checkers {
namespace {
constexpr int kSquaresPerRow = kBoardSize / 2;
constexpr int kMirrorBase = kSquareCount + 1;
}  // namespace

int GridToNotation(int row, int col, int player) {
  int position = row * kSquaresPerRow + 1;
  if (row % 2 == 0) {
    col -= 1;
  }
  position += col / 2;

  if (player == 1) {
    return kMirrorBase - position;
  }
  return position;
}

GridPosition NotationToGrid(int position, int player) {
  if (player == 1) {
    position = kMirrorBase - position;
  }
  GridPosition grid;
  grid.row = (position - 1) / kSquaresPerRow;
  grid.col = (position - (grid.row * kSquaresPerRow + 1)) * 2;
  if (grid.row % 2 == 0) {
    grid.col += 1;
  }
  return grid;
}

bool IsOnBoard(int row, int col) { return row >= 0 && row < kBoardSize && col >= 0 && col < kBoardSize; }

bool IsDarkSquare(int row, int col) { return IsOnBoard(row, col) && (row + col) % 2 == 1; }

bool IsValidNotation(int position) { return position >= 1 && position <= kSquareCount; }

int OpponentOf(int player) {
  if (player == 1) {
    return 2;
  }
  if (player == 2) {
    return 1;
  }
  return kUnassignedSlot;
}

BoardSnapshot EmptySnapshot() {
  BoardSnapshot board{};
  for (auto& row : board) {
    row.fill(false);
  }
  return board;
}

}  // namespace checkers
