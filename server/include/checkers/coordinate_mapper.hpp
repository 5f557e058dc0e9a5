/*
 * 설명: 물리 보드 격자 좌표(row, col)와 체커 표기 번호(1..32) 사이의 양방향 변환을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/coordinate_mapper_test.cpp
 */
#pragma once

#include <array>

namespace checkers {

inline constexpr int kBoardSize = 8;
inline constexpr int kSquareCount = 32;
inline constexpr int kUnassignedSlot = -1;

using BoardSnapshot = std::array<std::array<bool, kBoardSize>, kBoardSize>;

struct GridPosition {
  int row{0};
  int col{0};

  bool operator==(const GridPosition&) const = default;
};

// player 2의 방향이 기준 표기이며, player 1은 33 - position으로 뒤집는다.
int GridToNotation(int row, int col, int player);
GridPosition NotationToGrid(int position, int player);

bool IsOnBoard(int row, int col);
bool IsDarkSquare(int row, int col);
bool IsValidNotation(int position);
int OpponentOf(int player);
BoardSnapshot EmptySnapshot();

}  // namespace checkers
