/*
 * 설명: 좌표, 수, 스냅샷의 JSON 직렬화/역직렬화를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/wire_codec_test.cpp
 */
#include "checkers/wire_codec.hpp"

#include <cstdint>

namespace checkers {
namespace {
// 1..32 범위 밖의 값은 int로 변환하기 전에 거절한다.
std::optional<int> ParseNotation(const nlohmann::json& value) {
  std::int64_t raw = 0;
  if (value.is_number_unsigned()) {
    const auto unsigned_raw = value.get<std::uint64_t>();
    if (unsigned_raw > static_cast<std::uint64_t>(kSquareCount)) {
      return std::nullopt;
    }
    raw = static_cast<std::int64_t>(unsigned_raw);
  } else if (value.is_number_integer()) {
    raw = value.get<std::int64_t>();
  } else {
    return std::nullopt;
  }
  if (raw < 1 || raw > kSquareCount) {
    return std::nullopt;
  }
  return static_cast<int>(raw);
}
}  // namespace

nlohmann::json GridToJson(const GridPosition& grid) { return nlohmann::json::array({grid.row, grid.col}); }

nlohmann::json GridListToJson(const std::vector<GridPosition>& grids) {
  nlohmann::json list = nlohmann::json::array();
  for (const auto& grid : grids) {
    list.push_back(GridToJson(grid));
  }
  return list;
}

nlohmann::json MoveToJson(const Move& move) { return nlohmann::json::array({move.from, move.to}); }

nlohmann::json MoveListToJson(const std::vector<Move>& moves) {
  nlohmann::json list = nlohmann::json::array();
  for (const auto& move : moves) {
    list.push_back(MoveToJson(move));
  }
  return list;
}

nlohmann::json SnapshotToJson(const BoardSnapshot& board) {
  nlohmann::json rows = nlohmann::json::array();
  for (const auto& row : board) {
    nlohmann::json cells = nlohmann::json::array();
    for (bool occupied : row) {
      cells.push_back(occupied);
    }
    rows.push_back(cells);
  }
  return rows;
}

std::optional<BoardSnapshot> ParseSnapshot(const nlohmann::json& value) {
  if (!value.is_array() || value.size() != kBoardSize) {
    return std::nullopt;
  }
  BoardSnapshot board = EmptySnapshot();
  for (int r = 0; r < kBoardSize; ++r) {
    const auto& row = value[r];
    if (!row.is_array() || row.size() != kBoardSize) {
      return std::nullopt;
    }
    for (int c = 0; c < kBoardSize; ++c) {
      const auto& cell = row[c];
      if (cell.is_boolean()) {
        board[r][c] = cell.get<bool>();
      } else if (cell.is_number_integer()) {
        board[r][c] = cell.get<long long>() != 0;
      } else {
        return std::nullopt;
      }
    }
  }
  return board;
}

std::optional<Move> ParseMove(const nlohmann::json& value) {
  if (!value.is_array() || value.size() != 2) {
    return std::nullopt;
  }
  auto from = ParseNotation(value[0]);
  auto to = ParseNotation(value[1]);
  if (!from || !to) {
    return std::nullopt;
  }
  return Move{*from, *to};
}

}  // namespace checkers
