/*
 * 설명: 스냅샷 차이 분석과 수 추론/적용을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/move_inference_test.cpp
 */
#include "checkers/move_inference.hpp"

#include <cstdlib>

namespace checkers {
namespace {
bool IsJumpMidpoint(const GridPosition& from, const GridPosition& over, const GridPosition& to) {
  if (std::abs(to.row - from.row) != 2 || std::abs(to.col - from.col) != 2) {
    return false;
  }
  return over.row == (from.row + to.row) / 2 && over.col == (from.col + to.col) / 2;
}

// 잡기와 동시에 잡힌 말을 들어낸 경우: 빈 칸 두 개 중 하나가 다른 빈 칸과 도착 칸의 대각 중점이다.
std::optional<GridPosition> ResolveLiftedJump(const SnapshotDiff& diff) {
  if (diff.vacated.size() != 2 || diff.filled.size() != 1) {
    return std::nullopt;
  }
  const auto& end = diff.filled.front();
  const auto& first = diff.vacated[0];
  const auto& second = diff.vacated[1];
  const bool first_is_origin = IsJumpMidpoint(first, second, end);
  const bool second_is_origin = IsJumpMidpoint(second, first, end);
  if (first_is_origin == second_is_origin) {
    return std::nullopt;
  }
  return first_is_origin ? first : second;
}
}  // namespace

SnapshotDiff DiffSnapshots(const BoardSnapshot& prev, const BoardSnapshot& curr) {
  SnapshotDiff diff;
  for (int r = 0; r < kBoardSize; ++r) {
    for (int c = 0; c < kBoardSize; ++c) {
      if (prev[r][c] && !curr[r][c]) {
        diff.vacated.push_back(GridPosition{r, c});
      } else if (!prev[r][c] && curr[r][c]) {
        diff.filled.push_back(GridPosition{r, c});
      }
    }
  }

  if (diff.vacated.empty() && diff.filled.empty()) {
    diff.kind = SnapshotDiffKind::kNoChange;
  } else if (diff.vacated.empty() || diff.filled.empty()) {
    diff.kind = SnapshotDiffKind::kUnpairedChange;
  } else if (diff.vacated.size() == 1 && diff.filled.size() == 1) {
    diff.kind = SnapshotDiffKind::kSingleMove;
    diff.start = diff.vacated.front();
    diff.end = diff.filled.front();
  } else if (auto origin = ResolveLiftedJump(diff)) {
    diff.kind = SnapshotDiffKind::kSingleMove;
    diff.start = *origin;
    diff.end = diff.filled.front();
  } else {
    diff.kind = SnapshotDiffKind::kAmbiguousChange;
  }
  return diff;
}

InferenceResult InferAndApplyMove(RuleEngine& engine, const BoardSnapshot& prev, const BoardSnapshot& curr,
                                  int player) {
  InferenceResult result;
  if (player != 1 && player != 2) {
    result.outcome = InferenceOutcome::kUnassignedPlayer;
    return result;
  }

  const auto diff = DiffSnapshots(prev, curr);
  switch (diff.kind) {
    case SnapshotDiffKind::kNoChange:
      result.outcome = InferenceOutcome::kNoChange;
      return result;
    case SnapshotDiffKind::kUnpairedChange:
      result.outcome = InferenceOutcome::kUnpairedChange;
      return result;
    case SnapshotDiffKind::kAmbiguousChange:
      result.outcome = InferenceOutcome::kAmbiguousChange;
      return result;
    case SnapshotDiffKind::kSingleMove:
      break;
  }

  const Move move{GridToNotation(diff.start->row, diff.start->col, player),
                  GridToNotation(diff.end->row, diff.end->col, player)};
  if (!engine.ApplyMove(move)) {
    result.error_square = diff.end;
    result.outcome = InferenceOutcome::kIllegalMove;
    return result;
  }
  result.applied = true;
  result.outcome = InferenceOutcome::kApplied;
  return result;
}

std::string_view ToString(InferenceOutcome outcome) {
  switch (outcome) {
    case InferenceOutcome::kApplied:
      return "applied";
    case InferenceOutcome::kNoChange:
      return "no_change";
    case InferenceOutcome::kUnpairedChange:
      return "unpaired_change";
    case InferenceOutcome::kAmbiguousChange:
      return "ambiguous_change";
    case InferenceOutcome::kIllegalMove:
      return "illegal_move";
    case InferenceOutcome::kUnassignedPlayer:
      return "unassigned_player";
  }
  return "unknown";
}

}  // namespace checkers
