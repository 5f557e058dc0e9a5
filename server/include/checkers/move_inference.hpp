/*
 * 설명: 연속된 두 보드 스냅샷의 차이에서 하나의 수를 추론해 규칙 엔진에 적용한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/move_inference_test.cpp
 */
#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "checkers/coordinate_mapper.hpp"
#include "checkers/rule_engine.hpp"

namespace checkers {

enum class SnapshotDiffKind { kNoChange, kUnpairedChange, kSingleMove, kAmbiguousChange };

struct SnapshotDiff {
  SnapshotDiffKind kind{SnapshotDiffKind::kNoChange};
  std::vector<GridPosition> vacated;
  std::vector<GridPosition> filled;
  // kSingleMove일 때만 채워진다.
  std::optional<GridPosition> start;
  std::optional<GridPosition> end;
};

enum class InferenceOutcome {
  kApplied,
  kNoChange,
  kUnpairedChange,
  kAmbiguousChange,
  kIllegalMove,
  kUnassignedPlayer,
};

struct InferenceResult {
  bool applied{false};
  std::optional<GridPosition> error_square;
  InferenceOutcome outcome{InferenceOutcome::kNoChange};
};

SnapshotDiff DiffSnapshots(const BoardSnapshot& prev, const BoardSnapshot& curr);

InferenceResult InferAndApplyMove(RuleEngine& engine, const BoardSnapshot& prev, const BoardSnapshot& curr,
                                  int player);

std::string_view ToString(InferenceOutcome outcome);

}  // namespace checkers
