/*
 * 설명: 명령 인자/결과에 쓰이는 좌표, 수, 스냅샷의 JSON 변환을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/wire_codec_test.cpp
 */
#pragma once

#include <optional>
#include <vector>

#include <nlohmann/json.hpp>

#include "checkers/coordinate_mapper.hpp"
#include "checkers/rule_engine.hpp"

namespace checkers {

nlohmann::json GridToJson(const GridPosition& grid);
nlohmann::json GridListToJson(const std::vector<GridPosition>& grids);
nlohmann::json MoveToJson(const Move& move);
nlohmann::json MoveListToJson(const std::vector<Move>& moves);
nlohmann::json SnapshotToJson(const BoardSnapshot& board);

// 8x8 배열만 허용한다. 각 칸은 bool 또는 정수(0이 아니면 점유)여야 한다.
std::optional<BoardSnapshot> ParseSnapshot(const nlohmann::json& value);
// [from, to] 형식의 정수 쌍. 두 값 모두 1..32 범위의 칸 번호여야 한다.
std::optional<Move> ParseMove(const nlohmann::json& value);

}  // namespace checkers
