/*
 * 설명: 엔진 상태를 기준으로 상대 말 배치를 계산하고 플레이어의 물리 보드를 검증한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/board_reconciler_test.cpp
 */
#pragma once

#include <vector>

#include "checkers/coordinate_mapper.hpp"
#include "checkers/rule_engine.hpp"

namespace checkers {

// player 시점으로 그린, 잡히지 않은 상대 말의 위치.
BoardSnapshot ExpectedOpponentBoard(const RuleEngine& engine, int player);

// player 시점으로 그린, 잡히지 않은 player 자신의 말의 위치.
BoardSnapshot ExpectedPlayerBoard(const RuleEngine& engine, int player);

// 말이 있어야 하는데 비어 있는 칸(엔진 말 순서)을 먼저, 있으면 안 되는 칸(행 우선 순서)을 뒤에 반환한다.
std::vector<GridPosition> ValidatePlayerBoard(const RuleEngine& engine, const BoardSnapshot& board, int player);

}  // namespace checkers
