/*
 * 설명: 합법 수 중 무작위로 골라 한 턴을 끝까지 두는 보조 플레이어(자가 대국/테스트용).
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/checkers_game_test.cpp
 */
#pragma once

#include <random>

#include "checkers/rule_engine.hpp"

namespace checkers {

// 턴이 상대에게 넘어가면 true, 둘 수가 없거나 적용이 거절되면 false.
bool PlayRandomTurn(RuleEngine& engine, std::mt19937& rng);

}  // namespace checkers
