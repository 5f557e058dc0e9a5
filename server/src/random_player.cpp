/*
 * 설명: 무작위 합법 수로 한 턴을 진행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/checkers_game_test.cpp
 */
#include "checkers/random_player.hpp"

namespace checkers {

bool PlayRandomTurn(RuleEngine& engine, std::mt19937& rng) {
  // 무포획 수 제한으로 끝난 판은 합법 수가 남아 있어도 더 두지 않는다.
  if (engine.IsOver()) {
    return false;
  }
  const int mover = engine.TurnOwner();
  while (engine.TurnOwner() == mover) {
    const auto moves = engine.LegalMoves();
    if (moves.empty()) {
      return false;
    }
    std::uniform_int_distribution<std::size_t> pick(0, moves.size() - 1);
    if (!engine.ApplyMove(moves[pick(rng)])) {
      return false;
    }
  }
  return true;
}

}  // namespace checkers
