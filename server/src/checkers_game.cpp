/*
 * 설명: 기본 규칙 엔진의 수 생성, 수 적용, 종료/승자 판정을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/checkers_game_test.cpp
 */
#include "checkers/checkers_game.hpp"

#include <algorithm>
#include <cstdlib>

#include "checkers/coordinate_mapper.hpp"

namespace checkers {
namespace {
// 엔진 내부 기하는 항상 기준 방향(player 2)으로 계산한다.
constexpr int kCanonicalFrame = 2;
constexpr int kColumnDeltas[] = {-1, 1};
}  // namespace

CheckersGame::CheckersGame(int non_capture_move_limit) : non_capture_move_limit_(non_capture_move_limit) {
  const int squares_per_side = kStartingRows * (kBoardSize / 2);
  for (int position = 1; position <= squares_per_side; ++position) {
    pieces_.push_back(Piece{1, 2, position, false, false});
  }
  for (int position = kSquareCount - squares_per_side + 1; position <= kSquareCount; ++position) {
    pieces_.push_back(Piece{2, 1, position, false, false});
  }
}

CheckersGame::CheckersGame(std::vector<Piece> pieces, int turn, int non_capture_move_limit)
    : pieces_(std::move(pieces)), turn_(turn), non_capture_move_limit_(non_capture_move_limit) {
  for (auto& piece : pieces_) {
    piece.other_player = OpponentOf(piece.player);
  }
}

std::vector<Move> CheckersGame::LegalMoves() const {
  std::vector<Move> moves;
  if (capturing_piece_position_) {
    if (const Piece* piece = FindActivePiece(*capturing_piece_position_)) {
      AppendCaptureMoves(*piece, moves);
    }
    return moves;
  }

  for (const auto& piece : pieces_) {
    if (!piece.captured && piece.player == turn_) {
      AppendCaptureMoves(piece, moves);
    }
  }
  if (!moves.empty()) {
    return moves;
  }

  for (const auto& piece : pieces_) {
    if (!piece.captured && piece.player == turn_) {
      AppendStepMoves(piece, moves);
    }
  }
  return moves;
}

bool CheckersGame::ApplyMove(const Move& move) {
  const auto legal = LegalMoves();
  if (std::find(legal.begin(), legal.end(), move) == legal.end()) {
    return false;
  }
  Piece* piece = FindActivePiece(move.from);
  if (piece == nullptr) {
    return false;
  }

  const auto from = NotationToGrid(move.from, kCanonicalFrame);
  const auto to = NotationToGrid(move.to, kCanonicalFrame);
  const bool is_capture = std::abs(to.row - from.row) == 2;
  if (is_capture) {
    const int jumped_position = GridToNotation((from.row + to.row) / 2, (from.col + to.col) / 2, kCanonicalFrame);
    if (Piece* jumped = FindActivePiece(jumped_position)) {
      jumped->captured = true;
    }
    moves_since_capture_ = 0;
  } else {
    ++moves_since_capture_;
  }

  piece->position = move.to;
  bool crowned = false;
  if (!piece->king && ReachedCrowningRow(*piece)) {
    piece->king = true;
    crowned = true;
  }

  // 승격 직후에는 연속 잡기를 이어가지 않는다.
  if (is_capture && !crowned && CanCapture(*piece)) {
    capturing_piece_position_ = move.to;
    return true;
  }
  capturing_piece_position_.reset();
  turn_ = OpponentOf(turn_);
  return true;
}

bool CheckersGame::IsOver() const {
  if (non_capture_move_limit_ > 0 && moves_since_capture_ >= non_capture_move_limit_) {
    return true;
  }
  return LegalMoves().empty();
}

std::optional<int> CheckersGame::Winner() const {
  if (LegalMoves().empty()) {
    return OpponentOf(turn_);
  }
  return std::nullopt;
}

void CheckersGame::AppendCaptureMoves(const Piece& piece, std::vector<Move>& out) const {
  for (int row_delta : ForwardRowDeltas(piece)) {
    for (int col_delta : kColumnDeltas) {
      auto over = Neighbor(piece.position, row_delta, col_delta);
      if (!over) {
        continue;
      }
      const Piece* victim = FindActivePiece(*over);
      if (victim == nullptr || victim->player == piece.player) {
        continue;
      }
      auto landing = Neighbor(*over, row_delta, col_delta);
      if (!landing || FindActivePiece(*landing) != nullptr) {
        continue;
      }
      out.push_back(Move{piece.position, *landing});
    }
  }
}

void CheckersGame::AppendStepMoves(const Piece& piece, std::vector<Move>& out) const {
  for (int row_delta : ForwardRowDeltas(piece)) {
    for (int col_delta : kColumnDeltas) {
      auto target = Neighbor(piece.position, row_delta, col_delta);
      if (target && FindActivePiece(*target) == nullptr) {
        out.push_back(Move{piece.position, *target});
      }
    }
  }
}

bool CheckersGame::CanCapture(const Piece& piece) const {
  std::vector<Move> captures;
  AppendCaptureMoves(piece, captures);
  return !captures.empty();
}

Piece* CheckersGame::FindActivePiece(int position) {
  for (auto& piece : pieces_) {
    if (!piece.captured && piece.position == position) {
      return &piece;
    }
  }
  return nullptr;
}

const Piece* CheckersGame::FindActivePiece(int position) const {
  for (const auto& piece : pieces_) {
    if (!piece.captured && piece.position == position) {
      return &piece;
    }
  }
  return nullptr;
}

std::optional<int> CheckersGame::Neighbor(int position, int row_delta, int col_delta) const {
  const auto grid = NotationToGrid(position, kCanonicalFrame);
  const int row = grid.row + row_delta;
  const int col = grid.col + col_delta;
  if (!IsDarkSquare(row, col)) {
    return std::nullopt;
  }
  return GridToNotation(row, col, kCanonicalFrame);
}

std::vector<int> CheckersGame::ForwardRowDeltas(const Piece& piece) const {
  if (piece.king) {
    return {-1, 1};
  }
  // player 1은 1번 칸 쪽(위)에서 출발해 행 번호가 커지는 방향으로 전진한다.
  return {piece.player == 1 ? 1 : -1};
}

bool CheckersGame::ReachedCrowningRow(const Piece& piece) const {
  const int row = NotationToGrid(piece.position, kCanonicalFrame).row;
  return piece.player == 1 ? row == kBoardSize - 1 : row == 0;
}

}  // namespace checkers
