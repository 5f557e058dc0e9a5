#include <atomic>
#include <set>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "checkers/board_reconciler.hpp"
#include "checkers/checkers_game.hpp"
#include "checkers/match_session.hpp"
#include "checkers/wire_codec.hpp"

namespace {

// 엔진 호출이 겹치면 overlaps를 증가시키는 래퍼.
class OverlapCountingEngine : public checkers::RuleEngine {
 public:
  explicit OverlapCountingEngine(std::atomic<int>& overlaps) : overlaps_(overlaps) {}

  int TurnOwner() const override {
    CallScope scope(*this);
    return game_.TurnOwner();
  }
  std::vector<checkers::Move> LegalMoves() const override {
    CallScope scope(*this);
    return game_.LegalMoves();
  }
  bool ApplyMove(const checkers::Move& move) override {
    CallScope scope(*this);
    return game_.ApplyMove(move);
  }
  bool IsOver() const override {
    CallScope scope(*this);
    return game_.IsOver();
  }
  std::optional<int> Winner() const override {
    CallScope scope(*this);
    return game_.Winner();
  }
  std::vector<checkers::Piece> Pieces() const override {
    CallScope scope(*this);
    return game_.Pieces();
  }

 private:
  class CallScope {
   public:
    explicit CallScope(const OverlapCountingEngine& engine) : engine_(engine) {
      if (engine_.active_calls_.fetch_add(1) != 0) {
        engine_.overlaps_.fetch_add(1);
      }
      std::this_thread::yield();
    }
    ~CallScope() { engine_.active_calls_.fetch_sub(1); }

   private:
    const OverlapCountingEngine& engine_;
  };

  checkers::CheckersGame game_{0};
  std::atomic<int>& overlaps_;
  mutable std::atomic<int> active_calls_{0};
};

class MatchSessionFixture : public ::testing::Test {
 protected:
  void Reset(std::unique_ptr<checkers::RuleEngine> engine) {
    session_ = std::make_unique<checkers::MatchSession>("room", std::move(engine), 42);
  }

  void SetUp() override { Reset(std::make_unique<checkers::CheckersGame>()); }

  nlohmann::json Ok(const std::string& command, nlohmann::json args = nlohmann::json::array(), int slot = 1) {
    nlohmann::json results;
    std::string error_code;
    std::string error_message;
    checkers::CommandRequest request{command, std::move(args), slot};
    EXPECT_TRUE(session_->Execute(request, results, error_code, error_message)) << error_code;
    return results;
  }

  std::string Fail(const std::string& command, nlohmann::json args = nlohmann::json::array(), int slot = 1) {
    nlohmann::json results = "untouched";
    std::string error_code;
    std::string error_message;
    checkers::CommandRequest request{command, std::move(args), slot};
    EXPECT_FALSE(session_->Execute(request, results, error_code, error_message));
    EXPECT_EQ(results, "untouched");
    EXPECT_FALSE(error_message.empty());
    return error_code;
  }

  std::unique_ptr<checkers::MatchSession> session_;
};

}  // namespace

TEST_F(MatchSessionFixture, WhoseTurnAndMoves) {
  EXPECT_EQ(Ok("whose_turn"), nlohmann::json::array({1}));
  auto moves = Ok("moves");
  ASSERT_EQ(moves.size(), 1u);
  EXPECT_EQ(moves[0].size(), 7u);
  EXPECT_EQ(moves[0][0].size(), 2u);

  auto observer_moves = Ok("moves", nlohmann::json::array(), checkers::kUnassignedSlot);
  EXPECT_TRUE(observer_moves[0].empty());
}

TEST_F(MatchSessionFixture, MakeMoveAppliesOnlyForSeatedPlayers) {
  EXPECT_EQ(Ok("make_move", {{9, 13}}, checkers::kUnassignedSlot), nlohmann::json::array({false}));
  EXPECT_EQ(Ok("whose_turn")[0], 1);

  EXPECT_EQ(Ok("make_move", {{9, 17}}), nlohmann::json::array({false}));
  EXPECT_EQ(Ok("make_move", {{9, 13}}), nlohmann::json::array({true}));
  EXPECT_EQ(Ok("whose_turn")[0], 2);
}

TEST_F(MatchSessionFixture, MakeMoveFromBoardReportsResultAndErrorSquare) {
  checkers::CheckersGame reference;
  auto prev = checkers::ExpectedPlayerBoard(reference, 1);
  auto illegal = prev;
  illegal[5][6] = false;
  illegal[3][6] = true;

  auto rejected = Ok("make_move_from_board",
                     nlohmann::json::array({checkers::SnapshotToJson(prev), checkers::SnapshotToJson(illegal)}));
  ASSERT_EQ(rejected.size(), 3u);
  EXPECT_EQ(rejected[0], false);
  EXPECT_EQ(rejected[1], nlohmann::json::array({nlohmann::json::array({3, 6})}));
  EXPECT_EQ(rejected[2], "illegal_move");

  auto legal = prev;
  legal[5][6] = false;
  legal[4][7] = true;
  auto applied = Ok("make_move_from_board",
                    nlohmann::json::array({checkers::SnapshotToJson(prev), checkers::SnapshotToJson(legal)}));
  EXPECT_EQ(applied[0], true);
  EXPECT_TRUE(applied[1].empty());
  EXPECT_EQ(applied[2], "applied");
  EXPECT_EQ(Ok("whose_turn")[0], 2);

  auto unchanged = Ok("make_move_from_board",
                      nlohmann::json::array({checkers::SnapshotToJson(legal), checkers::SnapshotToJson(legal)}), 2);
  EXPECT_EQ(unchanged[0], false);
  EXPECT_EQ(unchanged[2], "no_change");
}

TEST_F(MatchSessionFixture, BoardReconciliationCommands) {
  auto opponent = Ok("add_opponent_pieces", nlohmann::json::array(), 2);
  ASSERT_EQ(opponent.size(), 1u);
  auto parsed = checkers::ParseSnapshot(opponent[0]);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_TRUE((*parsed)[0][1]);
  EXPECT_FALSE((*parsed)[7][0]);

  checkers::CheckersGame reference;
  auto own = checkers::SnapshotToJson(checkers::ExpectedPlayerBoard(reference, 2));
  EXPECT_EQ(Ok("validate_player_board", nlohmann::json::array({own}), 2), nlohmann::json::array({nlohmann::json::array()}));

  auto phantom = checkers::ExpectedPlayerBoard(reference, 2);
  phantom[4][1] = true;
  auto flagged = Ok("validate_player_board", nlohmann::json::array({checkers::SnapshotToJson(phantom)}), 2);
  EXPECT_EQ(flagged[0], nlohmann::json::array({nlohmann::json::array({4, 1})}));
}

TEST_F(MatchSessionFixture, StatusCommands) {
  EXPECT_EQ(Ok("is_over"), nlohmann::json::array({0}));
  EXPECT_EQ(Ok("player_num", nlohmann::json::array(), 2), nlohmann::json::array({2}));
  EXPECT_EQ(Ok("echo", {"hello"}), nlohmann::json::array({"echoing: hello"}));

  Reset(std::make_unique<checkers::CheckersGame>(std::vector<checkers::Piece>{{1, 2, 9, false, false}}, 2));
  EXPECT_EQ(Ok("is_over"), nlohmann::json::array({1}));
}

TEST_F(MatchSessionFixture, RandomPlayerMoveFinishesTurn) {
  EXPECT_EQ(Ok("random_player_move", nlohmann::json::array(), checkers::kUnassignedSlot),
            nlohmann::json::array({false}));
  EXPECT_EQ(Ok("whose_turn")[0], 1);
  EXPECT_EQ(Ok("random_player_move"), nlohmann::json::array({true}));
  EXPECT_EQ(Ok("whose_turn")[0], 2);
}

TEST_F(MatchSessionFixture, RejectsUnknownCommandsAndBadArguments) {
  EXPECT_EQ(Fail("resign"), "unknown_command");
  EXPECT_EQ(Fail("make_move_from_board", nlohmann::json::array({nlohmann::json::array()})), "bad_arguments");
  EXPECT_EQ(Fail("make_move_from_board", nlohmann::json::array({nlohmann::json::array(), nlohmann::json::array()})),
            "bad_arguments");
  EXPECT_EQ(Fail("validate_player_board", nlohmann::json::array({"board"})), "bad_arguments");
  EXPECT_EQ(Fail("make_move", nlohmann::json::array({nlohmann::json::array({9})})), "bad_arguments");
  EXPECT_EQ(Fail("whose_turn", nlohmann::json::object()), "bad_arguments");
  EXPECT_EQ(Fail("echo"), "bad_arguments");

  // 거절된 명령 뒤에도 세션은 계속 사용할 수 있다.
  EXPECT_EQ(Ok("whose_turn")[0], 1);
}

TEST_F(MatchSessionFixture, WideIntegerMoveIsRejectedNotApplied) {
  EXPECT_EQ(Fail("make_move", nlohmann::json::parse("[[4294967305, 13]]")), "bad_arguments");
  EXPECT_EQ(Ok("whose_turn")[0], 1);
  EXPECT_EQ(Ok("moves")[0].size(), 7u);
}

TEST(MatchSessionConcurrencyTest, BothPlayersNeverInterleaveEngineAccess) {
  std::atomic<int> overlaps{0};
  auto engine = std::make_unique<OverlapCountingEngine>(overlaps);
  const OverlapCountingEngine* observed = engine.get();
  checkers::MatchSession session("race", std::move(engine), 7);

  auto start = checkers::EmptySnapshot();
  start[5][0] = true;
  auto stepped = checkers::EmptySnapshot();
  stepped[4][1] = true;
  const nlohmann::json board_args =
      nlohmann::json::array({checkers::SnapshotToJson(start), checkers::SnapshotToJson(stepped)});

  std::atomic<int> failures{0};
  std::atomic<int> bad_turns{0};
  auto drive = [&](int slot) {
    for (int i = 0; i < 300; ++i) {
      nlohmann::json results;
      std::string error_code;
      std::string error_message;
      const char* command = i % 3 == 0 ? "random_player_move" : i % 3 == 1 ? "make_move_from_board" : "whose_turn";
      checkers::CommandRequest request{command, i % 3 == 1 ? board_args : nlohmann::json::array(), slot};
      if (!session.Execute(request, results, error_code, error_message)) {
        failures.fetch_add(1);
        continue;
      }
      if (i % 3 == 2 && results[0] != 1 && results[0] != 2) {
        bad_turns.fetch_add(1);
      }
    }
  };
  std::thread first(drive, 1);
  std::thread second(drive, 2);
  first.join();
  second.join();

  EXPECT_EQ(overlaps.load(), 0);
  EXPECT_EQ(failures.load(), 0);
  EXPECT_EQ(bad_turns.load(), 0);

  std::set<int> occupied;
  for (const auto& piece : observed->Pieces()) {
    if (piece.captured) {
      continue;
    }
    EXPECT_TRUE(checkers::IsValidNotation(piece.position));
    EXPECT_TRUE(occupied.insert(piece.position).second) << "두 말이 " << piece.position << "번 칸에 있다";
  }
  const int turn = observed->TurnOwner();
  EXPECT_TRUE(turn == 1 || turn == 2);
}
