#include <gtest/gtest.h>

#include "checkers/coordinate_mapper.hpp"

namespace {

TEST(CoordinateMapperTest, RoundTripsEveryDarkSquareForBothPlayers) {
  for (int player : {1, 2}) {
    for (int r = 0; r < checkers::kBoardSize; ++r) {
      for (int c = 0; c < checkers::kBoardSize; ++c) {
        if (!checkers::IsDarkSquare(r, c)) {
          continue;
        }
        const int position = checkers::GridToNotation(r, c, player);
        EXPECT_TRUE(checkers::IsValidNotation(position)) << r << "," << c;
        EXPECT_EQ(checkers::NotationToGrid(position, player), (checkers::GridPosition{r, c}))
            << "player " << player << " square " << r << "," << c;
      }
    }
  }
}

TEST(CoordinateMapperTest, PlayerOneIsMirrorOfPlayerTwo) {
  for (int r = 0; r < checkers::kBoardSize; ++r) {
    for (int c = 0; c < checkers::kBoardSize; ++c) {
      if (checkers::IsDarkSquare(r, c)) {
        EXPECT_EQ(checkers::GridToNotation(r, c, 1), 33 - checkers::GridToNotation(r, c, 2));
      }
    }
  }
}

TEST(CoordinateMapperTest, CanonicalNumberingRunsRowMajor) {
  EXPECT_EQ(checkers::GridToNotation(0, 1, 2), 1);
  EXPECT_EQ(checkers::GridToNotation(0, 7, 2), 4);
  EXPECT_EQ(checkers::GridToNotation(1, 0, 2), 5);
  EXPECT_EQ(checkers::GridToNotation(2, 1, 2), 9);
  EXPECT_EQ(checkers::GridToNotation(7, 6, 2), 32);

  EXPECT_EQ(checkers::GridToNotation(0, 1, 1), 32);
  EXPECT_EQ(checkers::NotationToGrid(9, 1), (checkers::GridPosition{5, 6}));
}

TEST(CoordinateMapperTest, NotationCoversAllThirtyTwoSquaresOnce) {
  for (int player : {1, 2}) {
    std::vector<int> seen(checkers::kSquareCount + 1, 0);
    for (int r = 0; r < checkers::kBoardSize; ++r) {
      for (int c = 0; c < checkers::kBoardSize; ++c) {
        if (checkers::IsDarkSquare(r, c)) {
          ++seen[checkers::GridToNotation(r, c, player)];
        }
      }
    }
    for (int position = 1; position <= checkers::kSquareCount; ++position) {
      EXPECT_EQ(seen[position], 1) << "player " << player << " position " << position;
    }
  }
}

TEST(CoordinateMapperTest, UnassignedSlotUsesCanonicalFrame) {
  EXPECT_EQ(checkers::GridToNotation(2, 1, checkers::kUnassignedSlot), 9);
  EXPECT_EQ(checkers::NotationToGrid(9, checkers::kUnassignedSlot), (checkers::GridPosition{2, 1}));
  EXPECT_EQ(checkers::OpponentOf(1), 2);
  EXPECT_EQ(checkers::OpponentOf(2), 1);
  EXPECT_EQ(checkers::OpponentOf(checkers::kUnassignedSlot), checkers::kUnassignedSlot);
}

TEST(CoordinateMapperTest, DarkSquareAndBoundsHelpers) {
  EXPECT_TRUE(checkers::IsDarkSquare(0, 1));
  EXPECT_FALSE(checkers::IsDarkSquare(0, 0));
  EXPECT_FALSE(checkers::IsDarkSquare(-1, 0));
  EXPECT_FALSE(checkers::IsDarkSquare(7, 8));
  EXPECT_FALSE(checkers::IsValidNotation(0));
  EXPECT_FALSE(checkers::IsValidNotation(33));
}

}  // namespace
