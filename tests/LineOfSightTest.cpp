#include "LineOfSight.hpp"
#include "TestMazes.hpp"
#include <gtest/gtest.h>

TEST(LineOfSightTest, ClearDownAnOpenCorridor) {
  Maze maze = MakeCorridor(6); // cell size 2, 12 units long
  EXPECT_TRUE(LineOfSight::IsClear(maze, 1.0f, 1.0f, 11.0f, 1.0f));
  EXPECT_TRUE(LineOfSight::IsClear(maze, 11.0f, 0.2f, 0.5f, 1.8f));
}

TEST(LineOfSightTest, SameCellIsAlwaysClear) {
  Maze closed(2, 2, 2.0f);
  EXPECT_TRUE(LineOfSight::IsClear(closed, 0.2f, 0.2f, 1.8f, 1.7f));
}

TEST(LineOfSightTest, ClosedFaceBlocks) {
  Maze maze = MakeUTurn();
  // (0,0) and (0,1) touch, but the face between them is closed
  EXPECT_FALSE(LineOfSight::IsClear(maze, 1.0f, 1.0f, 1.0f, 3.0f));
  EXPECT_FALSE(LineOfSight::IsClear(maze, 1.0f, 3.0f, 1.0f, 1.0f));
  // Along the open top row
  EXPECT_TRUE(LineOfSight::IsClear(maze, 1.0f, 1.0f, 5.0f, 1.0f));
  // Down the open east column
  EXPECT_TRUE(LineOfSight::IsClear(maze, 5.0f, 1.0f, 5.0f, 3.0f));
}

TEST(LineOfSightTest, BlockedOutsideTheMaze) {
  Maze maze = MakeCorridor(3);
  EXPECT_FALSE(LineOfSight::IsClear(maze, 1.0f, 1.0f, -1.0f, 1.0f));
  EXPECT_FALSE(LineOfSight::IsClear(maze, 1.0f, 1.0f, 1.0f, 5.0f));
}

TEST(LineOfSightTest, ExactCornerNeedsOneOpenWayAround) {
  // Segment (1,1)->(3,3) passes exactly through the shared vertex (2,2)
  Maze open(2, 2, 2.0f);
  open.Carve({0, 0}, Direction::EAST);
  open.Carve({1, 0}, Direction::SOUTH);
  EXPECT_TRUE(LineOfSight::IsClear(open, 1.0f, 1.0f, 3.0f, 3.0f));

  Maze other(2, 2, 2.0f);
  other.Carve({0, 0}, Direction::SOUTH);
  other.Carve({0, 1}, Direction::EAST);
  EXPECT_TRUE(LineOfSight::IsClear(other, 1.0f, 1.0f, 3.0f, 3.0f));

  Maze blocked(2, 2, 2.0f);
  blocked.Carve({0, 0}, Direction::EAST);
  blocked.Carve({0, 1}, Direction::EAST);
  EXPECT_FALSE(LineOfSight::IsClear(blocked, 1.0f, 1.0f, 3.0f, 3.0f));
}

TEST(LineOfSightTest, DiagonalCrossesEachFaceItTouches) {
  Maze maze(2, 2, 2.0f);
  maze.Carve({0, 0}, Direction::EAST);
  // Stays in the top row: only the open east face is crossed
  EXPECT_TRUE(LineOfSight::IsClear(maze, 0.5f, 0.5f, 3.5f, 1.5f));
  // Crosses into (1,0), then out through its closed south face
  EXPECT_FALSE(LineOfSight::IsClear(maze, 0.5f, 1.2f, 3.5f, 2.6f));
}
