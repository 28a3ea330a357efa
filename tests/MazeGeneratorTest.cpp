#include "MazeGenerator.hpp"
#include "PathFinder.hpp"
#include "TestMazes.hpp"
#include <algorithm>
#include <gtest/gtest.h>

TEST(MazeGeneratorTest, ReferenceLayoutFiveBySeedOne) {
  Maze maze;
  ASSERT_TRUE(MazeGenerator::Generate(5, 5, 1u, maze));

  // Row-major wall masks (N=1, S=2, E=4, W=8)
  const uint8_t expected[25] = {11, 3,  5, 9,  5,  //
                                9,  3,  6, 12, 12, //
                                10, 3,  3, 6,  12, //
                                9,  3,  1, 7,  12, //
                                10, 7,  10, 3, 6};
  ASSERT_EQ(maze.CellCount(), 25);
  for (int i = 0; i < 25; i++)
    EXPECT_EQ(maze.Cells()[i].walls, expected[i]) << "cell " << i;

  EXPECT_EQ(maze.Start(), (GridPoint{0, 0}));
  EXPECT_EQ(maze.Goal(), (GridPoint{1, 4}));
  EXPECT_TRUE(maze.IsGoal({1, 4}));

  std::vector<int> dist = PathFinder::DistanceField(maze, maze.Start());
  EXPECT_EQ(dist[maze.IndexOf(maze.Goal())], 23);
}

TEST(MazeGeneratorTest, SpanningTreeForManySizesAndSeeds) {
  const int sizes[][2] = {{2, 2}, {2, 7}, {5, 5}, {9, 4}, {16, 16}, {31, 17}};
  for (const auto &s : sizes) {
    for (uint32_t seed = 0; seed < 12; seed++) {
      Maze maze;
      ASSERT_TRUE(MazeGenerator::Generate(s[0], s[1], seed, maze));
      EXPECT_EQ(maze.CountOpenPassages(), s[0] * s[1] - 1)
          << s[0] << "x" << s[1] << " seed " << seed;
      EXPECT_EQ(CountReachable(maze), s[0] * s[1])
          << s[0] << "x" << s[1] << " seed " << seed;
    }
  }
}

TEST(MazeGeneratorTest, WallsAgreeBetweenNeighbors) {
  Maze maze;
  ASSERT_TRUE(MazeGenerator::Generate(12, 9, 77u, maze));
  for (const auto &cell : maze.Cells()) {
    for (int d = 0; d < DIRECTION_COUNT; d++) {
      Direction dir = static_cast<Direction>(d);
      GridPoint n = Step(cell.pos, dir);
      if (!maze.InBounds(n)) {
        EXPECT_TRUE(cell.HasWall(dir)) << "outer boundary must stay closed";
        continue;
      }
      EXPECT_EQ(cell.HasWall(dir), maze.At(n).HasWall(Opposite(dir)));
    }
  }
}

TEST(MazeGeneratorTest, SameSeedSameLayout) {
  Maze a, b;
  ASSERT_TRUE(MazeGenerator::Generate(20, 14, 4242u, a));
  ASSERT_TRUE(MazeGenerator::Generate(20, 14, 4242u, b));
  ASSERT_EQ(a.CellCount(), b.CellCount());
  for (int i = 0; i < a.CellCount(); i++)
    EXPECT_EQ(a.Cells()[i].walls, b.Cells()[i].walls);
  EXPECT_EQ(a.Goal(), b.Goal());
}

TEST(MazeGeneratorTest, DifferentSeedsDiffer) {
  Maze a, b;
  ASSERT_TRUE(MazeGenerator::Generate(10, 10, 1u, a));
  ASSERT_TRUE(MazeGenerator::Generate(10, 10, 2u, b));
  bool differs = false;
  for (int i = 0; i < a.CellCount() && !differs; i++)
    differs = a.Cells()[i].walls != b.Cells()[i].walls;
  EXPECT_TRUE(differs);
}

TEST(MazeGeneratorTest, RejectsDimensionsBelowMinimum) {
  Maze maze = MakeCorridor(3);
  GameError error;
  EXPECT_FALSE(MazeGenerator::Generate(1, 5, 1u, maze, &error));
  EXPECT_EQ(error.kind, ErrorKind::INVALID_DIMENSIONS);
  EXPECT_FALSE(error.message.empty());
  // Output untouched
  EXPECT_EQ(maze.Width(), 3);
  EXPECT_EQ(maze.Height(), 1);

  EXPECT_FALSE(MazeGenerator::Generate(4, 0, 1u, maze));
  EXPECT_FALSE(MazeGenerator::Generate(-3, -3, 1u, maze));
  EXPECT_TRUE(MazeGenerator::Generate(2, 2, 1u, maze));
}

TEST(MazeGeneratorTest, GoalIsFarthestCell) {
  for (uint32_t seed = 10; seed < 20; seed++) {
    Maze maze;
    ASSERT_TRUE(MazeGenerator::Generate(11, 8, seed, maze));
    std::vector<int> dist = PathFinder::DistanceField(maze, maze.Start());
    int best = 0;
    for (int d : dist)
      best = std::max(best, d);
    EXPECT_EQ(dist[maze.IndexOf(maze.Goal())], best);

    int goalCount = 0;
    for (const auto &cell : maze.Cells())
      goalCount += cell.isGoal ? 1 : 0;
    EXPECT_EQ(goalCount, 1);
  }
}

TEST(MazeGeneratorTest, FarthestCellTieGoesToLowestIndex) {
  // From the middle of a 5-long corridor both ends are 2 steps away
  Maze maze = MakeCorridor(5);
  EXPECT_EQ(MazeGenerator::FindFarthestCell(maze, {2, 0}), (GridPoint{0, 0}));
  EXPECT_EQ(MazeGenerator::FindFarthestCell(maze, {0, 0}), (GridPoint{4, 0}));
}

TEST(MazeGeneratorTest, CellSizeOverloadKeepsLayout) {
  Maze unit, scaled;
  ASSERT_TRUE(MazeGenerator::Generate(6, 6, 9u, unit));
  ASSERT_TRUE(MazeGenerator::Generate(6, 6, 2.5f, 9u, scaled));
  EXPECT_FLOAT_EQ(scaled.CellSize(), 2.5f);
  EXPECT_FLOAT_EQ(scaled.WorldWidth(), 15.0f);
  for (int i = 0; i < unit.CellCount(); i++)
    EXPECT_EQ(unit.Cells()[i].walls, scaled.Cells()[i].walls);
}

TEST(MazeGeneratorTest, MonsterSpawnsAwayFromStartAndGoal) {
  Maze maze;
  ASSERT_TRUE(MazeGenerator::Generate(5, 5, 1u, maze));
  std::vector<GridPoint> spawns = MazeGenerator::PickMonsterSpawns(maze, 1, 1u);
  ASSERT_EQ(spawns.size(), 1u);
  EXPECT_EQ(spawns[0], (GridPoint{3, 0}));

  Maze big;
  ASSERT_TRUE(MazeGenerator::Generate(15, 15, 3u, big));
  std::vector<int> fromStart = PathFinder::DistanceField(big, big.Start());
  std::vector<int> fromGoal = PathFinder::DistanceField(big, big.Goal());
  int quarter = fromStart[big.IndexOf(big.Goal())] / 4;

  spawns = MazeGenerator::PickMonsterSpawns(big, 4, 3u);
  ASSERT_EQ(spawns.size(), 4u);
  for (size_t i = 1; i < spawns.size(); i++) {
    int idx = big.IndexOf(spawns[i]);
    bool farEnough = fromStart[idx] > quarter && fromGoal[idx] > quarter;
    EXPECT_TRUE(farEnough || spawns[i] == spawns[0]);
  }
  EXPECT_TRUE(MazeGenerator::PickMonsterSpawns(big, 0, 3u).empty());
}
