#include "MazeGenerator.hpp"
#include "PathFinder.hpp"
#include <algorithm>
#include <cstdio>
#include <random>
#include <utility>

namespace MazeGenerator {

bool Generate(int width, int height, uint32_t seed, Maze &out,
              GameError *error) {
  return Generate(width, height, 1.0f, seed, out, error);
}

bool Generate(int width, int height, float cellSize, uint32_t seed, Maze &out,
              GameError *error) {
  if (width < MIN_DIMENSION || height < MIN_DIMENSION) {
    char buf[128];
    snprintf(buf, sizeof(buf), "maze %dx%d is below the %dx%d minimum", width,
             height, MIN_DIMENSION, MIN_DIMENSION);
    printf("[Maze] Generation rejected: %s\n", buf);
    if (error) {
      error->kind = ErrorKind::INVALID_DIMENSIONS;
      error->message = buf;
    }
    return false;
  }

  Maze maze(width, height, cellSize);
  std::mt19937 rng(seed);
  std::vector<bool> visited(maze.CellCount(), false);
  std::vector<GridPoint> stack;
  stack.reserve(maze.CellCount());

  GridPoint origin{0, 0};
  visited[maze.IndexOf(origin)] = true;
  stack.push_back(origin);

  Direction candidates[DIRECTION_COUNT];
  while (!stack.empty()) {
    GridPoint cur = stack.back();

    int count = 0;
    for (int d = 0; d < DIRECTION_COUNT; d++) {
      Direction dir = static_cast<Direction>(d);
      GridPoint n = Step(cur, dir);
      if (maze.InBounds(n) && !visited[maze.IndexOf(n)])
        candidates[count++] = dir;
    }

    if (count == 0) {
      stack.pop_back(); // Dead end: backtrack
      continue;
    }

    Direction dir = candidates[rng() % count];
    GridPoint next = Step(cur, dir);
    maze.Carve(cur, dir);
    visited[maze.IndexOf(next)] = true;
    stack.push_back(next);
  }

  maze.SetStart(origin);
  maze.SetGoal(FindFarthestCell(maze, origin));

  printf("[Maze] Generated %dx%d (seed %u): %d passages, goal (%d,%d)\n",
         width, height, seed, maze.CountOpenPassages(), maze.Goal().x,
         maze.Goal().y);
  out = std::move(maze);
  return true;
}

GridPoint FindFarthestCell(const Maze &maze, GridPoint from) {
  std::vector<int> dist = PathFinder::DistanceField(maze, from);
  int best = maze.InBounds(from) ? maze.IndexOf(from) : 0;
  for (int i = 0; i < (int)dist.size(); i++) {
    if (dist[i] > dist[best])
      best = i; // Strict: earlier index wins ties
  }
  return maze.PointOf(best);
}

std::vector<GridPoint> PickMonsterSpawns(const Maze &maze, int count,
                                         uint32_t seed) {
  std::vector<GridPoint> spawns;
  if (count <= 0 || maze.Empty())
    return spawns;

  std::vector<int> fromStart = PathFinder::DistanceField(maze, maze.Start());
  std::vector<int> fromGoal = PathFinder::DistanceField(maze, maze.Goal());

  int best = 0;
  int bestScore = -1;
  for (int i = 0; i < maze.CellCount(); i++) {
    int score = std::min(fromStart[i], fromGoal[i]);
    if (score > bestScore) {
      bestScore = score;
      best = i;
    }
  }
  spawns.push_back(maze.PointOf(best));

  int minDist = fromStart[maze.IndexOf(maze.Goal())] / 4;
  for (int m = 1; m < count; m++) {
    std::mt19937 rng(seed + static_cast<uint32_t>(m));
    GridPoint pick = spawns[0];
    for (int attempt = 0; attempt < 100; attempt++) {
      int idx = static_cast<int>(rng() % static_cast<uint32_t>(maze.CellCount()));
      if (fromStart[idx] > minDist && fromGoal[idx] > minDist) {
        pick = maze.PointOf(idx);
        break;
      }
    }
    spawns.push_back(pick);
  }
  return spawns;
}

} // namespace MazeGenerator
