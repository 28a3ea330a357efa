#ifndef CUBEMAZE_PATH_FINDER_HPP
#define CUBEMAZE_PATH_FINDER_HPP

// A* path finder over the open passages of a Maze (4-connected, unit cost).
// Pure algorithm: no session or client dependencies.

#include "Maze.hpp"
#include <vector>

class PathFinder {
public:
  // Find a path from start to end through open walls.
  // searchLimit: max nodes expanded before giving up.
  // Returns: grid points from start (exclusive) to end (inclusive), or empty
  // if no path or start == end.
  std::vector<GridPoint> FindPath(const Maze &maze, GridPoint start,
                                  GridPoint end,
                                  int searchLimit = 1 << 16) const;

  // BFS step count from origin to every cell (row-major); -1 = unreachable
  static std::vector<int> DistanceField(const Maze &maze, GridPoint origin);

  // Manhattan distance: admissible heuristic on a 4-connected grid
  static int ManhattanDist(GridPoint a, GridPoint b);
};

#endif // CUBEMAZE_PATH_FINDER_HPP
