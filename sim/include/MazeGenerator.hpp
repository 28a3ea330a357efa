#ifndef CUBEMAZE_MAZE_GENERATOR_HPP
#define CUBEMAZE_MAZE_GENERATOR_HPP

#include "GameError.hpp"
#include "Maze.hpp"
#include <cstdint>
#include <vector>

// Perfect-maze generation (iterative recursive backtracker) and the spawn
// placement that depends on the finished layout.
namespace MazeGenerator {

static constexpr int MIN_DIMENSION = 2;

// Carve a spanning tree into a fresh width x height maze. Same seed and size
// always give the same layout. Start is (0,0); the goal is the farthest cell.
// On failure out is left untouched.
bool Generate(int width, int height, uint32_t seed, Maze &out,
              GameError *error = nullptr);
bool Generate(int width, int height, float cellSize, uint32_t seed, Maze &out,
              GameError *error = nullptr);

// Cell with the largest corridor distance from `from`; ties go to the lowest
// row-major index.
GridPoint FindFarthestCell(const Maze &maze, GridPoint from);

// Spawn cells for `count` monsters. Monster 0 sits as far as possible from
// both start and goal; the others are drawn from mt19937(seed + index).
std::vector<GridPoint> PickMonsterSpawns(const Maze &maze, int count,
                                         uint32_t seed);

} // namespace MazeGenerator

#endif // CUBEMAZE_MAZE_GENERATOR_HPP
