#ifndef CUBEMAZE_LINE_OF_SIGHT_HPP
#define CUBEMAZE_LINE_OF_SIGHT_HPP

#include "Maze.hpp"

namespace LineOfSight {

// Walk the cells crossed by the world-space segment A->B (grid DDA) and fail
// on the first closed wall face. Endpoints outside the maze are never visible.
// Where the segment passes exactly through a cell corner it is clear if
// either way around the corner is open.
bool IsClear(const Maze &maze, float ax, float az, float bx, float bz);

} // namespace LineOfSight

#endif // CUBEMAZE_LINE_OF_SIGHT_HPP
