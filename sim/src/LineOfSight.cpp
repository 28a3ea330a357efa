#include "LineOfSight.hpp"
#include <cmath>
#include <limits>

namespace LineOfSight {

static constexpr double CORNER_EPSILON = 1e-9;

bool IsClear(const Maze &maze, float ax, float az, float bx, float bz) {
  if (maze.Empty() || !maze.ContainsWorld(ax, az) ||
      !maze.ContainsWorld(bx, bz))
    return false;

  const double cs = maze.CellSize();
  GridPoint cell = maze.CellAtWorld(ax, az);
  const GridPoint target = maze.CellAtWorld(bx, bz);

  const double dx = (double)bx - ax;
  const double dz = (double)bz - az;
  const double inf = std::numeric_limits<double>::infinity();

  // Parametric t (0..1 along the segment) of the next X / Z cell boundary
  int stepX = 0, stepZ = 0;
  double tMaxX = inf, tMaxZ = inf, tDeltaX = inf, tDeltaZ = inf;
  if (dx > 0.0) {
    stepX = 1;
    tMaxX = ((cell.x + 1) * cs - ax) / dx;
    tDeltaX = cs / dx;
  } else if (dx < 0.0) {
    stepX = -1;
    tMaxX = (cell.x * cs - ax) / dx;
    tDeltaX = -cs / dx;
  }
  if (dz > 0.0) {
    stepZ = 1;
    tMaxZ = ((cell.y + 1) * cs - az) / dz;
    tDeltaZ = cs / dz;
  } else if (dz < 0.0) {
    stepZ = -1;
    tMaxZ = (cell.y * cs - az) / dz;
    tDeltaZ = -cs / dz;
  }

  const Direction dirX = stepX > 0 ? Direction::EAST : Direction::WEST;
  const Direction dirZ = stepZ > 0 ? Direction::SOUTH : Direction::NORTH;

  // A segment inside the grid crosses at most width + height boundaries
  int guard = maze.Width() + maze.Height() + 2;
  while (cell != target && guard-- > 0) {
    if (std::fabs(tMaxX - tMaxZ) <= CORNER_EPSILON) {
      // Exactly through a corner: either way around will do
      bool viaX = maze.CanPass(cell, dirX) &&
                  maze.CanPass(Step(cell, dirX), dirZ);
      bool viaZ = maze.CanPass(cell, dirZ) &&
                  maze.CanPass(Step(cell, dirZ), dirX);
      if (!viaX && !viaZ)
        return false;
      cell = Step(Step(cell, dirX), dirZ);
      tMaxX += tDeltaX;
      tMaxZ += tDeltaZ;
    } else if (tMaxX < tMaxZ) {
      if (!maze.CanPass(cell, dirX))
        return false;
      cell = Step(cell, dirX);
      tMaxX += tDeltaX;
    } else {
      if (!maze.CanPass(cell, dirZ))
        return false;
      cell = Step(cell, dirZ);
      tMaxZ += tDeltaZ;
    }
  }
  return cell == target;
}

} // namespace LineOfSight
