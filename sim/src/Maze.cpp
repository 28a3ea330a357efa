#include "Maze.hpp"
#include <cmath>

Maze::Maze(int width, int height, float cellSize)
    : m_width(width), m_height(height), m_cellSize(cellSize) {
  if (m_width < 0)
    m_width = 0;
  if (m_height < 0)
    m_height = 0;
  m_cells.resize(m_width * m_height);
  for (int y = 0; y < m_height; y++)
    for (int x = 0; x < m_width; x++)
      m_cells[y * m_width + x].pos = {x, y};
}

bool Maze::HasWall(GridPoint p, Direction d) const {
  if (!InBounds(p))
    return true;
  return At(p).HasWall(d);
}

bool Maze::CanPass(GridPoint p, Direction d) const {
  if (!InBounds(p) || !InBounds(::Step(p, d)))
    return false;
  return !At(p).HasWall(d);
}

bool Maze::Carve(GridPoint p, Direction d) {
  GridPoint n = ::Step(p, d);
  if (!InBounds(p) || !InBounds(n))
    return false; // Outer boundary walls are never carved
  m_cells[IndexOf(p)].walls &= static_cast<uint8_t>(~WallFlag(d));
  m_cells[IndexOf(n)].walls &= static_cast<uint8_t>(~WallFlag(Opposite(d)));
  return true;
}

int Maze::CountOpenPassages() const {
  // Count east and south faces only so each shared wall is seen once
  int open = 0;
  for (const auto &c : m_cells) {
    if (c.pos.x + 1 < m_width && !c.HasWall(Direction::EAST))
      open++;
    if (c.pos.y + 1 < m_height && !c.HasWall(Direction::SOUTH))
      open++;
  }
  return open;
}

void Maze::SetGoal(GridPoint p) {
  if (!InBounds(p))
    return;
  if (InBounds(m_goal))
    m_cells[IndexOf(m_goal)].isGoal = false;
  m_goal = p;
  m_cells[IndexOf(p)].isGoal = true;
}

GridPoint Maze::CellAtWorld(float worldX, float worldZ) const {
  return {static_cast<int>(std::floor(worldX / m_cellSize)),
          static_cast<int>(std::floor(worldZ / m_cellSize))};
}

void Maze::CellCenter(GridPoint p, float &worldX, float &worldZ) const {
  worldX = (p.x + 0.5f) * m_cellSize;
  worldZ = (p.y + 0.5f) * m_cellSize;
}

bool Maze::ContainsWorld(float worldX, float worldZ) const {
  return worldX >= 0.0f && worldZ >= 0.0f && worldX < WorldWidth() &&
         worldZ < WorldDepth();
}
