#ifndef CUBEMAZE_MAZE_HPP
#define CUBEMAZE_MAZE_HPP

#include <cstdint>
#include <vector>

// Grid coordinate: x = column, y = row. Row 0 is the north edge.
struct GridPoint {
  int x = 0, y = 0;
  bool operator==(const GridPoint &o) const { return x == o.x && y == o.y; }
  bool operator!=(const GridPoint &o) const { return !(*this == o); }
};

// Directions: N, S, E, W. North is -Z in world space, east is +X.
enum class Direction : uint8_t { NORTH = 0, SOUTH = 1, EAST = 2, WEST = 3 };

static constexpr int DIRECTION_COUNT = 4;
static constexpr int DIR_DX[DIRECTION_COUNT] = {0, 0, 1, -1};
static constexpr int DIR_DY[DIRECTION_COUNT] = {-1, 1, 0, 0};

inline Direction Opposite(Direction d) {
  static const Direction opposite[DIRECTION_COUNT] = {
      Direction::SOUTH, Direction::NORTH, Direction::WEST, Direction::EAST};
  return opposite[static_cast<int>(d)];
}

inline GridPoint Step(GridPoint p, Direction d) {
  return {p.x + DIR_DX[static_cast<int>(d)], p.y + DIR_DY[static_cast<int>(d)]};
}

// Wall bitmask flags, one per cell face
static constexpr uint8_t WALL_NORTH = 0x01;
static constexpr uint8_t WALL_SOUTH = 0x02;
static constexpr uint8_t WALL_EAST = 0x04;
static constexpr uint8_t WALL_WEST = 0x08;
static constexpr uint8_t WALL_ALL = 0x0F;

inline uint8_t WallFlag(Direction d) {
  return static_cast<uint8_t>(1u << static_cast<int>(d));
}

struct Cell {
  GridPoint pos;
  uint8_t walls = WALL_ALL;
  bool isGoal = false;

  bool HasWall(Direction d) const { return (walls & WallFlag(d)) != 0; }
};

// Rectangular maze of cells. A fresh Maze has every wall present; only
// Carve() opens passages, and it always opens both faces of the shared wall.
class Maze {
public:
  Maze() = default;
  Maze(int width, int height, float cellSize = 1.0f);

  int Width() const { return m_width; }
  int Height() const { return m_height; }
  int CellCount() const { return m_width * m_height; }
  bool Empty() const { return m_cells.empty(); }

  bool InBounds(GridPoint p) const {
    return p.x >= 0 && p.y >= 0 && p.x < m_width && p.y < m_height;
  }
  int IndexOf(GridPoint p) const { return p.y * m_width + p.x; }
  GridPoint PointOf(int index) const {
    return {index % m_width, index / m_width};
  }

  const Cell &At(GridPoint p) const { return m_cells[IndexOf(p)]; }
  const std::vector<Cell> &Cells() const { return m_cells; }

  bool HasWall(GridPoint p, Direction d) const;
  // True if p is inside the maze and the face d of p is open
  bool CanPass(GridPoint p, Direction d) const;
  // Remove the wall between p and its neighbor in direction d (both faces)
  bool Carve(GridPoint p, Direction d);

  // Open wall pairs (each shared wall counted once)
  int CountOpenPassages() const;

  GridPoint Start() const { return m_start; }
  void SetStart(GridPoint p) { m_start = p; }
  GridPoint Goal() const { return m_goal; }
  void SetGoal(GridPoint p);
  bool IsGoal(GridPoint p) const { return InBounds(p) && At(p).isGoal; }

  // ── World mapping ──
  float CellSize() const { return m_cellSize; }
  float WorldWidth() const { return m_width * m_cellSize; }
  float WorldDepth() const { return m_height * m_cellSize; }
  // Cell containing a world point; out-of-maze points give an out-of-bounds
  // GridPoint (use InBounds to check)
  GridPoint CellAtWorld(float worldX, float worldZ) const;
  void CellCenter(GridPoint p, float &worldX, float &worldZ) const;
  bool ContainsWorld(float worldX, float worldZ) const;

private:
  int m_width = 0;
  int m_height = 0;
  float m_cellSize = 1.0f;
  std::vector<Cell> m_cells;
  GridPoint m_start;
  GridPoint m_goal;
};

#endif // CUBEMAZE_MAZE_HPP
