#include "PlayerController.hpp"
#include <algorithm>
#include <cmath>

namespace PlayerController {

static constexpr float PI = 3.14159265f;
static constexpr int MAX_MOVE_STEPS = 256; // Sub-steps per tick at most

void ApplyLook(Player &player, float deltaX, float deltaY, float sensitivity) {
  player.yaw += deltaX * sensitivity;
  player.pitch -= deltaY * sensitivity; // Screen Y grows downward
  player.yaw = std::fmod(player.yaw, 360.0f);
  if (player.yaw < 0.0f)
    player.yaw += 360.0f;
  player.pitch = std::max(-89.0f, std::min(89.0f, player.pitch));
}

// Wall face from cell a toward d, seen from whichever side is inside the
// grid. Outside both: no wall there.
static bool faceClosed(const Maze &maze, GridPoint a, Direction d) {
  if (maze.InBounds(a))
    return maze.HasWall(a, d);
  GridPoint b = Step(a, d);
  if (maze.InBounds(b))
    return maze.HasWall(b, Opposite(d));
  return false;
}

// Grid vertex (i, j) sits at world (i*cs, j*cs). It is solid if any of the
// four wall segments meeting there is closed.
static bool vertexSolid(const Maze &maze, int i, int j) {
  return faceClosed(maze, {i, j}, Direction::NORTH) ||
         faceClosed(maze, {i - 1, j}, Direction::NORTH) ||
         faceClosed(maze, {i, j}, Direction::WEST) ||
         faceClosed(maze, {i, j - 1}, Direction::WEST);
}

bool CircleFits(const Maze &maze, float radius, float x, float z) {
  if (!maze.ContainsWorld(x, z))
    return false;
  const float cs = maze.CellSize();
  GridPoint c = maze.CellAtWorld(x, z);
  const float left = c.x * cs, right = (c.x + 1) * cs;
  const float top = c.y * cs, bottom = (c.y + 1) * cs;

  if (maze.HasWall(c, Direction::NORTH) && z - top < radius)
    return false;
  if (maze.HasWall(c, Direction::SOUTH) && bottom - z < radius)
    return false;
  if (maze.HasWall(c, Direction::WEST) && x - left < radius)
    return false;
  if (maze.HasWall(c, Direction::EAST) && right - x < radius)
    return false;

  // Wall ends poking into the corners of an otherwise open cell
  const float r2 = radius * radius;
  for (int cj = 0; cj < 2; cj++) {
    for (int ci = 0; ci < 2; ci++) {
      float vx = (c.x + ci) * cs;
      float vz = (c.y + cj) * cs;
      float dx = x - vx, dz = z - vz;
      if (dx * dx + dz * dz < r2 && vertexSolid(maze, c.x + ci, c.y + cj))
        return false;
    }
  }
  return true;
}

bool MoveWithWalls(const Maze &maze, float radius, float &x, float &z,
                   float dx, float dz) {
  bool moved = false;
  if (dx != 0.0f && CircleFits(maze, radius, x + dx, z)) {
    x += dx;
    moved = true;
  }
  if (dz != 0.0f && CircleFits(maze, radius, x, z + dz)) {
    z += dz;
    moved = true;
  }
  return moved;
}

void ApplyMovement(Player &player, const Maze &maze, const GameConfig &config,
                   float forward, float right, bool jump, float dt) {
  if (dt <= 0.0f)
    return;

  float len = std::sqrt(forward * forward + right * right);
  if (len > 1.0f) {
    forward /= len;
    right /= len;
  }

  float yawRad = player.yaw * PI / 180.0f;
  float fx = std::cos(yawRad), fz = std::sin(yawRad);
  float rx = -std::sin(yawRad), rz = std::cos(yawRad);
  float moveX = (fx * forward + rx * right) * config.playerSpeed * dt;
  float moveZ = (fz * forward + rz * right) * config.playerSpeed * dt;

  float dist = std::hypot(moveX, moveZ);
  if (std::isfinite(dist) && dist > 0.0f) {
    float maxStep = std::min(maze.CellSize() * 0.25f, config.playerRadius);
    float ratio = dist / maxStep;
    int steps = MAX_MOVE_STEPS;
    float sx, sz;
    if (ratio <= (float)MAX_MOVE_STEPS) {
      steps = std::max(1, (int)std::ceil(ratio));
      sx = moveX / steps;
      sz = moveZ / steps;
    } else {
      // Too far for one tick: walk the longest distance allowed
      sx = moveX / dist * maxStep;
      sz = moveZ / dist * maxStep;
    }
    for (int i = 0; i < steps; i++) {
      if (!MoveWithWalls(maze, config.playerRadius, player.x, player.z, sx, sz))
        break;
    }
  }

  // Jump and gravity
  if (jump && player.grounded) {
    player.velocityY = std::sqrt(2.0f * config.gravity * config.jumpHeight);
    player.grounded = false;
  }
  if (!player.grounded) {
    player.velocityY -= config.gravity * dt;
    player.y += player.velocityY * dt;
    if (player.y <= 0.0f) {
      player.y = 0.0f;
      player.velocityY = 0.0f;
      player.grounded = true;
    }
  }
}

} // namespace PlayerController
