#ifndef CUBEMAZE_PLAYER_CONTROLLER_HPP
#define CUBEMAZE_PLAYER_CONTROLLER_HPP

#include "Entities.hpp"
#include "GameConfig.hpp"
#include "Maze.hpp"

// First-person player movement against the maze walls
namespace PlayerController {

// Mouse look: deltas in pixels, sensitivity in degrees per pixel.
// Pitch is clamped to +-89; yaw wraps to [0, 360).
void ApplyLook(Player &player, float deltaX, float deltaY, float sensitivity);

// Walk (forward/right axes in [-1,1], yaw-relative), jump and fall.
// Horizontal motion slides along walls and is sub-stepped so it cannot
// tunnel through a wall face.
void ApplyMovement(Player &player, const Maze &maze, const GameConfig &config,
                   float forward, float right, bool jump, float dt);

// True if a circle of this radius at (x, z) touches no closed wall
bool CircleFits(const Maze &maze, float radius, float x, float z);

// Axis-separated move with wall sliding. Returns false if fully blocked.
bool MoveWithWalls(const Maze &maze, float radius, float &x, float &z,
                   float dx, float dz);

} // namespace PlayerController

#endif // CUBEMAZE_PLAYER_CONTROLLER_HPP
