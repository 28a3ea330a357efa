#ifndef CUBEMAZE_ENTITIES_HPP
#define CUBEMAZE_ENTITIES_HPP

#include "Maze.hpp"
#include <cstdint>
#include <vector>

// World space: X east, Z south, Y up. y fields are heights above the floor.

struct Player {
  float x = 0.0f, y = 0.0f, z = 0.0f; // Feet position
  float yaw = 0.0f;   // Degrees, 0 = +X (east), 90 = +Z (south)
  float pitch = 0.0f; // Degrees, clamped to +-89
  float velocityY = 0.0f;
  bool grounded = true;

  int health = 3;
  int maxHealth = 3;
  float invulnerabilityTimer = 0.0f; // > 0 while hits are ignored

  bool IsInvulnerable() const { return invulnerabilityTimer > 0.0f; }
  bool IsDead() const { return health <= 0; }
};

// Live monster state (owned by the session, driven by MonsterAI)
struct Monster {
  uint16_t index = 0;
  float x = 0.0f, y = 0.0f, z = 0.0f;
  float yaw = 0.0f;
  GridPoint spawnCell;

  enum class AIState : uint8_t {
    PATROL,   // Walking the patrol corridor
    CHASE,    // Following A* path toward the player
    WIND_UP,  // Holding still before a shot (visible tell)
    COOLDOWN  // Shot fired, waiting before the next decision
  };
  AIState aiState = AIState::PATROL;

  // Patrol: cell route from the spawn cell, ping-ponged by patrolTime
  std::vector<GridPoint> patrolRoute;
  float patrolTime = 0.0f;      // Advances only while on the route
  bool returningToPatrol = false; // Walking back after a chase

  float windUpTimer = 0.0f;    // Counts down during WIND_UP
  float attackCooldown = 0.0f; // Counts down always; 0 = may attack
  float loseSightTimer = 0.0f; // Time spent beyond the disengage range

  // A* path following (cell centers, consumed one step at a time)
  std::vector<GridPoint> currentPath;
  int pathStep = 0;
  GridPoint pathTarget{-1, -1}; // Cell the current path leads to

  // Aim point locked when the shot is released
  float aimX = 0.0f, aimZ = 0.0f;
};

struct Projectile {
  uint16_t index = 0;
  uint16_t ownerIndex = 0; // Monster that fired it
  float x = 0.0f, y = 0.0f, z = 0.0f;
  float vx = 0.0f, vy = 0.0f, vz = 0.0f;
  float ttl = 0.0f; // Seconds of flight left
};

#endif // CUBEMAZE_ENTITIES_HPP
