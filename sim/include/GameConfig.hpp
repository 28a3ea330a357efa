#ifndef CUBEMAZE_GAME_CONFIG_HPP
#define CUBEMAZE_GAME_CONFIG_HPP

#include "GameError.hpp"
#include <cstdint>
#include <string>
#include <vector>

struct Color3 {
  float r = 1.0f, g = 1.0f, b = 1.0f;
};

enum class PatrolType : uint8_t {
  LINEAR, // Back and forth along the patrol corridor
  SINE    // Same, plus a lateral sine sway inside the corridor
};

// All tunables for one session. Copied into GameSession at start and never
// mutated afterwards. World units: one maze cell = cellSize.
struct GameConfig {
  // ── Maze ──
  int mazeWidth = 10;
  int mazeHeight = 10;
  float cellSize = 2.0f;
  float wallHeight = 1.5f;
  uint32_t seed = 1;

  // ── Player ──
  int maxHealth = 3;
  float invulnerabilityTime = 1.0f; // Seconds after taking damage
  float playerSpeed = 4.0f;
  float playerRadius = 0.3f;
  float playerHeight = 1.0f; // Body height for projectile hits
  float eyeHeight = 0.8f;
  float jumpHeight = 0.9f;
  float gravity = 25.0f;
  float mouseSensitivity = 0.12f; // Degrees per pixel

  // ── Monster ──
  int monsterCount = 1;
  float monsterSpeed = 2.5f;
  float monsterRadius = 0.45f;
  float visionRange = 10.0f;
  float hysteresisFactor = 1.25f; // Disengage at visionRange * this
  float disengageGrace = 1.0f;    // Seconds beyond disengage range
  float attackRange = 6.0f;
  float windUpTime = 1.0f;
  float attackCooldown = 3.0f;

  // ── Patrol ──
  PatrolType patrolType = PatrolType::LINEAR;
  float patrolSpeed = 1.5f;
  int patrolLength = 4; // Max corridor steps from spawn
  float patrolAmplitude = 0.35f;
  float patrolFrequency = 1.0f; // Radians per second

  // ── Projectile ──
  int projectileDamage = 1;
  float projectileSpeed = 8.0f;
  float projectileLifetime = 2.0f;
  float projectileRadius = 0.15f;
  float projectileHeight = 0.5f;

  // ── Colors ──
  Color3 colorPlayer = {0.0f, 0.5f, 1.0f};
  Color3 colorGoal = {1.0f, 0.5f, 0.0f};
  Color3 colorMonster = {0.9f, 0.1f, 0.1f};
  Color3 colorMonsterWindUp = {1.0f, 0.9f, 0.1f};
  Color3 colorProjectile = {0.9f, 0.0f, 0.9f};
  Color3 colorFloor = {0.75f, 0.75f, 0.75f};
  Color3 colorWall = {0.3f, 0.3f, 0.32f};

  static constexpr int MAX_MAZE_DIMENSION = 100;
  static constexpr int MAX_MONSTERS = 16;

  // Collect every out-of-range parameter. Returns true when the config is
  // usable. errors may be null.
  bool Validate(std::vector<GameError> *errors = nullptr) const;

  // Set a parameter by its snake_case name ("max_health", "color_goal", ...).
  // Colors are "r,g,b" with components in [0,1]; patrol_type is
  // "linear" or "sine".
  bool ApplyOverride(const std::string &name, const std::string &value,
                     GameError *error = nullptr);

  // Parse "--name=value" arguments; stops at the first bad one.
  bool ApplyArguments(int argc, char **argv, GameError *error = nullptr);

  // Names accepted by ApplyOverride, in table order
  static std::vector<std::string> ParameterNames();
};

#endif // CUBEMAZE_GAME_CONFIG_HPP
