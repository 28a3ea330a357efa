#ifndef CUBEMAZE_GAME_SESSION_HPP
#define CUBEMAZE_GAME_SESSION_HPP

#include "Entities.hpp"
#include "GameConfig.hpp"
#include "GameError.hpp"
#include "Maze.hpp"
#include <cstdint>
#include <vector>

enum class GameState : uint8_t { MENU, PLAYING, PAUSED, WIN, LOSE };

const char *GameStateName(GameState state);

// One frame of player input. Axes are continuous; the *Pressed flags are
// edge-triggered ("just pressed this frame").
struct InputSnapshot {
  float moveForward = 0.0f; // W = +1, S = -1
  float moveRight = 0.0f;   // D = +1, A = -1
  float lookDeltaX = 0.0f;  // Mouse pixels since last frame
  float lookDeltaY = 0.0f;
  bool jump = false;

  bool escapePressed = false;
  bool startPressed = false;
  bool resumePressed = false;
  bool quitToMenuPressed = false;
};

// Everything one playthrough owns. Plain value: copyable for the step
// function and for tests.
struct GameSession {
  GameConfig config; // Immutable for the session
  uint32_t seed = 0;
  Maze maze;
  Player player;
  std::vector<Monster> monsters;
  std::vector<Projectile> projectiles;
  GameState state = GameState::PLAYING;
  float elapsed = 0.0f; // Simulated seconds while PLAYING
  uint64_t tick = 0;
  uint16_t nextProjectileIndex = 1;
};

// Generate the maze, place the player at the entrance and the monsters at
// their spawns. Fails on invalid configuration; out is untouched then.
bool CreateSession(const GameConfig &config, uint32_t seed, GameSession &out,
                   GameError *error = nullptr);

// Advance a PLAYING session by dt: player, invulnerability, monsters,
// projectiles, then Lose and Win checks. Any other state is left frozen.
void Simulate(GameSession &session, float dt, const InputSnapshot &input);

// Value form of Simulate
GameSession StepSession(GameSession session, float dt,
                        const InputSnapshot &input);

#endif // CUBEMAZE_GAME_SESSION_HPP
