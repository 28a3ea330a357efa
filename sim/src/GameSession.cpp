#include "GameSession.hpp"
#include "Combat.hpp"
#include "MazeGenerator.hpp"
#include "MonsterAI.hpp"
#include "PlayerController.hpp"
#include <cstdio>
#include <utility>

const char *GameStateName(GameState state) {
  switch (state) {
  case GameState::MENU:
    return "MENU";
  case GameState::PLAYING:
    return "PLAYING";
  case GameState::PAUSED:
    return "PAUSED";
  case GameState::WIN:
    return "WIN";
  case GameState::LOSE:
    return "LOSE";
  }
  return "UNKNOWN";
}

bool CreateSession(const GameConfig &config, uint32_t seed, GameSession &out,
                   GameError *error) {
  std::vector<GameError> errors;
  if (!config.Validate(&errors)) {
    for (const auto &e : errors)
      printf("[Game] Config error (%s): %s\n", ErrorKindName(e.kind),
             e.message.c_str());
    if (error)
      *error = errors.front();
    return false;
  }

  GameSession session;
  session.config = config;
  session.seed = seed;
  if (!MazeGenerator::Generate(config.mazeWidth, config.mazeHeight,
                               config.cellSize, seed, session.maze, error))
    return false;

  Player &p = session.player;
  session.maze.CellCenter(session.maze.Start(), p.x, p.z);
  p.maxHealth = config.maxHealth;
  p.health = config.maxHealth;
  // Face the open passage out of the entrance cell
  for (int d = 0; d < DIRECTION_COUNT; d++) {
    Direction dir = static_cast<Direction>(d);
    if (session.maze.CanPass(session.maze.Start(), dir)) {
      static const float yawFor[DIRECTION_COUNT] = {270.0f, 90.0f, 0.0f,
                                                    180.0f};
      p.yaw = yawFor[d];
      break;
    }
  }

  MonsterAI ai(session.config, session.maze);
  std::vector<GridPoint> spawns =
      MazeGenerator::PickMonsterSpawns(session.maze, config.monsterCount, seed);
  session.monsters.resize(spawns.size());
  for (size_t i = 0; i < spawns.size(); i++) {
    ai.InitMonster(session.monsters[i], static_cast<uint16_t>(i), spawns[i]);
    printf("[Game] Monster %d spawned at (%d,%d), patrol %d cells\n", (int)i,
           spawns[i].x, spawns[i].y, (int)session.monsters[i].patrolRoute.size());
  }

  session.state = GameState::PLAYING;
  out = std::move(session);
  return true;
}

void Simulate(GameSession &session, float dt, const InputSnapshot &input) {
  if (session.state != GameState::PLAYING || dt <= 0.0f)
    return;

  const GameConfig &cfg = session.config;
  Player &player = session.player;

  PlayerController::ApplyLook(player, input.lookDeltaX, input.lookDeltaY,
                              cfg.mouseSensitivity);
  PlayerController::ApplyMovement(player, session.maze, cfg, input.moveForward,
                                  input.moveRight, input.jump, dt);
  Combat::TickInvulnerability(player, dt);

  MonsterAI ai(cfg, session.maze);
  for (auto &mon : session.monsters)
    ai.Update(mon, player, dt, session.projectiles,
              session.nextProjectileIndex);

  Combat::UpdateProjectiles(session.projectiles, player, session.maze, cfg, dt);

  session.elapsed += dt;
  session.tick++;

  if (player.IsDead()) {
    session.state = GameState::LOSE;
    printf("[Game] Player died after %.1fs\n", session.elapsed);
    return;
  }
  if (session.maze.IsGoal(session.maze.CellAtWorld(player.x, player.z))) {
    session.state = GameState::WIN;
    printf("[Game] Goal reached after %.1fs\n", session.elapsed);
  }
}

GameSession StepSession(GameSession session, float dt,
                        const InputSnapshot &input) {
  Simulate(session, dt, input);
  return session;
}
