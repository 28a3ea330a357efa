#include "Game.hpp"
#include <cstdio>
#include <utility>

static const char *GAME_TITLE = "CubeMaze";

Game::Game(const GameConfig &config) : m_config(config) {
  std::vector<GameError> errors;
  m_configValid = m_config.Validate(&errors);
  if (!m_configValid) {
    for (const auto &e : errors)
      printf("[Game] Config error (%s): %s\n", ErrorKindName(e.kind),
             e.message.c_str());
    m_menuNotice = "Invalid configuration: " + errors.front().message;
  }
}

bool Game::beginSession() {
  if (!m_configValid) {
    printf("[Game] Start refused: %s\n", m_menuNotice.c_str());
    return false;
  }

  uint32_t seed = m_config.seed + m_sessionsStarted;
  auto session = std::make_unique<GameSession>();
  GameError error;
  if (!CreateSession(m_config, seed, *session, &error)) {
    m_menuNotice = std::string("Could not start: ") + error.message;
    m_session.reset();
    return false;
  }

  m_sessionsStarted++;
  m_session = std::move(session);
  m_menuNotice.clear();
  printf("[Game] Session %u started (seed %u, %dx%d)\n", m_sessionsStarted,
         seed, m_config.mazeWidth, m_config.mazeHeight);
  return true;
}

bool Game::StartGame() {
  if (GetState() != GameState::MENU)
    return false;
  return beginSession();
}

bool Game::Restart() {
  GameState state = GetState();
  if (state != GameState::WIN && state != GameState::LOSE)
    return false;
  return beginSession();
}

void Game::Pause() {
  if (GetState() != GameState::PLAYING)
    return;
  m_session->state = GameState::PAUSED;
  printf("[Game] Paused\n");
}

void Game::Resume() {
  if (GetState() != GameState::PAUSED)
    return;
  m_session->state = GameState::PLAYING;
  printf("[Game] Resumed\n");
}

void Game::QuitToMenu() {
  GameState state = GetState();
  if (state != GameState::PAUSED && state != GameState::WIN &&
      state != GameState::LOSE)
    return;
  m_session.reset();
  printf("[Game] Back to menu\n");
}

void Game::Tick(float dt, const InputSnapshot &input) {
  switch (GetState()) {
  case GameState::MENU:
    if (input.startPressed)
      StartGame();
    else if (input.escapePressed)
      m_wantsQuit = true;
    break;

  case GameState::PLAYING:
    if (input.escapePressed) {
      Pause();
      break;
    }
    Simulate(*m_session, dt, input);
    break;

  case GameState::PAUSED:
    if (input.quitToMenuPressed)
      QuitToMenu();
    else if (input.escapePressed || input.resumePressed)
      Resume();
    break;

  case GameState::WIN:
  case GameState::LOSE:
    if (input.startPressed)
      Restart();
    else if (input.quitToMenuPressed || input.escapePressed)
      QuitToMenu();
    break;
  }
}

void Game::Present(UISurface &ui, SceneRenderer &scene) const {
  GameState state = GetState();
  if (state == GameState::MENU) {
    ui.ShowMenu(GAME_TITLE, m_menuNotice);
    return;
  }

  // Frozen or live, the scene is always drawn
  const GameSession &s = *m_session;
  const GameConfig &cfg = s.config;
  const Player &p = s.player;
  const float cs = s.maze.CellSize();

  scene.SetCamera(p.x, p.y + cfg.eyeHeight, p.z, p.yaw, p.pitch);
  scene.DrawMaze(s.maze, cfg);

  SceneBox goal;
  s.maze.CellCenter(s.maze.Goal(), goal.x, goal.z);
  goal.y = 0.0f;
  goal.sizeX = goal.sizeZ = cs * 0.6f;
  goal.sizeY = 0.05f;
  goal.color = cfg.colorGoal;
  scene.DrawBox(goal);

  // Player footprint, visible when looking down
  SceneBox feet;
  feet.x = p.x;
  feet.z = p.z;
  feet.y = 0.0f;
  feet.sizeX = feet.sizeZ = cfg.playerRadius * 2.0f;
  feet.sizeY = 0.02f;
  feet.color = cfg.colorPlayer;
  scene.DrawBox(feet);

  for (const auto &mon : s.monsters) {
    SceneBox box;
    box.x = mon.x;
    box.y = mon.y;
    box.z = mon.z;
    box.sizeX = box.sizeZ = cfg.monsterRadius * 2.0f;
    box.sizeY = cfg.wallHeight * 0.8f;
    box.color = mon.aiState == Monster::AIState::WIND_UP ? cfg.colorMonsterWindUp
                                                         : cfg.colorMonster;
    scene.DrawBox(box);
  }

  for (const auto &proj : s.projectiles) {
    SceneBox box;
    box.x = proj.x;
    box.y = proj.y - cfg.projectileRadius;
    box.z = proj.z;
    box.sizeX = box.sizeY = box.sizeZ = cfg.projectileRadius * 2.0f;
    box.color = cfg.colorProjectile;
    scene.DrawBox(box);
  }

  switch (state) {
  case GameState::PLAYING:
    ui.ShowHud(p.health, p.maxHealth, p.IsInvulnerable());
    break;
  case GameState::PAUSED:
    ui.ShowHud(p.health, p.maxHealth, p.IsInvulnerable());
    ui.ShowPaused();
    break;
  case GameState::WIN:
    ui.ShowResult(true, s.elapsed);
    break;
  case GameState::LOSE:
    ui.ShowResult(false, s.elapsed);
    break;
  default:
    break;
  }
}
