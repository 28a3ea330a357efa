#include "Game.hpp"
#include "GameSession.hpp"
#include "PathFinder.hpp"
#include <cmath>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {

class RecordingUI : public UISurface {
public:
  void ShowMenu(const std::string &title, const std::string &notice) override {
    menuShown++;
    lastTitle = title;
    lastNotice = notice;
  }
  void ShowHud(int health, int maxHealth, bool invulnerable) override {
    hudShown++;
    lastHealth = health;
    lastMaxHealth = maxHealth;
    lastInvulnerable = invulnerable;
  }
  void ShowPaused() override { pausedShown++; }
  void ShowResult(bool won, float elapsed) override {
    resultShown++;
    lastWon = won;
    lastElapsed = elapsed;
  }

  int menuShown = 0, hudShown = 0, pausedShown = 0, resultShown = 0;
  std::string lastTitle, lastNotice;
  int lastHealth = -1, lastMaxHealth = -1;
  bool lastInvulnerable = false;
  bool lastWon = false;
  float lastElapsed = 0.0f;
};

class RecordingScene : public SceneRenderer {
public:
  void SetCamera(float x, float y, float z, float yaw, float pitch) override {
    camX = x;
    camY = y;
    camZ = z;
    camYaw = yaw;
    camPitch = pitch;
  }
  void DrawMaze(const Maze &, const GameConfig &) override { mazeDraws++; }
  void DrawBox(const SceneBox &box) override { boxes.push_back(box); }

  float camX = 0, camY = 0, camZ = 0, camYaw = 0, camPitch = 0;
  int mazeDraws = 0;
  std::vector<SceneBox> boxes;
};

GameConfig SmallConfig() {
  GameConfig cfg;
  cfg.mazeWidth = 5;
  cfg.mazeHeight = 5;
  cfg.seed = 1;
  return cfg;
}

InputSnapshot Pressed(bool InputSnapshot::*flag) {
  InputSnapshot input;
  input.*flag = true;
  return input;
}

float WrapDegrees(float deg) {
  while (deg > 180.0f)
    deg -= 360.0f;
  while (deg <= -180.0f)
    deg += 360.0f;
  return deg;
}

} // namespace

TEST(GameSessionTest, CreatePlacesPlayerAndMonster) {
  GameSession s;
  GameError error;
  ASSERT_TRUE(CreateSession(SmallConfig(), 1u, s, &error));
  EXPECT_EQ(s.state, GameState::PLAYING);
  EXPECT_EQ(s.seed, 1u);

  EXPECT_FLOAT_EQ(s.player.x, 1.0f);
  EXPECT_FLOAT_EQ(s.player.z, 1.0f);
  EXPECT_FLOAT_EQ(s.player.yaw, 0.0f); // Entrance opens east
  EXPECT_EQ(s.player.health, 3);
  EXPECT_EQ(s.player.maxHealth, 3);

  ASSERT_EQ(s.monsters.size(), 1u);
  EXPECT_EQ(s.monsters[0].spawnCell, (GridPoint{3, 0}));
  EXPECT_EQ(s.maze.CellAtWorld(s.monsters[0].x, s.monsters[0].z),
            (GridPoint{3, 0}));
  EXPECT_EQ(s.monsters[0].aiState, Monster::AIState::PATROL);
  EXPECT_TRUE(s.projectiles.empty());
}

TEST(GameSessionTest, CreateRejectsBadConfig) {
  GameConfig cfg = SmallConfig();
  cfg.mazeHeight = 1;
  GameSession s;
  s.seed = 99;
  GameError error;
  EXPECT_FALSE(CreateSession(cfg, 1u, s, &error));
  EXPECT_EQ(error.kind, ErrorKind::INVALID_DIMENSIONS);
  EXPECT_EQ(s.seed, 99u);
  EXPECT_TRUE(s.maze.Empty());
}

TEST(GameSessionTest, ThreeSpacedHitsLoseTheGame) {
  GameConfig cfg = SmallConfig();
  cfg.monsterCount = 0;
  GameSession s;
  ASSERT_TRUE(CreateSession(cfg, 1u, s));

  InputSnapshot idle;
  for (int hit = 0; hit < 3; hit++) {
    Projectile p;
    p.index = static_cast<uint16_t>(100 + hit);
    p.x = s.player.x + 0.6f;
    p.y = 0.5f;
    p.z = s.player.z;
    p.vx = -8.0f;
    p.ttl = 2.0f;
    s.projectiles.push_back(p);

    Simulate(s, 0.1f, idle);
    EXPECT_EQ(s.player.health, 2 - hit);
    EXPECT_TRUE(s.projectiles.empty());

    if (hit < 2) {
      for (int i = 0; i < 12; i++)
        Simulate(s, 0.1f, idle);
      EXPECT_FALSE(s.player.IsInvulnerable());
      EXPECT_EQ(s.state, GameState::PLAYING);
    }
  }
  EXPECT_EQ(s.state, GameState::LOSE);

  float elapsed = s.elapsed;
  uint64_t tick = s.tick;
  Simulate(s, 0.1f, idle);
  EXPECT_FLOAT_EQ(s.elapsed, elapsed);
  EXPECT_EQ(s.tick, tick);
}

TEST(GameSessionTest, HitsDuringInvulnerabilityAreFree) {
  GameConfig cfg = SmallConfig();
  cfg.monsterCount = 0;
  GameSession s;
  ASSERT_TRUE(CreateSession(cfg, 1u, s));

  InputSnapshot idle;
  for (int hit = 0; hit < 3; hit++) {
    Projectile p;
    p.x = s.player.x + 0.6f;
    p.y = 0.5f;
    p.z = s.player.z;
    p.vx = -8.0f;
    p.ttl = 2.0f;
    s.projectiles.push_back(p);
    Simulate(s, 0.1f, idle);
  }
  EXPECT_EQ(s.player.health, 2);
  EXPECT_EQ(s.state, GameState::PLAYING);
}

TEST(GameSessionTest, ReachingTheGoalWinsAndFreezes) {
  GameConfig cfg = SmallConfig();
  cfg.monsterCount = 0;
  GameSession s;
  ASSERT_TRUE(CreateSession(cfg, 1u, s));

  s.maze.CellCenter(s.maze.Goal(), s.player.x, s.player.z);
  InputSnapshot idle;
  Simulate(s, 0.1f, idle);
  EXPECT_EQ(s.state, GameState::WIN);

  InputSnapshot walk;
  walk.moveForward = 1.0f;
  float x = s.player.x;
  float elapsed = s.elapsed;
  Simulate(s, 0.1f, walk);
  EXPECT_FLOAT_EQ(s.player.x, x);
  EXPECT_FLOAT_EQ(s.elapsed, elapsed);
}

TEST(GameSessionTest, StepLeavesItsInputUntouched) {
  GameSession s;
  ASSERT_TRUE(CreateSession(SmallConfig(), 1u, s));

  InputSnapshot walk;
  walk.moveForward = 1.0f;
  GameSession next = StepSession(s, 0.1f, walk);
  EXPECT_EQ(next.tick, 1u);
  EXPECT_EQ(s.tick, 0u);
  EXPECT_FLOAT_EQ(s.player.x, 1.0f);
  EXPECT_GT(next.player.x, 1.0f);
}

TEST(GameSessionTest, SameSeedSameInputsReplayIdentically) {
  GameConfig cfg = SmallConfig();
  cfg.mazeWidth = 8;
  cfg.mazeHeight = 8;
  cfg.monsterCount = 3;
  GameSession a, b;
  ASSERT_TRUE(CreateSession(cfg, 21u, a));
  ASSERT_TRUE(CreateSession(cfg, 21u, b));

  for (int i = 0; i < 120; i++) {
    InputSnapshot in;
    in.moveForward = (i % 40) < 25 ? 1.0f : 0.0f;
    in.lookDeltaX = (i % 40) == 30 ? 750.0f : 0.0f;
    a = StepSession(a, 1.0f / 60.0f, in);
    b = StepSession(b, 1.0f / 60.0f, in);
  }
  EXPECT_FLOAT_EQ(a.player.x, b.player.x);
  EXPECT_FLOAT_EQ(a.player.z, b.player.z);
  ASSERT_EQ(a.monsters.size(), b.monsters.size());
  for (size_t i = 0; i < a.monsters.size(); i++) {
    EXPECT_FLOAT_EQ(a.monsters[i].x, b.monsters[i].x);
    EXPECT_FLOAT_EQ(a.monsters[i].z, b.monsters[i].z);
    EXPECT_EQ(a.monsters[i].aiState, b.monsters[i].aiState);
  }
  EXPECT_EQ(a.projectiles.size(), b.projectiles.size());
}

TEST(GameTest, MenuStartPauseResumeQuit) {
  Game game(SmallConfig());
  EXPECT_TRUE(game.IsConfigValid());
  EXPECT_EQ(game.GetState(), GameState::MENU);
  EXPECT_EQ(game.GetSession(), nullptr);

  game.Tick(0.1f, Pressed(&InputSnapshot::startPressed));
  ASSERT_EQ(game.GetState(), GameState::PLAYING);
  EXPECT_EQ(game.GetSessionsStarted(), 1u);
  EXPECT_EQ(game.GetSession()->seed, 1u);

  InputSnapshot walk;
  walk.moveForward = 1.0f;
  game.Tick(0.1f, walk);
  EXPECT_NEAR(game.GetSession()->elapsed, 0.1f, 1e-5f);

  game.Tick(0.1f, Pressed(&InputSnapshot::escapePressed));
  ASSERT_EQ(game.GetState(), GameState::PAUSED);

  // Paused: nothing moves
  const GameSession *s = game.GetSession();
  float px = s->player.x;
  float mx = s->monsters[0].x;
  float mz = s->monsters[0].z;
  for (int i = 0; i < 10; i++)
    game.Tick(0.1f, walk);
  EXPECT_FLOAT_EQ(s->player.x, px);
  EXPECT_FLOAT_EQ(s->monsters[0].x, mx);
  EXPECT_FLOAT_EQ(s->monsters[0].z, mz);
  EXPECT_NEAR(s->elapsed, 0.1f, 1e-5f);

  game.Tick(0.1f, Pressed(&InputSnapshot::resumePressed));
  EXPECT_EQ(game.GetState(), GameState::PLAYING);
  game.Tick(0.1f, walk);
  EXPECT_NEAR(game.GetSession()->elapsed, 0.2f, 1e-5f);

  game.Tick(0.1f, Pressed(&InputSnapshot::escapePressed));
  game.Tick(0.1f, Pressed(&InputSnapshot::escapePressed));
  EXPECT_EQ(game.GetState(), GameState::PLAYING);

  game.Pause();
  game.Tick(0.1f, Pressed(&InputSnapshot::quitToMenuPressed));
  EXPECT_EQ(game.GetState(), GameState::MENU);
  EXPECT_EQ(game.GetSession(), nullptr);
  EXPECT_FALSE(game.WantsQuit());

  // Each new session gets its own seed
  EXPECT_TRUE(game.StartGame());
  EXPECT_EQ(game.GetSession()->seed, 2u);
  EXPECT_EQ(game.GetSessionsStarted(), 2u);
}

TEST(GameTest, IllegalRequestsAreIgnored) {
  Game game(SmallConfig());
  game.Pause();
  game.Resume();
  game.QuitToMenu();
  EXPECT_FALSE(game.Restart());
  EXPECT_EQ(game.GetState(), GameState::MENU);

  ASSERT_TRUE(game.StartGame());
  EXPECT_FALSE(game.StartGame());
  EXPECT_FALSE(game.Restart());
  game.QuitToMenu(); // Only from PAUSED, WIN or LOSE
  EXPECT_EQ(game.GetState(), GameState::PLAYING);
  EXPECT_EQ(game.GetSessionsStarted(), 1u);
}

TEST(GameTest, EscapeOnMenuRequestsQuit) {
  Game game(SmallConfig());
  game.Tick(0.1f, Pressed(&InputSnapshot::escapePressed));
  EXPECT_TRUE(game.WantsQuit());
  EXPECT_EQ(game.GetState(), GameState::MENU);
}

TEST(GameTest, InvalidConfigStaysOnMenu) {
  GameConfig cfg = SmallConfig();
  cfg.mazeWidth = 1;
  Game game(cfg);
  EXPECT_FALSE(game.IsConfigValid());
  EXPECT_EQ(game.GetMenuNotice().rfind("Invalid configuration", 0), 0u);

  game.Tick(0.1f, Pressed(&InputSnapshot::startPressed));
  EXPECT_EQ(game.GetState(), GameState::MENU);
  EXPECT_FALSE(game.StartGame());
  EXPECT_EQ(game.GetSessionsStarted(), 0u);

  RecordingUI ui;
  RecordingScene scene;
  game.Present(ui, scene);
  EXPECT_EQ(ui.menuShown, 1);
  EXPECT_EQ(ui.lastNotice, game.GetMenuNotice());
  EXPECT_EQ(scene.mazeDraws, 0);
}

TEST(GameTest, PresentPushesSceneAndHud) {
  Game game(SmallConfig());
  RecordingUI ui;
  RecordingScene scene;
  game.Present(ui, scene);
  EXPECT_EQ(ui.menuShown, 1);
  EXPECT_EQ(ui.lastTitle, "CubeMaze");
  EXPECT_TRUE(ui.lastNotice.empty());

  ASSERT_TRUE(game.StartGame());
  game.Present(ui, scene);
  const GameConfig &cfg = game.GetConfig();
  EXPECT_FLOAT_EQ(scene.camX, 1.0f);
  EXPECT_FLOAT_EQ(scene.camY, cfg.eyeHeight);
  EXPECT_FLOAT_EQ(scene.camZ, 1.0f);
  EXPECT_EQ(scene.mazeDraws, 1);
  // Goal tile, player footprint, one monster
  ASSERT_EQ(scene.boxes.size(), 3u);
  EXPECT_FLOAT_EQ(scene.boxes[0].color.r, cfg.colorGoal.r);
  EXPECT_FLOAT_EQ(scene.boxes[2].color.r, cfg.colorMonster.r);
  EXPECT_EQ(ui.hudShown, 1);
  EXPECT_EQ(ui.lastHealth, 3);
  EXPECT_EQ(ui.lastMaxHealth, 3);
  EXPECT_FALSE(ui.lastInvulnerable);

  game.Pause();
  game.Present(ui, scene);
  EXPECT_EQ(ui.pausedShown, 1);
  EXPECT_EQ(ui.hudShown, 2);
}

TEST(GameTest, WalkingTheSolutionWinsThenRestarts) {
  GameConfig cfg = SmallConfig();
  cfg.monsterCount = 0;
  Game game(cfg);
  ASSERT_TRUE(game.StartGame());

  const GameSession *s = game.GetSession();
  PathFinder finder;
  std::vector<GridPoint> path = finder.FindPath(s->maze, s->maze.Start(),
                                                s->maze.Goal());
  ASSERT_FALSE(path.empty());

  // Turn to face each next cell center and walk exactly one cell
  const float dt = 0.05f;
  const int ticksPerCell = (int)std::lround(
      cfg.cellSize / (cfg.playerSpeed * dt));
  for (const auto &cell : path) {
    if (game.GetState() != GameState::PLAYING)
      break;
    float tx, tz;
    s->maze.CellCenter(cell, tx, tz);
    float want = std::atan2(tz - s->player.z, tx - s->player.x) * 180.0f /
                 3.14159265f;
    InputSnapshot turn;
    turn.lookDeltaX = WrapDegrees(want - s->player.yaw) / cfg.mouseSensitivity;
    turn.moveForward = 1.0f;
    game.Tick(dt, turn);

    InputSnapshot walk;
    walk.moveForward = 1.0f;
    for (int i = 1; i < ticksPerCell && game.GetState() == GameState::PLAYING;
         i++)
      game.Tick(dt, walk);
  }
  ASSERT_EQ(game.GetState(), GameState::WIN);
  EXPECT_EQ(s->player.health, 3);

  RecordingUI ui;
  RecordingScene scene;
  game.Present(ui, scene);
  EXPECT_EQ(ui.resultShown, 1);
  EXPECT_TRUE(ui.lastWon);
  EXPECT_GT(ui.lastElapsed, 0.0f);

  game.Tick(dt, Pressed(&InputSnapshot::startPressed));
  EXPECT_EQ(game.GetState(), GameState::PLAYING);
  EXPECT_EQ(game.GetSessionsStarted(), 2u);
  EXPECT_EQ(game.GetSession()->elapsed, 0.0f);
}

TEST(GameTest, StateNames) {
  EXPECT_STREQ(GameStateName(GameState::MENU), "MENU");
  EXPECT_STREQ(GameStateName(GameState::PAUSED), "PAUSED");
  EXPECT_STREQ(GameStateName(GameState::LOSE), "LOSE");
}
