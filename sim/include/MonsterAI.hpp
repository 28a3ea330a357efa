#ifndef CUBEMAZE_MONSTER_AI_HPP
#define CUBEMAZE_MONSTER_AI_HPP

#include "Entities.hpp"
#include "GameConfig.hpp"
#include "Maze.hpp"
#include "PathFinder.hpp"
#include <vector>

// One declared AI edge. Anything not listed in MonsterAI::Transitions() is
// rejected at runtime.
struct AITransition {
  Monster::AIState from;
  Monster::AIState to;
  const char *trigger;
};

// Monster behavior: PATROL -> CHASE -> WIND_UP -> COOLDOWN -> CHASE|PATROL.
// Holds references only; construct one per tick (or per session) and feed it
// monsters.
class MonsterAI {
public:
  MonsterAI(const GameConfig &config, const Maze &maze);

  // Reset a monster onto its spawn cell and build its patrol route
  void InitMonster(Monster &mon, uint16_t index, GridPoint spawn) const;

  // Advance one monster by dt. The only place that creates projectiles is the
  // WIND_UP -> COOLDOWN edge; nextProjectileIndex is bumped for each one.
  void Update(Monster &mon, const Player &player, float dt,
              std::vector<Projectile> &projectiles,
              uint16_t &nextProjectileIndex);

  // Within visionRange and no wall face between the two
  bool CanSee(const Monster &mon, const Player &player) const;
  static float DistanceTo(const Monster &mon, const Player &player);

  // Patrol position at patrol clock t (pure function of the route and t)
  void PatrolPoint(const Monster &mon, float t, float &x, float &z) const;

  // Corridor route from spawn to the farthest cell within maxSteps
  static std::vector<GridPoint> BuildPatrolRoute(const Maze &maze,
                                                 GridPoint spawn, int maxSteps);

  static const std::vector<AITransition> &Transitions();
  static bool IsTransitionAllowed(Monster::AIState from, Monster::AIState to);
  static const char *StateName(Monster::AIState state);

private:
  bool transition(Monster &mon, Monster::AIState to, const char *reason) const;

  void processPatrol(Monster &mon, const Player &player, float dt);
  void processChase(Monster &mon, const Player &player, float dt);
  void processWindUp(Monster &mon, const Player &player, float dt,
                     std::vector<Projectile> &projectiles,
                     uint16_t &nextProjectileIndex);
  void processCooldown(Monster &mon, const Player &player);

  // Walk toward (tx, tz) through open passages, stopping stopDistance short.
  // Returns true once there.
  bool walkTo(Monster &mon, float tx, float tz, float budget,
              float stopDistance);
  void clearPath(Monster &mon) const;
  static void faceToward(Monster &mon, float tx, float tz);

  const GameConfig &m_config;
  const Maze &m_maze;
  PathFinder m_pathFinder;
};

#endif // CUBEMAZE_MONSTER_AI_HPP
