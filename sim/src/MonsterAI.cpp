#include "MonsterAI.hpp"
#include "LineOfSight.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>

static constexpr float PI = 3.14159265f;
static constexpr float ARRIVE_EPSILON = 1e-4f;

using AIState = Monster::AIState;

MonsterAI::MonsterAI(const GameConfig &config, const Maze &maze)
    : m_config(config), m_maze(maze) {}

// ── Transition table ────────────────────────────────────────────────────────

const std::vector<AITransition> &MonsterAI::Transitions() {
  static const std::vector<AITransition> table = {
      {AIState::PATROL, AIState::CHASE, "player within vision range and visible"},
      {AIState::CHASE, AIState::PATROL, "player beyond disengage range for grace"},
      {AIState::CHASE, AIState::WIND_UP, "player in attack range, visible, ready"},
      {AIState::WIND_UP, AIState::CHASE, "player left attack range"},
      {AIState::WIND_UP, AIState::COOLDOWN, "wind-up elapsed, projectile fired"},
      {AIState::COOLDOWN, AIState::CHASE, "cooldown elapsed, player visible"},
      {AIState::COOLDOWN, AIState::PATROL, "cooldown elapsed, player gone"},
  };
  return table;
}

bool MonsterAI::IsTransitionAllowed(AIState from, AIState to) {
  for (const auto &t : Transitions()) {
    if (t.from == from && t.to == to)
      return true;
  }
  return false;
}

const char *MonsterAI::StateName(AIState state) {
  switch (state) {
  case AIState::PATROL:
    return "PATROL";
  case AIState::CHASE:
    return "CHASE";
  case AIState::WIND_UP:
    return "WIND_UP";
  case AIState::COOLDOWN:
    return "COOLDOWN";
  default:
    return "UNKNOWN";
  }
}

bool MonsterAI::transition(Monster &mon, AIState to, const char *reason) const {
  if (!IsTransitionAllowed(mon.aiState, to)) {
    printf("[AI] Monster %d: rejected %s -> %s\n", mon.index,
           StateName(mon.aiState), StateName(to));
    return false;
  }
  printf("[AI] Monster %d: %s -> %s (%s)\n", mon.index, StateName(mon.aiState),
         StateName(to), reason);
  mon.aiState = to;
  return true;
}

// ── Setup and queries ───────────────────────────────────────────────────────

std::vector<GridPoint> MonsterAI::BuildPatrolRoute(const Maze &maze,
                                                   GridPoint spawn,
                                                   int maxSteps) {
  std::vector<GridPoint> route;
  if (!maze.InBounds(spawn))
    return route;
  route.push_back(spawn);
  if (maxSteps <= 0)
    return route;

  std::vector<int> dist = PathFinder::DistanceField(maze, spawn);
  int best = maze.IndexOf(spawn);
  for (int i = 0; i < (int)dist.size(); i++) {
    if (dist[i] > dist[best] && dist[i] <= maxSteps)
      best = i;
  }

  PathFinder finder;
  std::vector<GridPoint> path =
      finder.FindPath(maze, spawn, maze.PointOf(best));
  route.insert(route.end(), path.begin(), path.end());
  return route;
}

void MonsterAI::InitMonster(Monster &mon, uint16_t index,
                            GridPoint spawn) const {
  mon = Monster{};
  mon.index = index;
  mon.spawnCell = spawn;
  mon.patrolRoute = BuildPatrolRoute(m_maze, spawn, m_config.patrolLength);
  PatrolPoint(mon, 0.0f, mon.x, mon.z);
  if (mon.patrolRoute.size() > 1) {
    float nx, nz;
    m_maze.CellCenter(mon.patrolRoute[1], nx, nz);
    faceToward(mon, nx, nz);
  }
}

float MonsterAI::DistanceTo(const Monster &mon, const Player &player) {
  float dx = player.x - mon.x;
  float dz = player.z - mon.z;
  return std::sqrt(dx * dx + dz * dz);
}

bool MonsterAI::CanSee(const Monster &mon, const Player &player) const {
  if (DistanceTo(mon, player) > m_config.visionRange)
    return false;
  return LineOfSight::IsClear(m_maze, mon.x, mon.z, player.x, player.z);
}

void MonsterAI::PatrolPoint(const Monster &mon, float t, float &x,
                            float &z) const {
  const auto &route = mon.patrolRoute;
  if (route.empty()) {
    m_maze.CellCenter(mon.spawnCell, x, z);
    return;
  }
  if (route.size() == 1) {
    m_maze.CellCenter(route[0], x, z);
    return;
  }

  // Ping-pong along the polyline of cell centers
  const float cs = m_maze.CellSize();
  const int segments = (int)route.size() - 1;
  const float length = segments * cs;
  float s = std::fmod(m_config.patrolSpeed * t, 2.0f * length);
  if (s < 0.0f)
    s += 2.0f * length;
  if (s > length)
    s = 2.0f * length - s;

  int seg = std::min((int)(s / cs), segments - 1);
  float frac = (s - seg * cs) / cs;

  float ax, az, bx, bz;
  m_maze.CellCenter(route[seg], ax, az);
  m_maze.CellCenter(route[seg + 1], bx, bz);
  x = ax + (bx - ax) * frac;
  z = az + (bz - az) * frac;

  if (m_config.patrolType == PatrolType::SINE) {
    // Lateral sway, kept inside the corridor. It fades out at each cell
    // centre so the point stays continuous through corners and turnarounds.
    float maxAmp = std::max(0.0f, cs * 0.5f - m_config.monsterRadius);
    float amp = std::min(m_config.patrolAmplitude, maxAmp);
    float offset = amp * std::sin(m_config.patrolFrequency * t) *
                   std::sin(PI * frac);
    float dirX = (bx - ax) / cs;
    float dirZ = (bz - az) / cs;
    x += -dirZ * offset;
    z += dirX * offset;
  }
}

// ── Movement helpers ────────────────────────────────────────────────────────

void MonsterAI::faceToward(Monster &mon, float tx, float tz) {
  float dx = tx - mon.x;
  float dz = tz - mon.z;
  if (dx * dx + dz * dz > ARRIVE_EPSILON * ARRIVE_EPSILON)
    mon.yaw = std::atan2(dz, dx) * 180.0f / PI;
}

void MonsterAI::clearPath(Monster &mon) const {
  mon.currentPath.clear();
  mon.pathStep = 0;
  mon.pathTarget = {-1, -1};
}

bool MonsterAI::walkTo(Monster &mon, float tx, float tz, float budget,
                       float stopDistance) {
  GridPoint goalCell = m_maze.CellAtWorld(tx, tz);
  GridPoint curCell = m_maze.CellAtWorld(mon.x, mon.z);

  bool pathDone = mon.pathStep >= (int)mon.currentPath.size();
  if (goalCell != mon.pathTarget || (pathDone && curCell != goalCell)) {
    mon.currentPath = m_pathFinder.FindPath(m_maze, curCell, goalCell);
    mon.pathStep = 0;
    mon.pathTarget = goalCell;
    if (mon.currentPath.empty() && curCell != goalCell)
      return false; // Unreachable: hold position
  }

  while (budget > 0.0f) {
    bool finalLeg = mon.pathStep >= (int)mon.currentPath.size();
    float wx = tx, wz = tz;
    if (!finalLeg)
      m_maze.CellCenter(mon.currentPath[mon.pathStep], wx, wz);

    float dx = wx - mon.x;
    float dz = wz - mon.z;
    float dist = std::sqrt(dx * dx + dz * dz);
    float want = finalLeg ? dist - stopDistance : dist;
    if (want <= ARRIVE_EPSILON) {
      if (finalLeg)
        return true;
      mon.pathStep++;
      continue;
    }

    faceToward(mon, wx, wz);
    float move = std::min(budget, want);
    mon.x += dx / dist * move;
    mon.z += dz / dist * move;
    budget -= move;

    if (move >= want) {
      if (finalLeg)
        return true;
      mon.pathStep++;
    }
  }
  return false;
}

// ── State handlers ──────────────────────────────────────────────────────────

void MonsterAI::processPatrol(Monster &mon, const Player &player, float dt) {
  if (CanSee(mon, player)) {
    if (transition(mon, AIState::CHASE, "player spotted")) {
      mon.loseSightTimer = 0.0f;
      clearPath(mon);
    }
    return;
  }

  if (mon.returningToPatrol) {
    // Clock holds until the monster is back on its route
    float px, pz;
    PatrolPoint(mon, mon.patrolTime, px, pz);
    if (walkTo(mon, px, pz, m_config.monsterSpeed * dt, 0.0f)) {
      mon.returningToPatrol = false;
      clearPath(mon);
    }
    return;
  }

  mon.patrolTime += dt;
  float px, pz;
  PatrolPoint(mon, mon.patrolTime, px, pz);
  faceToward(mon, px, pz);
  mon.x = px;
  mon.z = pz;
}

void MonsterAI::processChase(Monster &mon, const Player &player, float dt) {
  float dist = DistanceTo(mon, player);

  if (dist > m_config.visionRange * m_config.hysteresisFactor) {
    mon.loseSightTimer += dt;
    if (mon.loseSightTimer >= m_config.disengageGrace) {
      if (transition(mon, AIState::PATROL, "lost the player")) {
        mon.loseSightTimer = 0.0f;
        mon.returningToPatrol = true;
        clearPath(mon);
      }
      return;
    }
  } else {
    mon.loseSightTimer = 0.0f;
  }

  if (dist <= m_config.attackRange && mon.attackCooldown <= 0.0f &&
      LineOfSight::IsClear(m_maze, mon.x, mon.z, player.x, player.z)) {
    if (transition(mon, AIState::WIND_UP, "player in range")) {
      mon.windUpTimer = m_config.windUpTime;
      faceToward(mon, player.x, player.z);
      clearPath(mon);
    }
    return;
  }

  walkTo(mon, player.x, player.z, m_config.monsterSpeed * dt,
         m_config.monsterRadius + m_config.playerRadius);
}

void MonsterAI::processWindUp(Monster &mon, const Player &player, float dt,
                              std::vector<Projectile> &projectiles,
                              uint16_t &nextProjectileIndex) {
  faceToward(mon, player.x, player.z);

  if (DistanceTo(mon, player) > m_config.attackRange) {
    if (transition(mon, AIState::CHASE, "player escaped wind-up"))
      mon.windUpTimer = 0.0f;
    return;
  }

  mon.windUpTimer -= dt;
  if (mon.windUpTimer > 0.0f)
    return;

  // Lock the aim on where the player stands right now
  mon.aimX = player.x;
  mon.aimZ = player.z;
  float dx = mon.aimX - mon.x;
  float dz = mon.aimZ - mon.z;
  float len = std::sqrt(dx * dx + dz * dz);
  if (len < ARRIVE_EPSILON) {
    dx = std::cos(mon.yaw * PI / 180.0f);
    dz = std::sin(mon.yaw * PI / 180.0f);
    len = 1.0f;
  }

  Projectile proj;
  proj.index = nextProjectileIndex++;
  proj.ownerIndex = mon.index;
  proj.x = mon.x;
  proj.y = m_config.projectileHeight;
  proj.z = mon.z;
  proj.vx = dx / len * m_config.projectileSpeed;
  proj.vy = 0.0f;
  proj.vz = dz / len * m_config.projectileSpeed;
  proj.ttl = m_config.projectileLifetime;
  projectiles.push_back(proj);

  printf("[AI] Monster %d fired projectile %d at (%.2f, %.2f)\n", mon.index,
         proj.index, mon.aimX, mon.aimZ);

  mon.windUpTimer = 0.0f;
  mon.attackCooldown = m_config.attackCooldown;
  transition(mon, AIState::COOLDOWN, "shot released");
}

void MonsterAI::processCooldown(Monster &mon, const Player &player) {
  faceToward(mon, player.x, player.z);
  if (mon.attackCooldown > 0.0f)
    return;

  if (CanSee(mon, player)) {
    transition(mon, AIState::CHASE, "cooldown over, player visible");
  } else if (transition(mon, AIState::PATROL, "cooldown over, player gone")) {
    mon.returningToPatrol = true;
    clearPath(mon);
  }
}

// ── Tick ────────────────────────────────────────────────────────────────────

void MonsterAI::Update(Monster &mon, const Player &player, float dt,
                       std::vector<Projectile> &projectiles,
                       uint16_t &nextProjectileIndex) {
  if (dt <= 0.0f)
    return;

  if (mon.attackCooldown > 0.0f) {
    mon.attackCooldown -= dt;
    if (mon.attackCooldown < 0.0f)
      mon.attackCooldown = 0.0f;
  }

  switch (mon.aiState) {
  case AIState::PATROL:
    processPatrol(mon, player, dt);
    break;
  case AIState::CHASE:
    processChase(mon, player, dt);
    break;
  case AIState::WIND_UP:
    processWindUp(mon, player, dt, projectiles, nextProjectileIndex);
    break;
  case AIState::COOLDOWN:
    processCooldown(mon, player);
    break;
  default:
    break;
  }
}
