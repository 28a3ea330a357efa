#include "Combat.hpp"
#include "LineOfSight.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace Combat {

void TickInvulnerability(Player &player, float dt) {
  if (player.invulnerabilityTimer <= 0.0f)
    return;
  player.invulnerabilityTimer -= dt;
  if (player.invulnerabilityTimer < 0.0f)
    player.invulnerabilityTimer = 0.0f;
}

bool ApplyDamage(Player &player, int damage, float invulnerabilityTime) {
  if (player.invulnerabilityTimer > 0.0f)
    return false;
  player.health = std::max(0, player.health - damage);
  player.invulnerabilityTimer = invulnerabilityTime;
  return true;
}

// First parameter t in [0,1] at which the segment (ax,az)->(bx,bz) comes
// within reach of (px,pz). False if it never does.
static bool segmentEntersCircle(float ax, float az, float bx, float bz,
                                float px, float pz, float reach, float &tOut) {
  float dx = bx - ax;
  float dz = bz - az;
  float fx = ax - px;
  float fz = az - pz;
  float c = fx * fx + fz * fz - reach * reach;
  if (c <= 0.0f) {
    tOut = 0.0f; // Already touching
    return true;
  }
  float a = dx * dx + dz * dz;
  if (a <= 0.0f)
    return false;
  float b = 2.0f * (fx * dx + fz * dz);
  float disc = b * b - 4.0f * a * c;
  if (disc < 0.0f)
    return false;
  float t = (-b - std::sqrt(disc)) / (2.0f * a);
  if (t < 0.0f || t > 1.0f)
    return false;
  tOut = t;
  return true;
}

ProjectileOutcome AdvanceProjectile(Projectile &proj, const Player &player,
                                    const Maze &maze, const GameConfig &config,
                                    float dt) {
  float fromX = proj.x, fromY = proj.y, fromZ = proj.z;
  proj.x += proj.vx * dt;
  proj.y += proj.vy * dt;
  proj.z += proj.vz * dt;

  // Swept test against the player's vertical cylinder. The contact only
  // counts if no wall lies between the start and the contact point, or
  // between the contact point and the player.
  float t;
  float reach = config.playerRadius + config.projectileRadius;
  if (segmentEntersCircle(fromX, fromZ, proj.x, proj.z, player.x, player.z,
                          reach, t)) {
    float hitX = fromX + (proj.x - fromX) * t;
    float hitY = fromY + (proj.y - fromY) * t;
    float hitZ = fromZ + (proj.z - fromZ) * t;
    if (hitY >= player.y - config.projectileRadius &&
        hitY <= player.y + config.playerHeight + config.projectileRadius &&
        LineOfSight::IsClear(maze, fromX, fromZ, hitX, hitZ) &&
        LineOfSight::IsClear(maze, hitX, hitZ, player.x, player.z))
      return ProjectileOutcome::HIT_PLAYER;
  }

  if (!LineOfSight::IsClear(maze, fromX, fromZ, proj.x, proj.z))
    return ProjectileOutcome::HIT_WALL;

  proj.ttl -= dt;
  if (proj.ttl <= 0.0f)
    return ProjectileOutcome::EXPIRED;
  return ProjectileOutcome::IN_FLIGHT;
}

ProjectileReport UpdateProjectiles(std::vector<Projectile> &projectiles,
                                   Player &player, const Maze &maze,
                                   const GameConfig &config, float dt) {
  ProjectileReport report;
  auto it = projectiles.begin();
  while (it != projectiles.end()) {
    ProjectileOutcome outcome =
        AdvanceProjectile(*it, player, maze, config, dt);
    switch (outcome) {
    case ProjectileOutcome::IN_FLIGHT:
      ++it;
      continue;
    case ProjectileOutcome::HIT_PLAYER:
      report.hitPlayer++;
      if (ApplyDamage(player, config.projectileDamage,
                      config.invulnerabilityTime)) {
        report.damageApplied++;
        printf("[Combat] Projectile %d hit player: health %d/%d\n", it->index,
               player.health, player.maxHealth);
      } else {
        printf("[Combat] Projectile %d hit player (invulnerable, %.2fs left)\n",
               it->index, player.invulnerabilityTimer);
      }
      break;
    case ProjectileOutcome::HIT_WALL:
      report.hitWall++;
      break;
    case ProjectileOutcome::EXPIRED:
      report.expired++;
      break;
    }
    it = projectiles.erase(it);
  }
  return report;
}

} // namespace Combat
