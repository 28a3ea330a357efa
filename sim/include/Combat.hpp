#ifndef CUBEMAZE_COMBAT_HPP
#define CUBEMAZE_COMBAT_HPP

#include "Entities.hpp"
#include "GameConfig.hpp"
#include "Maze.hpp"
#include <vector>

// Projectile flight, hit resolution, health and invulnerability.
namespace Combat {

enum class ProjectileOutcome : uint8_t {
  IN_FLIGHT,
  HIT_PLAYER,
  HIT_WALL,
  EXPIRED
};

// Per-tick summary of UpdateProjectiles
struct ProjectileReport {
  int hitPlayer = 0;     // Projectiles that reached the player
  int damageApplied = 0; // Of those, hits that actually cost health
  int hitWall = 0;
  int expired = 0;
};

// Count the invulnerability window down, clamping at 0
void TickInvulnerability(Player &player, float dt);

// Apply one hit. Ignored (returns false) while invulnerable; otherwise health
// drops by damage (never below 0) and the window restarts.
bool ApplyDamage(Player &player, int damage, float invulnerabilityTime);

// Move one projectile and classify what happened to it this tick. The
// player's body wins if the path reaches it before any closed wall; then
// walls, then lifetime.
ProjectileOutcome AdvanceProjectile(Projectile &proj, const Player &player,
                                    const Maze &maze, const GameConfig &config,
                                    float dt);

// Advance every projectile, resolve player hits and drop the dead ones
ProjectileReport UpdateProjectiles(std::vector<Projectile> &projectiles,
                                   Player &player, const Maze &maze,
                                   const GameConfig &config, float dt);

} // namespace Combat

#endif // CUBEMAZE_COMBAT_HPP
