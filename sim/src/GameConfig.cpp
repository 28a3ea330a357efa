#include "GameConfig.hpp"
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace {

struct FloatParam {
  const char *name;
  float GameConfig::*field;
  float minValue;    // Inclusive lower bound
  bool allowZero;    // If false, minValue is exclusive
  float maxValue;    // Inclusive upper bound
};

struct IntParam {
  const char *name;
  int GameConfig::*field;
  int minValue;
  int maxValue;
};

struct ColorParam {
  const char *name;
  Color3 GameConfig::*field;
};

static const FloatParam FLOAT_PARAMS[] = {
    {"cell_size", &GameConfig::cellSize, 0.0f, false, 100.0f},
    {"wall_height", &GameConfig::wallHeight, 0.0f, false, 100.0f},
    {"invulnerability_time", &GameConfig::invulnerabilityTime, 0.0f, true,
     3600.0f},
    {"player_speed", &GameConfig::playerSpeed, 0.0f, false, 1000.0f},
    {"player_radius", &GameConfig::playerRadius, 0.0f, false, 100.0f},
    {"player_height", &GameConfig::playerHeight, 0.0f, false, 100.0f},
    {"eye_height", &GameConfig::eyeHeight, 0.0f, false, 100.0f},
    {"jump_height", &GameConfig::jumpHeight, 0.0f, true, 100.0f},
    {"gravity", &GameConfig::gravity, 0.0f, false, 1000.0f},
    {"mouse_sensitivity", &GameConfig::mouseSensitivity, 0.0f, true, 100.0f},
    {"monster_speed", &GameConfig::monsterSpeed, 0.0f, false, 1000.0f},
    {"monster_radius", &GameConfig::monsterRadius, 0.0f, false, 100.0f},
    {"vision_range", &GameConfig::visionRange, 0.0f, false, 10000.0f},
    {"hysteresis_factor", &GameConfig::hysteresisFactor, 1.0f, true, 100.0f},
    {"disengage_grace", &GameConfig::disengageGrace, 0.0f, true, 3600.0f},
    {"attack_range", &GameConfig::attackRange, 0.0f, false, 10000.0f},
    {"wind_up_time", &GameConfig::windUpTime, 0.0f, true, 3600.0f},
    {"attack_cooldown", &GameConfig::attackCooldown, 0.0f, true, 3600.0f},
    {"patrol_speed", &GameConfig::patrolSpeed, 0.0f, false, 1000.0f},
    {"patrol_amplitude", &GameConfig::patrolAmplitude, 0.0f, true, 100.0f},
    {"patrol_frequency", &GameConfig::patrolFrequency, 0.0f, true, 1000.0f},
    {"projectile_speed", &GameConfig::projectileSpeed, 0.0f, false, 10000.0f},
    {"projectile_lifetime", &GameConfig::projectileLifetime, 0.0f, false,
     3600.0f},
    {"projectile_radius", &GameConfig::projectileRadius, 0.0f, false, 100.0f},
    {"projectile_height", &GameConfig::projectileHeight, 0.0f, true, 100.0f},
};

static const IntParam INT_PARAMS[] = {
    {"maze_width", &GameConfig::mazeWidth, 2, GameConfig::MAX_MAZE_DIMENSION},
    {"maze_height", &GameConfig::mazeHeight, 2,
     GameConfig::MAX_MAZE_DIMENSION},
    {"max_health", &GameConfig::maxHealth, 1, 1000},
    {"monster_count", &GameConfig::monsterCount, 0, GameConfig::MAX_MONSTERS},
    {"patrol_length", &GameConfig::patrolLength, 0, 1000},
    {"projectile_damage", &GameConfig::projectileDamage, 0, 1000},
};

static const ColorParam COLOR_PARAMS[] = {
    {"color_player", &GameConfig::colorPlayer},
    {"color_goal", &GameConfig::colorGoal},
    {"color_monster", &GameConfig::colorMonster},
    {"color_monster_wind_up", &GameConfig::colorMonsterWindUp},
    {"color_projectile", &GameConfig::colorProjectile},
    {"color_floor", &GameConfig::colorFloor},
    {"color_wall", &GameConfig::colorWall},
};

static void addError(std::vector<GameError> *errors, ErrorKind kind,
                     const std::string &message) {
  if (errors)
    errors->push_back({kind, message});
}

static void setError(GameError *error, ErrorKind kind,
                     const std::string &message) {
  if (error) {
    error->kind = kind;
    error->message = message;
  }
}

static bool parseFloat(const std::string &text, float &out) {
  if (text.empty())
    return false;
  char *end = nullptr;
  errno = 0;
  float v = std::strtof(text.c_str(), &end);
  if (errno != 0 || end == text.c_str() || *end != '\0')
    return false;
  out = v;
  return true;
}

static bool parseInt(const std::string &text, long &out) {
  if (text.empty())
    return false;
  char *end = nullptr;
  errno = 0;
  long v = std::strtol(text.c_str(), &end, 10);
  if (errno != 0 || end == text.c_str() || *end != '\0')
    return false;
  out = v;
  return true;
}

static bool parseColor(const std::string &text, Color3 &out) {
  float c[3];
  size_t start = 0;
  for (int i = 0; i < 3; i++) {
    size_t comma = text.find(',', start);
    if ((i < 2) != (comma != std::string::npos))
      return false;
    std::string part = text.substr(start, comma == std::string::npos
                                              ? std::string::npos
                                              : comma - start);
    if (!parseFloat(part, c[i]) || c[i] < 0.0f || c[i] > 1.0f)
      return false;
    start = comma + 1;
  }
  out = {c[0], c[1], c[2]};
  return true;
}

} // namespace

bool GameConfig::Validate(std::vector<GameError> *errors) const {
  bool ok = true;
  char buf[160];

  if (mazeWidth < 2 || mazeHeight < 2) {
    snprintf(buf, sizeof(buf), "maze %dx%d is below the 2x2 minimum",
             mazeWidth, mazeHeight);
    addError(errors, ErrorKind::INVALID_DIMENSIONS, buf);
    ok = false;
  }

  for (const auto &p : INT_PARAMS) {
    int v = this->*p.field;
    // Maze minimums are already reported as INVALID_DIMENSIONS
    if (v < p.minValue && p.field != &GameConfig::mazeWidth &&
        p.field != &GameConfig::mazeHeight) {
      snprintf(buf, sizeof(buf), "%s=%d is below %d", p.name, v, p.minValue);
      addError(errors, ErrorKind::CONFIGURATION_OUT_OF_RANGE, buf);
      ok = false;
    }
    if (v > p.maxValue) {
      snprintf(buf, sizeof(buf), "%s=%d exceeds %d", p.name, v, p.maxValue);
      addError(errors, ErrorKind::CONFIGURATION_OUT_OF_RANGE, buf);
      ok = false;
    }
  }

  for (const auto &p : FLOAT_PARAMS) {
    float v = this->*p.field;
    if (!std::isfinite(v)) {
      snprintf(buf, sizeof(buf), "%s is not a finite number", p.name);
      addError(errors, ErrorKind::CONFIGURATION_OUT_OF_RANGE, buf);
      ok = false;
      continue;
    }
    if (v > p.maxValue) {
      snprintf(buf, sizeof(buf), "%s=%g exceeds %g", p.name, v, p.maxValue);
      addError(errors, ErrorKind::CONFIGURATION_OUT_OF_RANGE, buf);
      ok = false;
    }
    bool bad = p.allowZero ? !(v >= p.minValue) : !(v > p.minValue);
    if (bad) {
      snprintf(buf, sizeof(buf), "%s=%.3f must be %s %.3f", p.name, v,
               p.allowZero ? ">=" : ">", p.minValue);
      addError(errors, ErrorKind::CONFIGURATION_OUT_OF_RANGE, buf);
      ok = false;
    }
  }

  // Cross-parameter constraints: bodies must fit inside a corridor
  if (cellSize > 0.0f) {
    if (playerRadius * 2.0f >= cellSize) {
      snprintf(buf, sizeof(buf),
               "player_radius=%.3f does not fit a %.3f corridor", playerRadius,
               cellSize);
      addError(errors, ErrorKind::CONFIGURATION_OUT_OF_RANGE, buf);
      ok = false;
    }
    if (monsterRadius * 2.0f >= cellSize) {
      snprintf(buf, sizeof(buf),
               "monster_radius=%.3f does not fit a %.3f corridor",
               monsterRadius, cellSize);
      addError(errors, ErrorKind::CONFIGURATION_OUT_OF_RANGE, buf);
      ok = false;
    }
  }
  if (eyeHeight > playerHeight) {
    snprintf(buf, sizeof(buf), "eye_height=%.3f is above player_height=%.3f",
             eyeHeight, playerHeight);
    addError(errors, ErrorKind::CONFIGURATION_OUT_OF_RANGE, buf);
    ok = false;
  }

  for (const auto &p : COLOR_PARAMS) {
    const Color3 &c = this->*p.field;
    if (c.r < 0.0f || c.r > 1.0f || c.g < 0.0f || c.g > 1.0f || c.b < 0.0f ||
        c.b > 1.0f) {
      snprintf(buf, sizeof(buf), "%s has a component outside [0,1]", p.name);
      addError(errors, ErrorKind::CONFIGURATION_OUT_OF_RANGE, buf);
      ok = false;
    }
  }
  return ok;
}

bool GameConfig::ApplyOverride(const std::string &name,
                               const std::string &value, GameError *error) {
  for (const auto &p : FLOAT_PARAMS) {
    if (name != p.name)
      continue;
    float v;
    if (!parseFloat(value, v)) {
      setError(error, ErrorKind::CONFIGURATION_OUT_OF_RANGE,
               name + ": '" + value + "' is not a number");
      return false;
    }
    this->*p.field = v;
    return true;
  }

  for (const auto &p : INT_PARAMS) {
    if (name != p.name)
      continue;
    long v;
    if (!parseInt(value, v) || v < -1000000 || v > 1000000) {
      setError(error, ErrorKind::CONFIGURATION_OUT_OF_RANGE,
               name + ": '" + value + "' is not an integer");
      return false;
    }
    this->*p.field = static_cast<int>(v);
    return true;
  }

  for (const auto &p : COLOR_PARAMS) {
    if (name != p.name)
      continue;
    if (!parseColor(value, this->*p.field)) {
      setError(error, ErrorKind::CONFIGURATION_OUT_OF_RANGE,
               name + ": '" + value + "' is not an r,g,b color in [0,1]");
      return false;
    }
    return true;
  }

  if (name == "seed") {
    long v;
    if (!parseInt(value, v) || v < 0 || v > 0xFFFFFFFFL) {
      setError(error, ErrorKind::CONFIGURATION_OUT_OF_RANGE,
               "seed: '" + value + "' is not an unsigned 32-bit integer");
      return false;
    }
    seed = static_cast<uint32_t>(v);
    return true;
  }

  if (name == "patrol_type") {
    if (value == "linear") {
      patrolType = PatrolType::LINEAR;
    } else if (value == "sine") {
      patrolType = PatrolType::SINE;
    } else {
      setError(error, ErrorKind::CONFIGURATION_OUT_OF_RANGE,
               "patrol_type: '" + value + "' (expected linear or sine)");
      return false;
    }
    return true;
  }

  setError(error, ErrorKind::CONFIGURATION_OUT_OF_RANGE,
           "unknown parameter '" + name + "'");
  return false;
}

bool GameConfig::ApplyArguments(int argc, char **argv, GameError *error) {
  for (int i = 1; i < argc; i++) {
    const char *arg = argv[i];
    if (std::strncmp(arg, "--", 2) != 0) {
      setError(error, ErrorKind::CONFIGURATION_OUT_OF_RANGE,
               std::string("unexpected argument '") + arg + "'");
      return false;
    }
    std::string kv(arg + 2);
    size_t eq = kv.find('=');
    if (eq == std::string::npos) {
      setError(error, ErrorKind::CONFIGURATION_OUT_OF_RANGE,
               std::string("expected --name=value, got '") + arg + "'");
      return false;
    }
    if (!ApplyOverride(kv.substr(0, eq), kv.substr(eq + 1), error))
      return false;
    printf("[Config] %s = %s\n", kv.substr(0, eq).c_str(),
           kv.substr(eq + 1).c_str());
  }
  return true;
}

std::vector<std::string> GameConfig::ParameterNames() {
  std::vector<std::string> names;
  for (const auto &p : INT_PARAMS)
    names.push_back(p.name);
  for (const auto &p : FLOAT_PARAMS)
    names.push_back(p.name);
  for (const auto &p : COLOR_PARAMS)
    names.push_back(p.name);
  names.push_back("seed");
  names.push_back("patrol_type");
  return names;
}
