#ifndef CUBEMAZE_PRESENTATION_HPP
#define CUBEMAZE_PRESENTATION_HPP

#include "GameConfig.hpp"
#include "Maze.hpp"
#include <string>

// Axis-aligned colored box, centered on (x, z) and standing on y
struct SceneBox {
  float x = 0.0f, y = 0.0f, z = 0.0f;
  float sizeX = 1.0f, sizeY = 1.0f, sizeZ = 1.0f;
  Color3 color;
};

// Draw side. The core pushes a camera and boxes every frame and never reads
// anything back.
class SceneRenderer {
public:
  virtual ~SceneRenderer() = default;

  // Eye position in world units, yaw/pitch in degrees
  virtual void SetCamera(float x, float y, float z, float yaw,
                         float pitch) = 0;
  // Floor and walls. May cache geometry per maze.
  virtual void DrawMaze(const Maze &maze, const GameConfig &config) = 0;
  virtual void DrawBox(const SceneBox &box) = 0;
};

// Screen side: menu, HUD and end screens
class UISurface {
public:
  virtual ~UISurface() = default;

  virtual void ShowMenu(const std::string &title,
                        const std::string &notice) = 0;
  virtual void ShowHud(int health, int maxHealth, bool invulnerable) = 0;
  virtual void ShowPaused() = 0;
  virtual void ShowResult(bool won, float elapsed) = 0;
};

#endif // CUBEMAZE_PRESENTATION_HPP
