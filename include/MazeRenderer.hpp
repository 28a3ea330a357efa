#ifndef CUBEMAZE_MAZE_RENDERER_HPP
#define CUBEMAZE_MAZE_RENDERER_HPP

#include "Camera.hpp"
#include "Presentation.hpp"
#include <GL/glew.h>
#include <glm/glm.hpp>
#include <cstdint>
#include <vector>

// OpenGL 3.3 implementation of SceneRenderer. The maze (floor + walls) is
// baked into one mesh per layout; every other box is the shared unit cube
// with its own model matrix and color.
class MazeRenderer : public SceneRenderer {
public:
  bool Init();
  void Cleanup();

  // Call once per frame before the session pushes anything
  void BeginFrame(int framebufferWidth, int framebufferHeight);

  void SetCamera(float x, float y, float z, float yaw, float pitch) override;
  void DrawMaze(const Maze &maze, const GameConfig &config) override;
  void DrawBox(const SceneBox &box) override;

private:
  struct Vertex {
    glm::vec3 pos;
    glm::vec3 normal;
    glm::vec3 color;
  };

  void setupShader();
  void setupCube();
  void rebuildMazeMesh(const Maze &maze, const GameConfig &config);
  static void appendBox(std::vector<Vertex> &out, glm::vec3 minCorner,
                        glm::vec3 maxCorner, glm::vec3 color);
  void applyFrameUniforms();

  Camera m_camera;
  glm::mat4 m_view{1.0f};
  glm::mat4 m_projection{1.0f};
  int m_fbWidth = 1, m_fbHeight = 1;

  GLuint m_program = 0;
  GLuint m_cubeVAO = 0, m_cubeVBO = 0;
  int m_cubeVertexCount = 0;

  GLuint m_mazeVAO = 0, m_mazeVBO = 0;
  int m_mazeVertexCount = 0;
  // Layout the mesh was built from; rebuilt when it changes
  std::vector<uint8_t> m_mazeWalls;
  int m_mazeWidth = 0, m_mazeHeight = 0;
  float m_mazeCellSize = 0.0f;
  float m_mazeWallHeight = 0.0f;
};

#endif // CUBEMAZE_MAZE_RENDERER_HPP
