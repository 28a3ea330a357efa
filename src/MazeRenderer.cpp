#include "MazeRenderer.hpp"
#include <glm/gtc/type_ptr.hpp>
#include <iostream>

// ---------- Scene shader GLSL ----------

static const char *kSceneVertSrc = R"(
#version 330 core
layout(location = 0) in vec3 aPos;
layout(location = 1) in vec3 aNormal;
layout(location = 2) in vec3 aColor;
uniform mat4 model;
uniform mat4 view;
uniform mat4 projection;
uniform bool useVertexColor;
uniform vec3 boxColor;
out vec3 vNormal;
out vec3 vColor;
out vec3 vWorldPos;
void main() {
  vec4 world = model * vec4(aPos, 1.0);
  vWorldPos = world.xyz;
  vNormal = mat3(model) * aNormal;
  vColor = useVertexColor ? aColor : boxColor;
  gl_Position = projection * view * world;
}
)";

static const char *kSceneFragSrc = R"(
#version 330 core
in vec3 vNormal;
in vec3 vColor;
in vec3 vWorldPos;
uniform vec3 lightDir;
uniform vec3 eyePos;
uniform vec3 fogColor;
uniform float fogEnd;
out vec4 FragColor;
void main() {
  float diffuse = max(dot(normalize(vNormal), -lightDir), 0.0);
  vec3 lit = vColor * (0.45 + 0.55 * diffuse);
  float fog = clamp(length(vWorldPos - eyePos) / fogEnd, 0.0, 1.0);
  FragColor = vec4(mix(lit, fogColor, fog * fog), 1.0);
}
)";

static const glm::vec3 FOG_COLOR(0.05f, 0.05f, 0.07f);

bool MazeRenderer::Init() {
  setupShader();
  if (!m_program)
    return false;
  setupCube();
  std::cout << "[Scene] Renderer initialized" << std::endl;
  return true;
}

void MazeRenderer::setupShader() {
  auto compileShader = [](GLenum type, const char *source) {
    GLuint shader = glCreateShader(type);
    glShaderSource(shader, 1, &source, nullptr);
    glCompileShader(shader);

    int success;
    char infoLog[512];
    glGetShaderiv(shader, GL_COMPILE_STATUS, &success);
    if (!success) {
      glGetShaderInfoLog(shader, 512, nullptr, infoLog);
      std::cerr << "[Scene] Shader compilation error: " << infoLog
                << std::endl;
    }
    return shader;
  };

  GLuint vertex = compileShader(GL_VERTEX_SHADER, kSceneVertSrc);
  GLuint fragment = compileShader(GL_FRAGMENT_SHADER, kSceneFragSrc);

  m_program = glCreateProgram();
  glAttachShader(m_program, vertex);
  glAttachShader(m_program, fragment);
  glLinkProgram(m_program);

  int success;
  char infoLog[512];
  glGetProgramiv(m_program, GL_LINK_STATUS, &success);
  if (!success) {
    glGetProgramInfoLog(m_program, 512, nullptr, infoLog);
    std::cerr << "[Scene] Shader linking error: " << infoLog << std::endl;
    glDeleteProgram(m_program);
    m_program = 0;
  }

  glDeleteShader(vertex);
  glDeleteShader(fragment);
}

// Six faces, two triangles each, outward normals. Vertex color is unused for
// the cube (boxColor uniform instead).
void MazeRenderer::appendBox(std::vector<Vertex> &out, glm::vec3 a,
                             glm::vec3 b, glm::vec3 color) {
  const glm::vec3 c[8] = {{a.x, a.y, a.z}, {b.x, a.y, a.z}, {b.x, b.y, a.z},
                          {a.x, b.y, a.z}, {a.x, a.y, b.z}, {b.x, a.y, b.z},
                          {b.x, b.y, b.z}, {a.x, b.y, b.z}};
  struct Face {
    int v[4];
    glm::vec3 n;
  };
  static const Face faces[6] = {
      {{0, 3, 2, 1}, {0.0f, 0.0f, -1.0f}}, // -Z (north)
      {{4, 5, 6, 7}, {0.0f, 0.0f, 1.0f}},  // +Z (south)
      {{0, 4, 7, 3}, {-1.0f, 0.0f, 0.0f}}, // -X (west)
      {{1, 2, 6, 5}, {1.0f, 0.0f, 0.0f}},  // +X (east)
      {{3, 7, 6, 2}, {0.0f, 1.0f, 0.0f}},  // top
      {{0, 1, 5, 4}, {0.0f, -1.0f, 0.0f}}, // bottom
  };
  for (const auto &f : faces) {
    out.push_back({c[f.v[0]], f.n, color});
    out.push_back({c[f.v[1]], f.n, color});
    out.push_back({c[f.v[2]], f.n, color});
    out.push_back({c[f.v[0]], f.n, color});
    out.push_back({c[f.v[2]], f.n, color});
    out.push_back({c[f.v[3]], f.n, color});
  }
}

static void uploadVertices(GLuint &vao, GLuint &vbo, const void *data,
                           size_t bytes, size_t stride) {
  if (!vao)
    glGenVertexArrays(1, &vao);
  if (!vbo)
    glGenBuffers(1, &vbo);

  glBindVertexArray(vao);
  glBindBuffer(GL_ARRAY_BUFFER, vbo);
  glBufferData(GL_ARRAY_BUFFER, bytes, data, GL_STATIC_DRAW);

  // position
  glVertexAttribPointer(0, 3, GL_FLOAT, GL_FALSE, stride, (void *)0);
  glEnableVertexAttribArray(0);
  // normal
  glVertexAttribPointer(1, 3, GL_FLOAT, GL_FALSE, stride,
                        (void *)(sizeof(float) * 3));
  glEnableVertexAttribArray(1);
  // color
  glVertexAttribPointer(2, 3, GL_FLOAT, GL_FALSE, stride,
                        (void *)(sizeof(float) * 6));
  glEnableVertexAttribArray(2);

  glBindVertexArray(0);
}

void MazeRenderer::setupCube() {
  // Unit cube: x,z in [-0.5,0.5], y in [0,1] so boxes stand on their y
  std::vector<Vertex> vertices;
  appendBox(vertices, glm::vec3(-0.5f, 0.0f, -0.5f),
            glm::vec3(0.5f, 1.0f, 0.5f), glm::vec3(1.0f));
  m_cubeVertexCount = (int)vertices.size();
  uploadVertices(m_cubeVAO, m_cubeVBO, vertices.data(),
                 vertices.size() * sizeof(Vertex), sizeof(Vertex));
}

void MazeRenderer::rebuildMazeMesh(const Maze &maze, const GameConfig &config) {
  const float cs = maze.CellSize();
  const float h = config.wallHeight;
  const float t = cs * 0.04f; // Half wall thickness
  const glm::vec3 wallColor(config.colorWall.r, config.colorWall.g,
                            config.colorWall.b);
  const glm::vec3 floorColor(config.colorFloor.r, config.colorFloor.g,
                             config.colorFloor.b);

  std::vector<Vertex> vertices;
  appendBox(vertices, glm::vec3(0.0f, -0.05f, 0.0f),
            glm::vec3(maze.WorldWidth(), 0.0f, maze.WorldDepth()), floorColor);

  // North and west faces of every cell, plus the south and east boundary
  for (const auto &cell : maze.Cells()) {
    float x0 = cell.pos.x * cs, x1 = x0 + cs;
    float z0 = cell.pos.y * cs, z1 = z0 + cs;
    if (cell.HasWall(Direction::NORTH))
      appendBox(vertices, glm::vec3(x0 - t, 0.0f, z0 - t),
                glm::vec3(x1 + t, h, z0 + t), wallColor);
    if (cell.HasWall(Direction::WEST))
      appendBox(vertices, glm::vec3(x0 - t, 0.0f, z0 - t),
                glm::vec3(x0 + t, h, z1 + t), wallColor);
    if (cell.pos.y == maze.Height() - 1 && cell.HasWall(Direction::SOUTH))
      appendBox(vertices, glm::vec3(x0 - t, 0.0f, z1 - t),
                glm::vec3(x1 + t, h, z1 + t), wallColor);
    if (cell.pos.x == maze.Width() - 1 && cell.HasWall(Direction::EAST))
      appendBox(vertices, glm::vec3(x1 - t, 0.0f, z0 - t),
                glm::vec3(x1 + t, h, z1 + t), wallColor);
  }

  m_mazeVertexCount = (int)vertices.size();
  uploadVertices(m_mazeVAO, m_mazeVBO, vertices.data(),
                 vertices.size() * sizeof(Vertex), sizeof(Vertex));

  m_mazeWalls.clear();
  for (const auto &cell : maze.Cells())
    m_mazeWalls.push_back(cell.walls);
  m_mazeWidth = maze.Width();
  m_mazeHeight = maze.Height();
  m_mazeCellSize = cs;
  m_mazeWallHeight = h;

  std::cout << "[Scene] Maze mesh rebuilt: " << maze.Width() << "x"
            << maze.Height() << ", " << m_mazeVertexCount / 36 << " boxes"
            << std::endl;
}

void MazeRenderer::BeginFrame(int framebufferWidth, int framebufferHeight) {
  m_fbWidth = framebufferWidth > 0 ? framebufferWidth : 1;
  m_fbHeight = framebufferHeight > 0 ? framebufferHeight : 1;
  glViewport(0, 0, m_fbWidth, m_fbHeight);
  glClearColor(FOG_COLOR.r, FOG_COLOR.g, FOG_COLOR.b, 1.0f);
  glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);
}

void MazeRenderer::SetCamera(float x, float y, float z, float yaw,
                             float pitch) {
  m_camera.SetPose(glm::vec3(x, y, z), yaw, pitch);
  m_view = m_camera.GetViewMatrix();
  m_projection =
      m_camera.GetProjectionMatrix((float)m_fbWidth, (float)m_fbHeight);
}

void MazeRenderer::applyFrameUniforms() {
  glUseProgram(m_program);
  glUniformMatrix4fv(glGetUniformLocation(m_program, "view"), 1, GL_FALSE,
                     glm::value_ptr(m_view));
  glUniformMatrix4fv(glGetUniformLocation(m_program, "projection"), 1,
                     GL_FALSE, glm::value_ptr(m_projection));
  glm::vec3 light = glm::normalize(glm::vec3(-0.4f, -1.0f, -0.3f));
  glUniform3fv(glGetUniformLocation(m_program, "lightDir"), 1,
               glm::value_ptr(light));
  glm::vec3 eye = m_camera.GetPosition();
  glUniform3fv(glGetUniformLocation(m_program, "eyePos"), 1,
               glm::value_ptr(eye));
  glUniform3fv(glGetUniformLocation(m_program, "fogColor"), 1,
               glm::value_ptr(FOG_COLOR));
  glUniform1f(glGetUniformLocation(m_program, "fogEnd"), 40.0f);
}

void MazeRenderer::DrawMaze(const Maze &maze, const GameConfig &config) {
  if (!m_program || maze.Empty())
    return;

  bool changed = maze.Width() != m_mazeWidth ||
                 maze.Height() != m_mazeHeight ||
                 maze.CellSize() != m_mazeCellSize ||
                 config.wallHeight != m_mazeWallHeight ||
                 m_mazeWalls.size() != maze.Cells().size();
  for (size_t i = 0; !changed && i < m_mazeWalls.size(); i++)
    changed = m_mazeWalls[i] != maze.Cells()[i].walls;
  if (changed)
    rebuildMazeMesh(maze, config);

  applyFrameUniforms();
  glm::mat4 model(1.0f);
  glUniformMatrix4fv(glGetUniformLocation(m_program, "model"), 1, GL_FALSE,
                     glm::value_ptr(model));
  glUniform1i(glGetUniformLocation(m_program, "useVertexColor"), 1);

  glBindVertexArray(m_mazeVAO);
  glDrawArrays(GL_TRIANGLES, 0, m_mazeVertexCount);
  glBindVertexArray(0);
}

void MazeRenderer::DrawBox(const SceneBox &box) {
  if (!m_program)
    return;

  applyFrameUniforms();
  glm::mat4 model = glm::translate(glm::mat4(1.0f),
                                   glm::vec3(box.x, box.y, box.z));
  model = glm::scale(model, glm::vec3(box.sizeX, box.sizeY, box.sizeZ));
  glUniformMatrix4fv(glGetUniformLocation(m_program, "model"), 1, GL_FALSE,
                     glm::value_ptr(model));
  glUniform1i(glGetUniformLocation(m_program, "useVertexColor"), 0);
  glUniform3f(glGetUniformLocation(m_program, "boxColor"), box.color.r,
              box.color.g, box.color.b);

  glBindVertexArray(m_cubeVAO);
  glDrawArrays(GL_TRIANGLES, 0, m_cubeVertexCount);
  glBindVertexArray(0);
}

void MazeRenderer::Cleanup() {
  if (m_cubeVAO)
    glDeleteVertexArrays(1, &m_cubeVAO);
  if (m_cubeVBO)
    glDeleteBuffers(1, &m_cubeVBO);
  if (m_mazeVAO)
    glDeleteVertexArrays(1, &m_mazeVAO);
  if (m_mazeVBO)
    glDeleteBuffers(1, &m_mazeVBO);
  if (m_program)
    glDeleteProgram(m_program);
  m_cubeVAO = m_cubeVBO = m_mazeVAO = m_mazeVBO = m_program = 0;
  m_mazeWalls.clear();
  m_mazeWidth = m_mazeHeight = 0;
}
