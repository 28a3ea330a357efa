#include "Game.hpp"
#include "GameConfig.hpp"
#include "GameUI.hpp"
#include "InputHandler.hpp"
#include "MazeRenderer.hpp"
#include "imgui.h"
#include "imgui_impl_glfw.h"
#include "imgui_impl_opengl3.h"
#include <GL/glew.h>
#include <GLFW/glfw3.h>
#include <algorithm>
#include <ctime>
#include <fstream>
#include <iostream>
#include <streambuf>

// Tee streambuf: writes to both a file and the original stream
class TeeStreambuf : public std::streambuf {
public:
  TeeStreambuf(std::streambuf *orig, std::streambuf *file)
      : original(orig), fileBuf(file) {}

protected:
  int overflow(int c) override {
    if (c == EOF)
      return !EOF;
    int r1 = original->sputc(c);
    int r2 = fileBuf->sputc(c);
    return (r1 == EOF || r2 == EOF) ? EOF : c;
  }
  int sync() override {
    original->pubsync();
    fileBuf->pubsync();
    return 0;
  }

private:
  std::streambuf *original;
  std::streambuf *fileBuf;
};

// Longest frame the simulation will accept in one tick
static constexpr float MAX_FRAME_DT = 0.1f;

static void GLAPIENTRY glDebugCallback(GLenum source, GLenum type, GLuint id,
                                       GLenum severity, GLsizei /*length*/,
                                       const GLchar *message,
                                       const void * /*userParam*/) {
  // Skip notifications (very noisy)
  if (severity == GL_DEBUG_SEVERITY_NOTIFICATION)
    return;
  const char *sevStr = "???";
  switch (severity) {
  case GL_DEBUG_SEVERITY_HIGH:
    sevStr = "HIGH";
    break;
  case GL_DEBUG_SEVERITY_MEDIUM:
    sevStr = "MED";
    break;
  case GL_DEBUG_SEVERITY_LOW:
    sevStr = "LOW";
    break;
  }
  const char *typeStr = "other";
  if (type == GL_DEBUG_TYPE_ERROR)
    typeStr = "ERROR";
  else if (type == GL_DEBUG_TYPE_PERFORMANCE)
    typeStr = "PERF";
  else if (type == GL_DEBUG_TYPE_DEPRECATED_BEHAVIOR)
    typeStr = "DEPRECATED";
  std::cerr << "[GL " << sevStr << "] " << typeStr << " #" << id
            << " (src 0x" << std::hex << source << std::dec << "): " << message
            << std::endl;
}

int main(int argc, char **argv) {
  // Open cubemaze.log: tee all cout/cerr to both console and file
  std::ofstream logFile("cubemaze.log", std::ios::trunc);
  TeeStreambuf *coutTee = nullptr, *cerrTee = nullptr;
  std::streambuf *origCout = nullptr, *origCerr = nullptr;
  if (logFile.is_open()) {
    std::time_t now = std::time(nullptr);
    logFile << "=== CubeMaze cubemaze.log === " << std::ctime(&now)
            << std::endl;
    logFile.flush();

    origCout = std::cout.rdbuf();
    origCerr = std::cerr.rdbuf();
    coutTee = new TeeStreambuf(origCout, logFile.rdbuf());
    cerrTee = new TeeStreambuf(origCerr, logFile.rdbuf());
    std::cout.rdbuf(coutTee);
    std::cerr.rdbuf(cerrTee);
  }

  struct StreamRedirector {
    std::streambuf *origCout, *origCerr;
    TeeStreambuf *coutTee, *cerrTee;
    StreamRedirector(std::streambuf *oc, std::streambuf *oce, TeeStreambuf *ct,
                     TeeStreambuf *cet)
        : origCout(oc), origCerr(oce), coutTee(ct), cerrTee(cet) {}
    ~StreamRedirector() {
      if (origCout)
        std::cout.rdbuf(origCout);
      if (origCerr)
        std::cerr.rdbuf(origCerr);
      delete coutTee;
      delete cerrTee;
    }
  } redirector(origCout, origCerr, coutTee, cerrTee);

  // Command-line overrides: --maze_width=15 --seed=7 ...
  GameConfig config;
  {
    GameError error;
    if (!config.ApplyArguments(argc, argv, &error)) {
      std::cerr << "[Config] " << error.message << std::endl;
      std::cerr << "[Config] Known parameters:";
      for (const auto &name : GameConfig::ParameterNames())
        std::cerr << " " << name;
      std::cerr << std::endl;
      return 1;
    }
  }

  if (!glfwInit()) {
    std::cerr << "Failed to initialize GLFW" << std::endl;
    return -1;
  }

  // GL 3.3 + GLSL 150
  const char *glsl_version = "#version 150";
  glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
  glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
  glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
  glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GL_TRUE);

  GLFWwindow *window = glfwCreateWindow(1280, 720, "CubeMaze", nullptr, nullptr);
  if (!window) {
    std::cerr << "Failed to create GLFW window" << std::endl;
    glfwTerminate();
    return -1;
  }
  glfwMakeContextCurrent(window);
  glfwSwapInterval(1); // Enable vsync

  glewExperimental = GL_TRUE;
  if (glewInit() != GLEW_OK) {
    std::cerr << "Failed to initialize GLEW" << std::endl;
    glfwDestroyWindow(window);
    glfwTerminate();
    return -1;
  }

  // Enable OpenGL debug output if available (ARB_debug_output)
  if (GLEW_ARB_debug_output) {
    glEnable(GL_DEBUG_OUTPUT_SYNCHRONOUS_ARB);
    glDebugMessageCallbackARB(glDebugCallback, nullptr);
    std::cout << "[GL] Debug output enabled" << std::endl;
  } else {
    std::cout << "[GL] Debug output not available" << std::endl;
  }
  std::cout << "[GL] Renderer: " << glGetString(GL_RENDERER) << std::endl;
  std::cout << "[GL] Version: " << glGetString(GL_VERSION) << std::endl;

  // Setup Dear ImGui context
  IMGUI_CHECKVERSION();
  ImGui::CreateContext();
  ImGuiIO &io = ImGui::GetIO();
  io.IniFilename = nullptr;
  ImGui::StyleColorsDark();

  // Setup Platform/Renderer backends
  ImGui_ImplGlfw_InitForOpenGL(window, false);
  // GLFW input callbacks registered by InputHandler (forwarded to ImGui)
  InputHandler::RegisterCallbacks(window);
  ImGui_ImplOpenGL3_Init(glsl_version);

  MazeRenderer renderer;
  if (!renderer.Init()) {
    std::cerr << "[Scene] Renderer initialization failed" << std::endl;
    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();
    glfwDestroyWindow(window);
    glfwTerminate();
    return -1;
  }

  GameUI ui;
  Game game(config);

  glEnable(GL_DEPTH_TEST);
  glDepthFunc(GL_LEQUAL);

  float lastFrame = (float)glfwGetTime();
  while (!glfwWindowShouldClose(window)) {
    float currentFrame = (float)glfwGetTime();
    float deltaTime = std::min(currentFrame - lastFrame, MAX_FRAME_DT);
    lastFrame = currentFrame;

    glfwPollEvents();

    // Keyboard/mouse plus last frame's UI buttons
    InputSnapshot input = InputHandler::Poll(window);
    input.startPressed |= ui.WantsStart();
    input.resumePressed |= ui.WantsResume();
    input.quitToMenuPressed |= ui.WantsQuitToMenu();
    if (ui.WantsExit())
      glfwSetWindowShouldClose(window, GLFW_TRUE);
    ui.ClearButtonFlags();

    game.Tick(deltaTime, input);
    if (game.WantsQuit())
      glfwSetWindowShouldClose(window, GLFW_TRUE);
    InputHandler::SetMouseLook(window, game.GetState() == GameState::PLAYING);

    int fbW, fbH;
    glfwGetFramebufferSize(window, &fbW, &fbH);
    renderer.BeginFrame(fbW, fbH);

    ImGui_ImplOpenGL3_NewFrame();
    ImGui_ImplGlfw_NewFrame();
    ImGui::NewFrame();
    ui.SetDisplaySize(io.DisplaySize.x, io.DisplaySize.y);

    game.Present(ui, renderer);

    ImGui::Render();
    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
    glfwSwapBuffers(window);
  }

  std::cout << "[Game] Shutting down after " << game.GetSessionsStarted()
            << " session(s)" << std::endl;

  renderer.Cleanup();
  ImGui_ImplOpenGL3_Shutdown();
  ImGui_ImplGlfw_Shutdown();
  ImGui::DestroyContext();
  glfwDestroyWindow(window);
  glfwTerminate();
  return 0;
}
