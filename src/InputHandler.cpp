#include "InputHandler.hpp"
#include "imgui.h"
#include "imgui_impl_glfw.h"
#include <GLFW/glfw3.h>
#include <iostream>

// ── Pending events since the last Poll ──
static bool s_escapePressed = false;
static bool s_enterPressed = false;
static bool s_jumpPressed = false;
static double s_lookDeltaX = 0.0, s_lookDeltaY = 0.0;

// Mouse look state
static bool s_mouseLook = false;
static bool s_firstMouse = true; // Skip the jump when the cursor is captured
static double s_lastX = 0.0, s_lastY = 0.0;

// ── GLFW callbacks ──

static void mouse_callback(GLFWwindow *window, double xpos, double ypos) {
  ImGui_ImplGlfw_CursorPosCallback(window, xpos, ypos);
  if (!s_mouseLook)
    return;
  if (s_firstMouse) {
    s_lastX = xpos;
    s_lastY = ypos;
    s_firstMouse = false;
    return;
  }
  s_lookDeltaX += xpos - s_lastX;
  s_lookDeltaY += ypos - s_lastY;
  s_lastX = xpos;
  s_lastY = ypos;
}

static void mouse_button_callback(GLFWwindow *window, int button, int action,
                                  int mods) {
  ImGui_ImplGlfw_MouseButtonCallback(window, button, action, mods);
}

static void scroll_callback(GLFWwindow *window, double xoffset,
                            double yoffset) {
  ImGui_ImplGlfw_ScrollCallback(window, xoffset, yoffset);
}

static void key_callback(GLFWwindow *window, int key, int scancode, int action,
                         int mods) {
  ImGui_ImplGlfw_KeyCallback(window, key, scancode, action, mods);

  if (action == GLFW_PRESS) {
    if (key == GLFW_KEY_ESCAPE)
      s_escapePressed = true;
    if (key == GLFW_KEY_ENTER || key == GLFW_KEY_KP_ENTER)
      s_enterPressed = true;
    if (key == GLFW_KEY_SPACE)
      s_jumpPressed = true;
  }
}

static void char_callback(GLFWwindow *window, unsigned int c) {
  ImGui_ImplGlfw_CharCallback(window, c);
}

// ── Public API ──

void InputHandler::RegisterCallbacks(GLFWwindow *window) {
  glfwSetCursorPosCallback(window, mouse_callback);
  glfwSetScrollCallback(window, scroll_callback);
  glfwSetMouseButtonCallback(window, mouse_button_callback);
  glfwSetKeyCallback(window, key_callback);
  glfwSetCharCallback(window, char_callback);
}

void InputHandler::SetMouseLook(GLFWwindow *window, bool enabled) {
  if (enabled == s_mouseLook)
    return;
  s_mouseLook = enabled;
  s_firstMouse = true;
  s_lookDeltaX = s_lookDeltaY = 0.0;
  glfwSetInputMode(window, GLFW_CURSOR,
                   enabled ? GLFW_CURSOR_DISABLED : GLFW_CURSOR_NORMAL);
  if (enabled && glfwRawMouseMotionSupported())
    glfwSetInputMode(window, GLFW_RAW_MOUSE_MOTION, GLFW_TRUE);
  std::cout << "[Input] Mouse look " << (enabled ? "on" : "off") << std::endl;
}

InputSnapshot InputHandler::Poll(GLFWwindow *window) {
  InputSnapshot in;

  // Movement axes are held keys, read directly
  if (s_mouseLook) {
    if (glfwGetKey(window, GLFW_KEY_W) == GLFW_PRESS)
      in.moveForward += 1.0f;
    if (glfwGetKey(window, GLFW_KEY_S) == GLFW_PRESS)
      in.moveForward -= 1.0f;
    if (glfwGetKey(window, GLFW_KEY_D) == GLFW_PRESS)
      in.moveRight += 1.0f;
    if (glfwGetKey(window, GLFW_KEY_A) == GLFW_PRESS)
      in.moveRight -= 1.0f;
    in.lookDeltaX = (float)s_lookDeltaX;
    in.lookDeltaY = (float)s_lookDeltaY;
    in.jump = s_jumpPressed || glfwGetKey(window, GLFW_KEY_SPACE) == GLFW_PRESS;
  }

  in.escapePressed = s_escapePressed;
  // Enter starts from the menu and restarts from the end screens
  in.startPressed = s_enterPressed;

  s_escapePressed = false;
  s_enterPressed = false;
  s_jumpPressed = false;
  s_lookDeltaX = s_lookDeltaY = 0.0;
  return in;
}
