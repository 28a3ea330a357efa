#ifndef CUBEMAZE_INPUT_HANDLER_HPP
#define CUBEMAZE_INPUT_HANDLER_HPP

#include "GameSession.hpp"

struct GLFWwindow;

// GLFW -> InputSnapshot. Key presses and mouse motion are collected by the
// callbacks between frames and drained once per frame by Poll().
namespace InputHandler {
void RegisterCallbacks(GLFWwindow *window);

// Lock the cursor for mouse look (PLAYING) or release it for the UI
void SetMouseLook(GLFWwindow *window, bool enabled);

// Build this frame's snapshot and reset the one-shot flags and deltas
InputSnapshot Poll(GLFWwindow *window);
} // namespace InputHandler

#endif // CUBEMAZE_INPUT_HANDLER_HPP
