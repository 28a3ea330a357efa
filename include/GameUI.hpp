#ifndef CUBEMAZE_GAME_UI_HPP
#define CUBEMAZE_GAME_UI_HPP

#include "Presentation.hpp"
#include <string>

// Dear ImGui screens. Must be driven between ImGui::NewFrame and
// ImGui::Render. Buttons only raise flags; main.cpp polls them.
class GameUI : public UISurface {
public:
  void SetDisplaySize(float width, float height) {
    m_displayW = width;
    m_displayH = height;
  }

  void ShowMenu(const std::string &title, const std::string &notice) override;
  void ShowHud(int health, int maxHealth, bool invulnerable) override;
  void ShowPaused() override;
  void ShowResult(bool won, float elapsed) override;

  // Button click flags (one-shot, polled by main.cpp)
  bool WantsStart() const { return m_start; }
  bool WantsResume() const { return m_resume; }
  bool WantsQuitToMenu() const { return m_quitToMenu; }
  bool WantsExit() const { return m_exit; }
  void ClearButtonFlags() {
    m_start = false;
    m_resume = false;
    m_quitToMenu = false;
    m_exit = false;
  }

private:
  // Centered, undecorated window of the given size
  bool beginCentered(const char *id, float width, float height);

  float m_displayW = 1280.0f;
  float m_displayH = 720.0f;

  bool m_start = false;
  bool m_resume = false;
  bool m_quitToMenu = false;
  bool m_exit = false;
};

#endif // CUBEMAZE_GAME_UI_HPP
