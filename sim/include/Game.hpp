#ifndef CUBEMAZE_GAME_HPP
#define CUBEMAZE_GAME_HPP

#include "GameConfig.hpp"
#include "GameSession.hpp"
#include "Presentation.hpp"
#include <cstdint>
#include <memory>
#include <string>

// Top-level mode machine. MENU whenever there is no session; otherwise the
// session's own state (PLAYING, PAUSED, WIN, LOSE). Only PLAYING simulates.
class Game {
public:
  // Validates config once. An invalid config leaves the game stuck on the
  // menu with the first problem as the notice.
  explicit Game(const GameConfig &config);

  // Route this frame's input through the state machine, then simulate
  void Tick(float dt, const InputSnapshot &input);

  // Push the current frame to the collaborators
  void Present(UISurface &ui, SceneRenderer &scene) const;

  bool StartGame(); // MENU -> PLAYING (fresh session)
  bool Restart();   // WIN/LOSE -> PLAYING (fresh session)
  void Pause();
  void Resume();
  void QuitToMenu(); // Discards the session

  GameState GetState() const {
    return m_session ? m_session->state : GameState::MENU;
  }
  const GameSession *GetSession() const { return m_session.get(); }
  const GameConfig &GetConfig() const { return m_config; }
  bool IsConfigValid() const { return m_configValid; }
  const std::string &GetMenuNotice() const { return m_menuNotice; }
  uint32_t GetSessionsStarted() const { return m_sessionsStarted; }

  // Escape on the menu: the client should close
  bool WantsQuit() const { return m_wantsQuit; }

private:
  bool beginSession();

  GameConfig m_config;
  bool m_configValid = false;
  std::string m_menuNotice;
  std::unique_ptr<GameSession> m_session;
  uint32_t m_sessionsStarted = 0;
  bool m_wantsQuit = false;
};

#endif // CUBEMAZE_GAME_HPP
