#include "GameUI.hpp"
#include "imgui.h"
#include <cstdio>

static const ImGuiWindowFlags PANEL_FLAGS =
    ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove |
    ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_AlwaysAutoResize;

bool GameUI::beginCentered(const char *id, float width, float height) {
  ImGui::SetNextWindowPos(ImVec2(m_displayW * 0.5f, m_displayH * 0.5f),
                          ImGuiCond_Always, ImVec2(0.5f, 0.5f));
  ImGui::SetNextWindowSize(ImVec2(width, height), ImGuiCond_Always);
  return ImGui::Begin(id, nullptr, PANEL_FLAGS);
}

// Text centered on the current window
static void centeredText(const char *text, ImU32 color = IM_COL32_WHITE) {
  float w = ImGui::GetWindowSize().x;
  float tw = ImGui::CalcTextSize(text).x;
  ImGui::SetCursorPosX((w - tw) * 0.5f);
  ImGui::PushStyleColor(ImGuiCol_Text, color);
  ImGui::TextUnformatted(text);
  ImGui::PopStyleColor();
}

static bool centeredButton(const char *label, float width) {
  float w = ImGui::GetWindowSize().x;
  ImGui::SetCursorPosX((w - width) * 0.5f);
  return ImGui::Button(label, ImVec2(width, 0.0f));
}

void GameUI::ShowMenu(const std::string &title, const std::string &notice) {
  if (beginCentered("##menu", 360.0f, 0.0f)) {
    ImGui::SetWindowFontScale(2.0f);
    centeredText(title.c_str(), IM_COL32(255, 200, 80, 255));
    ImGui::SetWindowFontScale(1.0f);
    ImGui::Spacing();
    centeredText("Find the exit. Avoid the red cube.");
    ImGui::Spacing();

    if (!notice.empty()) {
      ImGui::PushStyleColor(ImGuiCol_Text, IM_COL32(255, 90, 90, 255));
      ImGui::TextWrapped("%s", notice.c_str());
      ImGui::PopStyleColor();
      ImGui::Spacing();
    }

    if (centeredButton("Start (Enter)", 200.0f))
      m_start = true;
    if (centeredButton("Quit (Esc)", 200.0f))
      m_exit = true;
  }
  ImGui::End();
}

void GameUI::ShowHud(int health, int maxHealth, bool invulnerable) {
  ImGui::SetNextWindowPos(ImVec2(16.0f, 16.0f), ImGuiCond_Always);
  ImGui::SetNextWindowBgAlpha(0.4f);
  if (ImGui::Begin("##hud", nullptr, PANEL_FLAGS)) {
    char label[32];
    snprintf(label, sizeof(label), "HP %d / %d", health, maxHealth);
    float frac = maxHealth > 0 ? (float)health / (float)maxHealth : 0.0f;
    ImU32 barColor =
        invulnerable ? IM_COL32(255, 255, 255, 255) : IM_COL32(200, 40, 40, 255);
    ImGui::PushStyleColor(ImGuiCol_PlotHistogram, barColor);
    ImGui::ProgressBar(frac, ImVec2(200.0f, 0.0f), label);
    ImGui::PopStyleColor();
  }
  ImGui::End();

  // Crosshair
  ImDrawList *dl = ImGui::GetForegroundDrawList();
  ImVec2 c(m_displayW * 0.5f, m_displayH * 0.5f);
  dl->AddLine(ImVec2(c.x - 6, c.y), ImVec2(c.x + 6, c.y),
              IM_COL32(255, 255, 255, 160));
  dl->AddLine(ImVec2(c.x, c.y - 6), ImVec2(c.x, c.y + 6),
              IM_COL32(255, 255, 255, 160));
}

void GameUI::ShowPaused() {
  if (beginCentered("##paused", 260.0f, 0.0f)) {
    centeredText("Paused");
    ImGui::Spacing();
    if (centeredButton("Resume (Esc)", 180.0f))
      m_resume = true;
    if (centeredButton("Quit to menu", 180.0f))
      m_quitToMenu = true;
  }
  ImGui::End();
}

void GameUI::ShowResult(bool won, float elapsed) {
  if (beginCentered("##result", 300.0f, 0.0f)) {
    ImGui::SetWindowFontScale(2.0f);
    if (won)
      centeredText("You escaped!", IM_COL32(120, 255, 120, 255));
    else
      centeredText("You died", IM_COL32(255, 80, 80, 255));
    ImGui::SetWindowFontScale(1.0f);

    char buf[64];
    snprintf(buf, sizeof(buf), "Time: %.1f s", elapsed);
    centeredText(buf);
    ImGui::Spacing();

    if (centeredButton("Play again (Enter)", 200.0f))
      m_start = true;
    if (centeredButton("Menu (Esc)", 200.0f))
      m_quitToMenu = true;
  }
  ImGui::End();
}
