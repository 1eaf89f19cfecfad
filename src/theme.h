#pragma once
#include "imgui.h"

namespace Theme {

  // ================================
  // CENTRALIZED COLOR CONSTANTS
  // ================================

  // Convert ImVec4 (0.0-1.0 range) to ImU32 (0-255 range) for immediate drawing
  inline ImU32 ToImU32(const ImVec4& color) {
    return IM_COL32((int) (color.x * 255), (int) (color.y * 255), (int) (color.z * 255), (int) (color.w * 255));
  }

  inline ImVec4 with_alpha(const ImVec4& color, float alpha) {
    return ImVec4(color.x, color.y, color.z, color.w * alpha);
  }

  // === TEXT COLORS ===
  constexpr ImVec4 TEXT_DARK = ImVec4(0.98f, 0.98f, 0.99f, 1.00f);          // Primary text (bright white)
  constexpr ImVec4 TEXT_LIGHTER = ImVec4(0.8f, 0.8f, 0.8f, 1.00f);
  constexpr ImVec4 TEXT_SECONDARY = ImVec4(0.63f, 0.68f, 0.75f, 1.00f);     // Disabled/secondary text
  constexpr ImVec4 TEXT_WARNING = ImVec4(0.98f, 0.65f, 0.32f, 1.00f);

  // === SURFACES ===
  constexpr ImVec4 BACKGROUND_MAIN = ImVec4(0.125f, 0.125f, 0.125f, 1.00f);     // #202020
  constexpr ImVec4 BACKGROUND_PANEL = ImVec4(0.212f, 0.239f, 0.290f, 1.00f);    // #363D4A
  constexpr ImVec4 FRAME_1 = ImVec4(0.212f, 0.239f, 0.290f, 0.95f);
  constexpr ImVec4 FRAME_2 = ImVec4(0.263f, 0.305f, 0.373f, 0.95f);
  constexpr ImVec4 FRAME_3 = ImVec4(0.318f, 0.365f, 0.443f, 1.00f);

  // === GRID CELLS ===
  constexpr ImVec4 PLACEHOLDER_FILL = ImVec4(0.176f, 0.184f, 0.200f, 1.00f);    // Unrevealed cell, same footprint
  constexpr ImVec4 SKELETON_FILL = ImVec4(0.200f, 0.212f, 0.235f, 1.00f);       // Loading skeleton base
  constexpr ImVec4 SKELETON_HIGHLIGHT = ImVec4(0.255f, 0.271f, 0.302f, 1.00f);  // Skeleton pulse peak
  constexpr ImVec4 IMAGE_HOVER_OVERLAY = ImVec4(0.212f, 0.239f, 0.290f, 0.40f);
  constexpr ImVec4 CAPTION_BACKGROUND = ImVec4(0.0f, 0.0f, 0.0f, 0.55f);
  constexpr ImVec4 BROKEN_IMAGE = ImVec4(0.55f, 0.30f, 0.30f, 1.00f);
  constexpr ImVec4 FOCUS_OUTLINE = ImVec4(0.85f, 0.87f, 0.92f, 0.90f);

  // === SELECTION ===
  constexpr ImVec4 ACCENT_BLUE_1 = ImVec4(0.345f, 0.392f, 0.467f, 1.00f);
  constexpr ImVec4 ACCENT_BLUE_2 = ImVec4(0.408f, 0.455f, 0.533f, 1.00f);
  constexpr ImVec4 ACCENT_BLUE_1_ALPHA_80 = ImVec4(0.345f, 0.392f, 0.467f, 0.80f);
  constexpr ImVec4 ACCENT_BLUE_1_ALPHA_95 = ImVec4(0.345f, 0.392f, 0.467f, 0.95f);
  constexpr ImVec4 ACCENT_BLUE_1_ALPHA_35 = ImVec4(0.345f, 0.392f, 0.467f, 0.35f);
  constexpr ImVec4 SELECTION_RING = ImVec4(0.231f, 0.510f, 0.965f, 1.00f);      // #3B82F6
  constexpr ImVec4 CHECKBOX_EMPTY = ImVec4(1.0f, 1.0f, 1.0f, 0.80f);

  // === BORDERS & SCROLLBAR ===
  constexpr ImVec4 BORDER_1 = ImVec4(0.247f, 0.278f, 0.329f, 1.00f);            // #3F4754
  constexpr ImVec4 COLOR_TRANSPARENT = ImVec4(0.00f, 0.00f, 0.00f, 0.00f);
  constexpr ImVec4 COLOR_SEMI_TRANSPARENT = ImVec4(0.145f, 0.169f, 0.204f, 0.35f);
  constexpr ImVec4 SCROLLBAR_GRAB = ImVec4(0.145f, 0.169f, 0.204f, 1.00f);
  constexpr ImVec4 SCROLLBAR_GRAB_HOVERED = ImVec4(0.212f, 0.239f, 0.290f, 1.00f);
  constexpr ImVec4 SEPARATOR_GRAY = ImVec4(0.2745f, 0.2745f, 0.2745f, 1.00f);   // #464646

  constexpr ImU32 COLOR_WHITE_U32 = IM_COL32(255, 255, 255, 255);

  inline void setup_photo_vault_theme() {
    ImGuiStyle& style = ImGui::GetStyle();
    ImVec4* colors = style.Colors;

    colors[ImGuiCol_Text] = TEXT_DARK;
    colors[ImGuiCol_TextDisabled] = TEXT_SECONDARY;

    colors[ImGuiCol_WindowBg] = BACKGROUND_MAIN;
    colors[ImGuiCol_ChildBg] = BACKGROUND_MAIN;
    colors[ImGuiCol_PopupBg] = BACKGROUND_PANEL;
    colors[ImGuiCol_FrameBg] = FRAME_1;
    colors[ImGuiCol_FrameBgHovered] = FRAME_2;
    colors[ImGuiCol_FrameBgActive] = FRAME_3;

    colors[ImGuiCol_Border] = BORDER_1;
    colors[ImGuiCol_BorderShadow] = COLOR_TRANSPARENT;
    colors[ImGuiCol_Separator] = BORDER_1;

    colors[ImGuiCol_ScrollbarBg] = BACKGROUND_MAIN;
    colors[ImGuiCol_ScrollbarGrab] = SCROLLBAR_GRAB;
    colors[ImGuiCol_ScrollbarGrabHovered] = SCROLLBAR_GRAB_HOVERED;
    colors[ImGuiCol_ScrollbarGrabActive] = ACCENT_BLUE_1;
    colors[ImGuiCol_CheckMark] = SELECTION_RING;
    colors[ImGuiCol_SliderGrab] = ACCENT_BLUE_1;
    colors[ImGuiCol_SliderGrabActive] = ACCENT_BLUE_2;
    colors[ImGuiCol_Button] = ACCENT_BLUE_1_ALPHA_80;
    colors[ImGuiCol_ButtonHovered] = ACCENT_BLUE_1_ALPHA_95;
    colors[ImGuiCol_ButtonActive] = ACCENT_BLUE_2;
    colors[ImGuiCol_Header] = FRAME_2;
    colors[ImGuiCol_HeaderHovered] = FRAME_3;
    colors[ImGuiCol_TextSelectedBg] = ACCENT_BLUE_1_ALPHA_35;

    style.WindowPadding = ImVec2(15, 15);
    style.WindowRounding = 0.0f;
    style.FramePadding = ImVec2(8, 6);
    style.FrameRounding = 6.0f;
    style.ItemSpacing = ImVec2(12, 8);
    style.ItemInnerSpacing = ImVec2(8, 6);
    style.ScrollbarSize = 14.0f;
    style.ScrollbarRounding = 8.0f;
    style.GrabRounding = 4.0f;
    style.ChildRounding = 6.0f;
    style.FrameBorderSize = 1.0f;
    style.WindowBorderSize = 0.0f;
  }

} // namespace Theme
