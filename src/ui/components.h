#pragma once

#include "imgui.h"
#include "theme.h"

// Draw a solid horizontal separator.
void draw_solid_separator(const ImVec2& start,
    float width,
    float thickness = 2.0f,
    ImU32 color = Theme::ToImU32(Theme::SEPARATOR_GRAY));

struct ScrollbarState {
  float scrollbar_size = 0.0f;
  ImVec2 window_pos = ImVec2(0.0f, 0.0f);
  ImVec2 window_size = ImVec2(0.0f, 0.0f);
  ImVec2 content_size = ImVec2(0.0f, 0.0f);  // Visible area without the scrollbar
  float scroll_y = 0.0f;
  float scroll_max_y = 0.0f;
  bool child_open = false;
  bool has_metrics = false;
};

ScrollbarState begin_scrollbar_child(const char* id,
    const ImVec2& size,
    float scrollbar_size = 14.0f,
    ImGuiWindowFlags flags = 0);
void end_scrollbar_child(ScrollbarState& state);

struct TextButtonParams {
  const char* id = "";
  const char* label = "";
  ImVec2 size = ImVec2(0.0f, 0.0f);  // Zero fits the label
  bool enabled = true;
  bool active = false;               // Draws in the accent color
  float corner_radius = 6.0f;
};

bool draw_text_button(const TextButtonParams& params);

// Round checkbox badge shown on grid cells in selection mode
void draw_selection_badge(ImDrawList* draw_list, const ImVec2& center, float radius, bool checked, float alpha = 1.0f);

// Pulsing rounded box used for loading skeletons; phase in seconds
void draw_skeleton_box(ImDrawList* draw_list, const ImVec2& min, const ImVec2& max, float rounding, double time);

// Centered text inside a rectangle
void draw_centered_text(ImDrawList* draw_list, const ImVec2& min, const ImVec2& max, const char* text, ImU32 color);
