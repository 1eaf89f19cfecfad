#include "ui/components.h"

#include <algorithm>
#include <cmath>

void draw_solid_separator(const ImVec2& start,
    float width,
    float thickness,
    ImU32 color) {
  if (width <= 0.0f || thickness <= 0.0f) {
    return;
  }

  ImDrawList* draw_list = ImGui::GetWindowDrawList();
  if (!draw_list) {
    return;
  }

  float end_x = start.x + std::max(0.0f, width);
  draw_list->AddRectFilled(ImVec2(start.x, start.y), ImVec2(end_x, start.y + thickness), color);
}

ScrollbarState begin_scrollbar_child(const char* id,
    const ImVec2& size,
    float scrollbar_size,
    ImGuiWindowFlags flags) {
  ScrollbarState state;
  state.scrollbar_size = scrollbar_size;
  state.child_open = true;

  ImGui::PushStyleVar(ImGuiStyleVar_ScrollbarSize, state.scrollbar_size);
  ImGui::BeginChild(id, size, false, flags | ImGuiWindowFlags_AlwaysVerticalScrollbar);

  state.window_pos = ImGui::GetWindowPos();
  state.window_size = ImGui::GetWindowSize();
  state.content_size = ImGui::GetContentRegionAvail();
  state.scroll_y = ImGui::GetScrollY();
  state.scroll_max_y = ImGui::GetScrollMaxY();
  return state;
}

void end_scrollbar_child(ScrollbarState& state) {
  if (!state.child_open) {
    return;
  }
  state.window_pos = ImGui::GetWindowPos();
  state.window_size = ImGui::GetWindowSize();
  state.scroll_max_y = ImGui::GetScrollMaxY();
  state.scroll_y = ImGui::GetScrollY();
  state.has_metrics = true;

  ImGui::EndChild();
  ImGui::PopStyleVar();
  state.child_open = false;
}

bool draw_text_button(const TextButtonParams& params) {
  if (params.id == nullptr || params.label == nullptr) {
    return false;
  }

  ImGui::PushID(params.id);
  ImGui::PushStyleVar(ImGuiStyleVar_FrameRounding, params.corner_radius);
  if (params.active) {
    ImGui::PushStyleColor(ImGuiCol_Button, Theme::SELECTION_RING);
    ImGui::PushStyleColor(ImGuiCol_ButtonHovered, Theme::with_alpha(Theme::SELECTION_RING, 0.85f));
    ImGui::PushStyleColor(ImGuiCol_ButtonActive, Theme::SELECTION_RING);
  }
  if (!params.enabled) {
    ImGui::BeginDisabled();
  }

  bool clicked = ImGui::Button(params.label, params.size);

  if (!params.enabled) {
    ImGui::EndDisabled();
  }
  if (params.active) {
    ImGui::PopStyleColor(3);
  }
  ImGui::PopStyleVar();
  ImGui::PopID();
  return params.enabled && clicked;
}

void draw_selection_badge(ImDrawList* draw_list, const ImVec2& center, float radius, bool checked, float alpha) {
  if (!draw_list || radius <= 0.0f) {
    return;
  }

  if (checked) {
    draw_list->AddCircleFilled(center, radius, Theme::ToImU32(Theme::with_alpha(Theme::SELECTION_RING, alpha)));
    // Check mark
    float s = radius * 0.5f;
    ImVec2 points[3] = {
      ImVec2(center.x - s, center.y),
      ImVec2(center.x - s * 0.3f, center.y + s * 0.7f),
      ImVec2(center.x + s, center.y - s * 0.6f)
    };
    draw_list->AddPolyline(points, 3, IM_COL32(255, 255, 255, static_cast<int>(255 * alpha)), 0,
      std::max(1.5f, radius * 0.22f));
  }
  else {
    draw_list->AddCircleFilled(center, radius, Theme::ToImU32(Theme::with_alpha(Theme::CAPTION_BACKGROUND, alpha)));
    draw_list->AddCircle(center, radius, Theme::ToImU32(Theme::with_alpha(Theme::CHECKBOX_EMPTY, alpha)), 0, 2.0f);
  }
}

void draw_skeleton_box(ImDrawList* draw_list, const ImVec2& min, const ImVec2& max, float rounding, double time) {
  if (!draw_list) {
    return;
  }
  float pulse = 0.5f + 0.5f * static_cast<float>(std::sin(time * 3.0));
  ImVec4 base = Theme::SKELETON_FILL;
  ImVec4 peak = Theme::SKELETON_HIGHLIGHT;
  ImVec4 color(
    base.x + (peak.x - base.x) * pulse,
    base.y + (peak.y - base.y) * pulse,
    base.z + (peak.z - base.z) * pulse,
    1.0f);
  draw_list->AddRectFilled(min, max, Theme::ToImU32(color), rounding);
}

void draw_centered_text(ImDrawList* draw_list, const ImVec2& min, const ImVec2& max, const char* text, ImU32 color) {
  if (!draw_list || !text) {
    return;
  }
  ImVec2 text_size = ImGui::CalcTextSize(text);
  ImVec2 pos(
    min.x + std::max(0.0f, (max.x - min.x - text_size.x) * 0.5f),
    min.y + std::max(0.0f, (max.y - min.y - text_size.y) * 0.5f));
  draw_list->AddText(pos, color, text);
}
