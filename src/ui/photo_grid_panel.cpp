#include "ui/ui.h"
#include "ui/components.h"

#include <algorithm>
#include <string>

#include "imgui.h"

#include "config.h"
#include "grid/virtual_grid.h"
#include "logger.h"
#include "photo_library.h"
#include "texture_manager.h"
#include "theme.h"
#include "utils.h"

namespace {

constexpr float HEADER_HEIGHT = 44.0f;
constexpr float CELL_ROUNDING = 8.0f;
constexpr float BADGE_RADIUS = 11.0f;
constexpr float SELECTION_RING_THICKNESS = 3.0f;

bool apply_grid_zoom_delta(GridPanelState& state, GridPanelContext& context, int delta) {
  int next = std::clamp(state.zoom_level + delta, Config::GRID_ZOOM_LEVEL_MIN, Config::GRID_ZOOM_LEVEL_MAX);
  if (next == state.zoom_level) {
    return false;
  }
  state.zoom_level = next;
  Config::set_grid_zoom_level(next);
  context.grid.set_options(Config::grid_options());

  // Keep the focused photo in view across the relayout
  if (state.focused_index >= 0 && state.focused_index < context.grid.item_count()) {
    state.pending_scroll = context.grid.scroll_to_index(state.focused_index, ScrollAlign::Center);
  }
  return true;
}

void apply_zoom_delta_and_log(GridPanelState& state, GridPanelContext& context, int delta, const char* direction) {
  if (apply_grid_zoom_delta(state, context, delta)) {
    const GridOptions& options = context.grid.options();
    LOG_INFO("Grid zoom {}: level={} item={:.0f}x{:.0f}", direction, state.zoom_level, options.item_width,
      options.item_height);
  }
}

void set_column_count(GridPanelContext& context, int columns) {
  if (!Config::set_grid_column_count(columns)) {
    LOG_WARN("[GRID] Column count {} was not persisted", columns);
  }
  context.grid.set_options(Config::grid_options());
}

// Largest rectangle with the image's aspect ratio centered inside [min, max]
void fit_image_rect(const ThumbnailTexture& texture, const ImVec2& min, const ImVec2& max,
    ImVec2& out_min, ImVec2& out_max) {
  float box_w = max.x - min.x;
  float box_h = max.y - min.y;
  float scale = std::min(box_w / static_cast<float>(texture.width), box_h / static_cast<float>(texture.height));
  float w = texture.width * scale;
  float h = texture.height * scale;
  out_min = ImVec2(min.x + (box_w - w) * 0.5f, min.y + (box_h - h) * 0.5f);
  out_max = ImVec2(out_min.x + w, out_min.y + h);
}

void draw_caption(ImDrawList* draw_list, const ImVec2& min, const ImVec2& max, const std::string& name, float alpha) {
  float line_height = ImGui::GetTextLineHeight();
  float caption_height = line_height + 8.0f;
  if (max.y - min.y < caption_height * 2.0f) {
    return;
  }

  float char_width = std::max(1.0f, ImGui::CalcTextSize("M").x);
  size_t max_chars = static_cast<size_t>(std::max(4.0f, (max.x - min.x - 12.0f) / char_width));
  std::string label = truncate_with_ellipsis(name, max_chars);

  ImVec2 caption_min(min.x, max.y - caption_height);
  draw_list->AddRectFilled(caption_min, max, Theme::ToImU32(Theme::with_alpha(Theme::CAPTION_BACKGROUND, alpha)),
    CELL_ROUNDING, ImDrawFlags_RoundCornersBottom);
  draw_list->AddText(ImVec2(caption_min.x + 6.0f, caption_min.y + 4.0f),
    Theme::ToImU32(Theme::with_alpha(Theme::TEXT_DARK, alpha)), label.c_str());
}

struct PendingClicks {
  int click_index = -1;
  int double_click_index = -1;
};

// Invisible button over a cell; records clicks to be routed after the grid finished rendering
bool cell_interaction(const CellView& cell, const ImVec2& min, const ImVec2& max, PendingClicks& clicks) {
  ImVec2 size(max.x - min.x, max.y - min.y);
  if (size.x <= 0.0f || size.y <= 0.0f) {
    return false;
  }
  ImGui::SetCursorScreenPos(min);
  ImGui::PushID(cell.index);
  ImGui::InvisibleButton("Thumbnail", size);
  bool hovered = ImGui::IsItemHovered();
  if (ImGui::IsItemClicked(ImGuiMouseButton_Left)) {
    clicks.click_index = cell.index;
  }
  if (hovered && ImGui::IsMouseDoubleClicked(ImGuiMouseButton_Left)) {
    clicks.double_click_index = cell.index;
  }
  ImGui::PopID();
  return hovered;
}

void draw_selection_state(ImDrawList* draw_list, const CellView& cell, const ImVec2& min, const ImVec2& max) {
  if (cell.selected) {
    draw_list->AddRectFilled(min, max, Theme::ToImU32(Theme::ACCENT_BLUE_1_ALPHA_35), CELL_ROUNDING);
    draw_list->AddRect(min, max, Theme::ToImU32(Theme::SELECTION_RING), CELL_ROUNDING, 0, SELECTION_RING_THICKNESS);
  }
  if (cell.selection_mode) {
    ImVec2 badge_center(min.x + BADGE_RADIUS + 8.0f, min.y + BADGE_RADIUS + 8.0f);
    draw_selection_badge(draw_list, badge_center, BADGE_RADIUS, cell.selected);
  }
}

void render_header(GridPanelState& state, GridPanelContext& context, float panel_width) {
  PhotoLibrary& library = context.library;
  SelectionStore& selection = context.grid.selection();

  ImGui::SetCursorPos(ImVec2(12.0f, 10.0f));
  if (library.is_scanning()) {
    ImGui::Text("Scanning... %zu photos found", library.scanned_count());
  }
  else {
    ImGui::Text("%zu photos", library.size());
    if (!library.root_directory().empty()) {
      ImGui::SameLine();
      ImGui::TextColored(Theme::TEXT_SECONDARY, "%s", truncate_with_ellipsis(library.root_directory(), 60).c_str());
    }
  }

  // Right-aligned controls
  const float button_height = 26.0f;
  const float zoom_button_width = 30.0f;
  float controls_width = 480.0f;
  ImGui::SameLine(std::max(0.0f, panel_width - controls_width));

  if (selection.selection_mode()) {
    ImGui::AlignTextToFramePadding();
    ImGui::Text("%zu selected", selection.selected_count());
    ImGui::SameLine();
    TextButtonParams all_params;
    all_params.id = "SelectAll";
    all_params.label = "Select all";
    all_params.size = ImVec2(0.0f, button_height);
    all_params.enabled = library.size() > 0;
    if (draw_text_button(all_params)) {
      selection.select_all(library.ids());
    }
    ImGui::SameLine();
    TextButtonParams clear_params;
    clear_params.id = "ClearSelection";
    clear_params.label = "Clear";
    clear_params.size = ImVec2(0.0f, button_height);
    clear_params.enabled = selection.selected_count() > 0;
    if (draw_text_button(clear_params)) {
      selection.clear();
    }
    ImGui::SameLine();
  }

  TextButtonParams mode_params;
  mode_params.id = "SelectMode";
  mode_params.label = selection.selection_mode() ? "Done" : "Select";
  mode_params.size = ImVec2(0.0f, button_height);
  mode_params.active = selection.selection_mode();
  if (draw_text_button(mode_params)) {
    selection.toggle_selection_mode();
  }

  ImGui::SameLine();
  int columns = Config::grid_column_count();
  ImGui::SetNextItemWidth(110.0f);
  if (ImGui::SliderInt("##Columns", &columns, 1, Config::GRID_COLUMN_COUNT_MAX, "%d cols")) {
    set_column_count(context, columns);
  }

  ImGui::SameLine();
  TextButtonParams zoom_out_params;
  zoom_out_params.id = "ZoomOut";
  zoom_out_params.label = "-";
  zoom_out_params.size = ImVec2(zoom_button_width, button_height);
  zoom_out_params.enabled = state.zoom_level > Config::GRID_ZOOM_LEVEL_MIN;
  if (draw_text_button(zoom_out_params)) {
    apply_zoom_delta_and_log(state, context, -1, "decreased");
  }
  ImGui::SameLine();
  TextButtonParams zoom_in_params;
  zoom_in_params.id = "ZoomIn";
  zoom_in_params.label = "+";
  zoom_in_params.size = ImVec2(zoom_button_width, button_height);
  zoom_in_params.enabled = state.zoom_level < Config::GRID_ZOOM_LEVEL_MAX;
  if (draw_text_button(zoom_in_params)) {
    apply_zoom_delta_and_log(state, context, 1, "increased");
  }

  ImVec2 separator_start = ImGui::GetWindowPos();
  separator_start.y += HEADER_HEIGHT - 2.0f;
  draw_solid_separator(separator_start, panel_width);
}

} // namespace

void attach_grid_callbacks(GridPanelState& state, GridPanelContext& context) {
  state.zoom_level = Config::grid_zoom_level();

  PhotoLibrary& library = context.library;
  context.grid.set_on_item_click([&state, &library](const ItemId& id, int index) {
    state.focused_id = id;
    state.focused_index = index;
    const Photo* photo = library.find(id);
    if (photo) {
      state.status_message = photo->synthetic ? photo->name : photo->name + "  " + format_file_size(photo->size);
    }
  });

  context.grid.set_on_item_double_click([&state, &library](const ItemId& id, int) {
    const Photo* photo = library.find(id);
    if (!photo) {
      return;
    }
    if (photo->synthetic) {
      state.status_message = "Demo items have no file to open";
      return;
    }
    if (!open_with_system_viewer(photo->full_path.string())) {
      LOG_ERROR("Failed to open '{}'", photo->full_path.string());
      state.status_message = "Could not open " + photo->name;
    }
  });

  context.grid.selection().add_listener([&state](const SelectionStore& store) {
    LOG_DEBUG("[SELECTION] mode={} selected={}", store.selection_mode(), store.selected_count());
    if (store.selection_mode()) {
      state.status_message = std::to_string(store.selected_count()) + " selected";
    }
    else {
      state.status_message.clear();
    }
  });
}

void handle_grid_shortcuts(GridPanelState& state, GridPanelContext& context) {
  ImGuiIO& io = ImGui::GetIO();
  if (io.WantTextInput) {
    return;
  }

  // Keyboard shortcuts: Cmd/Ctrl + '=' or '-' to adjust zoom
  bool modifier_down = (io.KeySuper || io.KeyCtrl);
  if (modifier_down) {
    bool zoom_in_pressed = ImGui::IsKeyPressed(ImGuiKey_Equal, false) ||
      ImGui::IsKeyPressed(ImGuiKey_KeypadAdd, false);
    bool zoom_out_pressed = ImGui::IsKeyPressed(ImGuiKey_Minus, false) ||
      ImGui::IsKeyPressed(ImGuiKey_KeypadSubtract, false);

    if (zoom_in_pressed) {
      apply_zoom_delta_and_log(state, context, 1, "increased");
    }
    else if (zoom_out_pressed) {
      apply_zoom_delta_and_log(state, context, -1, "decreased");
    }

    if (ImGui::IsKeyPressed(ImGuiKey_A, false) && context.grid.selection().selection_mode()) {
      context.grid.selection().select_all(context.library.ids());
    }
  }

  int count = context.grid.item_count();
  if (count > 0) {
    if (ImGui::IsKeyPressed(ImGuiKey_Home, false)) {
      state.pending_scroll = context.grid.scroll_to_index(0, ScrollAlign::Start);
    }
    else if (ImGui::IsKeyPressed(ImGuiKey_End, false)) {
      state.pending_scroll = context.grid.scroll_to_index(count - 1, ScrollAlign::End);
    }
  }

  if (ImGui::IsKeyPressed(ImGuiKey_Escape, false)) {
    SelectionStore& selection = context.grid.selection();
    if (selection.selection_mode()) {
      selection.disable_selection_mode();
    }
    else {
      state.close_requested = true;
    }
  }
}

void render_photo_grid_panel(GridPanelState& state, GridPanelContext& context, float panel_width, float panel_height) {
  ImGui::BeginChild("PhotoGridRegion", ImVec2(panel_width, panel_height), false, ImGuiWindowFlags_NoScrollbar);

  render_header(state, context, panel_width);

  ImGui::SetCursorPos(ImVec2(0.0f, HEADER_HEIGHT));
  float grid_height = std::max(0.0f, panel_height - HEADER_HEIGHT);
  VirtualGrid& grid = context.grid;
  grid.set_loading(context.library.is_scanning() && context.library.size() == 0);

  ScrollbarState scroll = begin_scrollbar_child("PhotoGridScroll", ImVec2(panel_width, grid_height));

  // Feed the container size and scroll position before laying out
  context.resize.notify(ContainerSize{ scroll.content_size.x, scroll.window_size.y });
  if (state.pending_scroll.has_value()) {
    ImGui::SetScrollY(*state.pending_scroll);
    grid.on_scroll(*state.pending_scroll);
    state.pending_scroll.reset();
  }
  else {
    grid.on_scroll(ImGui::GetScrollY());
  }

  grid.update();
  context.visibility.process(grid.viewport().visible_rect());

  ImVec2 origin = ImGui::GetCursorScreenPos();
  ImDrawList* grid_draw_list = ImGui::GetWindowDrawList();
  double time = ImGui::GetTime();
  PendingClicks clicks;

  auto to_screen = [&origin](const GridRect& bounds, ImVec2& min, ImVec2& max) {
    min = ImVec2(origin.x + bounds.x, origin.y + bounds.y);
    max = ImVec2(origin.x + bounds.right(), origin.y + bounds.bottom());
  };

  GridCallbacks callbacks;
  callbacks.render_item = [&](const CellView& cell) {
    ImVec2 min, max;
    to_screen(cell.bounds, min, max);
    bool hovered = cell_interaction(cell, min, max, clicks);

    const Photo* photo = context.library.find(cell.id);
    if (!photo) {
      return;
    }

    float progress = cell.reveal_progress;
    float slide = (1.0f - progress) * Config::REVEAL_SLIDE_DISTANCE;
    ImVec2 item_min(min.x, min.y + slide);
    ImVec2 item_max(max.x, max.y + slide);

    grid_draw_list->AddRectFilled(item_min, item_max,
      Theme::ToImU32(Theme::with_alpha(Theme::PLACEHOLDER_FILL, progress)), CELL_ROUNDING);

    const ThumbnailTexture* texture = context.textures.get_thumbnail(cell.id,
      photo->synthetic ? std::string() : photo->full_path.string());
    if (texture && texture->width > 0 && texture->height > 0) {
      ImVec2 image_min, image_max;
      fit_image_rect(*texture, item_min, item_max, image_min, image_max);
      ImU32 tint = IM_COL32(255, 255, 255, static_cast<int>(255 * progress));
      grid_draw_list->AddImageRounded((ImTextureID) (intptr_t) texture->texture_id, image_min, image_max,
        ImVec2(0, 0), ImVec2(1, 1), tint, CELL_ROUNDING);
    }
    else if (context.textures.has_failed(cell.id)) {
      draw_centered_text(grid_draw_list, item_min, item_max, "Unavailable",
        Theme::ToImU32(Theme::with_alpha(Theme::BROKEN_IMAGE, progress)));
    }
    else {
      draw_skeleton_box(grid_draw_list, item_min, item_max, CELL_ROUNDING, time);
    }

    draw_caption(grid_draw_list, item_min, item_max, photo->name, progress);

    if (hovered && !cell.selection_mode) {
      grid_draw_list->AddRectFilled(min, max, Theme::ToImU32(Theme::IMAGE_HOVER_OVERLAY), CELL_ROUNDING);
    }
    if (!cell.selection_mode && cell.index == state.focused_index && cell.id == state.focused_id) {
      grid_draw_list->AddRect(min, max, Theme::ToImU32(Theme::FOCUS_OUTLINE), CELL_ROUNDING, 0, 2.0f);
    }
    draw_selection_state(grid_draw_list, cell, min, max);
  };

  callbacks.render_placeholder = [&](const CellView& cell) {
    ImVec2 min, max;
    to_screen(cell.bounds, min, max);
    cell_interaction(cell, min, max, clicks);
    grid_draw_list->AddRectFilled(min, max, Theme::ToImU32(Theme::PLACEHOLDER_FILL), CELL_ROUNDING);
    draw_selection_state(grid_draw_list, cell, min, max);
  };

  callbacks.render_loading = [&](int, const GridRect& bounds) {
    ImVec2 min, max;
    to_screen(bounds, min, max);
    draw_skeleton_box(grid_draw_list, min, max, CELL_ROUNDING, time);
  };

  callbacks.render_empty = [&]() {
    ImVec2 min = ImGui::GetWindowPos();
    ImVec2 max(min.x + scroll.content_size.x, min.y + scroll.window_size.y);
    draw_centered_text(grid_draw_list, min, max, "No items to display", Theme::ToImU32(Theme::TEXT_SECONDARY));
  };

  grid.render(callbacks);

  // Reserve the full virtual height so the scrollbar matches the collection
  ImGui::SetCursorScreenPos(origin);
  ImGui::Dummy(ImVec2(std::max(1.0f, scroll.content_size.x), std::max(1.0f, grid.total_size())));

  end_scrollbar_child(scroll);
  ImGui::EndChild();

  // Routed after drawing so selection changes apply to the next frame as a whole
  if (clicks.double_click_index >= 0) {
    grid.handle_double_click(clicks.double_click_index);
  }
  else if (clicks.click_index >= 0) {
    grid.handle_click(clicks.click_index);
  }
}

void render_status_bar(const GridPanelState& state, GridPanelContext& context, float panel_width, float panel_height) {
  ImGui::BeginChild("StatusBar", ImVec2(panel_width, panel_height), false, ImGuiWindowFlags_NoScrollbar);
  ImGui::SetCursorPos(ImVec2(12.0f, std::max(0.0f, (panel_height - ImGui::GetTextLineHeight()) * 0.5f)));

  VirtualGrid& grid = context.grid;
  ImGui::TextColored(Theme::TEXT_SECONDARY, "%d items  |  %d x %d  |  %zu live cells  |  %zu textures",
    grid.item_count(), grid.row_count(), grid.column_count(), grid.mounted_count(),
    context.textures.texture_count());

  if (!state.status_message.empty()) {
    ImGui::SameLine();
    ImGui::TextColored(Theme::TEXT_LIGHTER, "  %s", state.status_message.c_str());
  }
  ImGui::EndChild();
}
