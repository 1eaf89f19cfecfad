#pragma once

#include <optional>
#include <string>

#include "grid/grid_types.h"

class PhotoLibrary;
class TextureManager;
class VirtualGrid;
class ContainerResizeNotifier;
class ViewportVisibilityMonitor;

// Host state for the photo grid panel
struct GridPanelState {
  int zoom_level = 3;
  int focused_index = -1;
  ItemId focused_id;
  std::string status_message;

  // Scroll offset requested by scroll_to_index(), applied inside the scroll child next frame
  std::optional<float> pending_scroll;

  bool close_requested = false;
};

// Everything the panel draws from. Owned by run().
struct GridPanelContext {
  PhotoLibrary& library;
  VirtualGrid& grid;
  ViewportVisibilityMonitor& visibility;
  ContainerResizeNotifier& resize;
  TextureManager& textures;
};

// Wires the grid's click callbacks to the panel state. Call once after construction.
void attach_grid_callbacks(GridPanelState& state, GridPanelContext& context);

// Header (counts, selection controls, zoom) plus the virtualized grid
void render_photo_grid_panel(GridPanelState& state, GridPanelContext& context, float panel_width, float panel_height);

// One-line footer with scan progress and the last action
void render_status_bar(const GridPanelState& state, GridPanelContext& context, float panel_width, float panel_height);

// Ctrl/Cmd +/- zoom, Ctrl/Cmd+A select all while selecting, Home/End jumps, Escape
void handle_grid_shortcuts(GridPanelState& state, GridPanelContext& context);
