#include <glad/glad.h>
#include <GLFW/glfw3.h>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <memory>
#include <string>

#include "imgui.h"
#include "imgui_impl_glfw.h"
#include "imgui_impl_opengl3.h"

#include "config.h"
#include "database.h"
#include "grid/resize_notifier.h"
#include "grid/selection_store.h"
#include "grid/virtual_grid.h"
#include "grid/visibility_monitor.h"
#include "image_decoder.h"
#include "logger.h"
#include "photo_library.h"
#include "run.h"
#include "texture_manager.h"
#include "theme.h"
#include "thumbnail_loader.h"
#include "ui/ui.h"
#include "utils.h"

namespace fs = std::filesystem;

// Initialize ImGui UI system
static ImGuiIO* initialize_imgui(GLFWwindow* window) {
  IMGUI_CHECKVERSION();
  ImGui::CreateContext();
  ImGuiIO& io = ImGui::GetIO();
  io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
  io.IniFilename = nullptr;  // Disable imgui.ini file

  Theme::setup_photo_vault_theme();

  ImGui_ImplGlfw_InitForOpenGL(window, true);
  ImGui_ImplOpenGL3_Init("#version 330");

  return &io;
}

// Decides what the library shows: the command-line directory, the saved one, or the demo set
static void load_library(const RunOptions& options, PhotoLibrary& library) {
  if (!options.photos_directory.empty()) {
    Config::set_photos_directory(options.photos_directory);
  }

  std::string directory = Config::photos_directory();
  if (!options.demo && !directory.empty()) {
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
      // Saved directory no longer exists: behave as if it was never set
      LOG_WARN("Photos directory no longer exists: {}. Resetting to unset state.", directory);
      Config::set_photos_directory("");
    }
    else if (library.start_scan(directory)) {
      return;
    }
  }

  int count = options.demo_count > 0 ? options.demo_count : Config::DEMO_ITEM_COUNT;
  LOG_INFO("No photos directory configured, showing {} demo items", count);
  library.load_demo(count);
}

int run(const RunOptions& options, std::atomic<bool>* shutdown_requested) {
  Logger::initialize(options.log_level);
  LOG_INFO("PhotoVault application starting...");

  ensure_executable_working_directory();

  if (!Config::initialize_directories()) {
    LOG_ERROR("Failed to create data directory {}", Config::get_data_directory().string());
    return -1;
  }

  SettingsDatabase database;
  if (!database.initialize(Config::get_database_path().string())) {
    LOG_ERROR("Failed to initialize settings database");
    return -1;
  }
  if (!Config::initialize(&database)) {
    LOG_ERROR("Failed to load settings");
    return -1;
  }

  PhotoLibrary library;
  load_library(options, library);

  // Initialize GLFW
  LOG_INFO("Initializing GLFW...");
  if (!glfwInit()) {
    LOG_ERROR("Failed to initialize GLFW");
    Config::shutdown();
    return -1;
  }

  // Set OpenGL 3.3 Core Profile
  glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
  glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
  glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
  glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GL_TRUE);

  GLFWwindow* window = glfwCreateWindow(Config::WINDOW_WIDTH, Config::WINDOW_HEIGHT, "PhotoVault", nullptr, nullptr);
  if (!window) {
    LOG_ERROR("Failed to create GLFW window");
    glfwTerminate();
    Config::shutdown();
    return -1;
  }

  glfwMakeContextCurrent(window);
  glfwSwapInterval(1);

  // Initialize GLAD
  if (!gladLoadGLLoader((GLADloadproc) glfwGetProcAddress)) {
    LOG_ERROR("Failed to initialize GLAD");
    glfwDestroyWindow(window);
    glfwTerminate();
    Config::shutdown();
    return -1;
  }

  ImGuiIO* io_ptr = initialize_imgui(window);

  {
    // Grid engine and thumbnail pipeline; scoped so textures are released while the context is alive
    ThumbnailLoader thumbnail_loader(decode_photo_request, Config::THUMBNAIL_WORKER_COUNT,
      Config::THUMBNAIL_MAX_OUTSTANDING);
    if (!thumbnail_loader.start()) {
      LOG_ERROR("Failed to start thumbnail loader");
    }
    TextureManager texture_manager(thumbnail_loader, Config::THUMBNAIL_TEXTURE_CAPACITY,
      Config::THUMBNAIL_UPLOADS_PER_FRAME, Config::THUMBNAIL_MAX_ATTEMPTS, Config::THUMBNAIL_FAILURE_MEMORY);

    ViewportVisibilityMonitor visibility_monitor;
    ContainerResizeNotifier resize_notifier;
    auto selection = std::make_shared<SelectionStore>();
    VirtualGrid grid(Config::grid_options(), visibility_monitor, resize_notifier, selection);
    if (!grid.set_items(library.ids())) {
      LOG_ERROR("Photo library produced duplicate ids");
    }

    GridPanelState panel_state;
    GridPanelContext panel_context{ library, grid, visibility_monitor, resize_notifier, texture_manager };
    attach_grid_callbacks(panel_state, panel_context);

    double last_time = glfwGetTime();
    LOG_INFO("Entering main rendering loop");

    while (!glfwWindowShouldClose(window) && (!shutdown_requested || !shutdown_requested->load())) {
      double current_time = glfwGetTime();
      io_ptr->DeltaTime = std::max(1e-4f, (float) (current_time - last_time));
      last_time = current_time;

      glfwPollEvents();

      // Publish a finished scan into the grid
      if (library.poll()) {
        if (!grid.set_items(library.ids())) {
          LOG_ERROR("Photo library produced duplicate ids");
        }
        selection->disable_selection_mode();
        LOG_INFO("Grid now shows {} photos", library.size());
      }

      texture_manager.begin_frame();

      // Start the Dear ImGui frame
      ImGui_ImplOpenGL3_NewFrame();
      ImGui_ImplGlfw_NewFrame();
      ImGui::NewFrame();

      handle_grid_shortcuts(panel_state, panel_context);
      if (panel_state.close_requested) {
        glfwSetWindowShouldClose(window, GLFW_TRUE);
      }

      // Create main window that fits perfectly to viewport
      ImGuiViewport* viewport = ImGui::GetMainViewport();
      ImGui::SetNextWindowPos(viewport->Pos);
      ImGui::SetNextWindowSize(viewport->Size);
      ImGui::PushStyleVar(ImGuiStyleVar_WindowRounding, 0.0f);
      ImGui::PushStyleVar(ImGuiStyleVar_WindowBorderSize, 0.0f);
      ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, ImVec2(0.0f, 0.0f));
      ImGui::Begin(
        "PhotoVault", nullptr,
        ImGuiWindowFlags_NoTitleBar | ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoMove |
        ImGuiWindowFlags_NoScrollbar | ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoBringToFrontOnFocus |
        ImGuiWindowFlags_NoNavFocus);
      ImGui::PopStyleVar(3);

      float content_width = ImGui::GetContentRegionAvail().x;
      float content_height = ImGui::GetContentRegionAvail().y;
      float spacing_y = ImGui::GetStyle().ItemSpacing.y;
      float grid_height = std::max(0.0f, content_height - Config::STATUS_BAR_HEIGHT - spacing_y);

      render_photo_grid_panel(panel_state, panel_context, content_width, grid_height);
      render_status_bar(panel_state, panel_context, content_width, Config::STATUS_BAR_HEIGHT);

      ImGui::End();

      texture_manager.end_frame();

      // Rendering
      ImGui::Render();
      int display_w, display_h;
      glfwGetFramebufferSize(window, &display_w, &display_h);
      glViewport(0, 0, display_w, display_h);
      glClearColor(
        Theme::BACKGROUND_MAIN.x, Theme::BACKGROUND_MAIN.y, Theme::BACKGROUND_MAIN.z, Theme::BACKGROUND_MAIN.w);
      glClear(GL_COLOR_BUFFER_BIT);
      ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

      glfwSwapBuffers(window);
    }

    LOG_INFO("Shutting down...");
    library.cancel_scan();
    thumbnail_loader.stop();
    texture_manager.clear();
  }

  // Cleanup ImGui
  ImGui_ImplOpenGL3_Shutdown();
  ImGui_ImplGlfw_Shutdown();
  ImGui::DestroyContext();

  glfwDestroyWindow(window);
  glfwTerminate();

  Config::shutdown();
  database.close();

  return 0;
}
