#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "FdPoller.h"
#include "Layout.h"
#include "input/InputPipeline.h"
#include "logger.h"
#include "render/Renderer.h"
#include "wayland/SurfaceManager.h"

enum class LoopEvent
{
  DeviceEvent,
  FrameReady,
  BufferReleased,
  Resized,
  Closed
};

struct EngineOptions
{
  bool windowMode = false;
  // Replaces the inactive overlay background, used in window mode.
  std::optional<Color> windowColor;
};

// The single-threaded event loop tying input, rendering and the surface
// together. SIGINT and SIGTERM end it cleanly.
class Engine
{
  std::shared_ptr<spdlog::logger> logger;
  const LayoutModel& layout;
  EngineOptions options;
  std::unique_ptr<SurfaceManager> surface;
  std::unique_ptr<InputPipeline> input;
  std::unique_ptr<Renderer> renderer;
  FdPoller poller;
  size_t displaySlot = 0;
  std::optional<size_t> inputSlot;
  bool closing = false;

  std::unique_ptr<InputSource> openInput();
  void collect(std::vector<LoopEvent>& events);
  void handle(LoopEvent event);
  void presentIfNeeded();

public:
  Engine(const LayoutModel& layout, EngineOptions options = {});
  ~Engine();

  // Connects the surface, opens input and registers both with the poller.
  // Throws SessionError or BufferError.
  void wire();

  // Runs until a signal or the compositor closes the surface. Throws
  // SessionError or BufferError on fatal failures.
  void loop();

  static void installSignalHandlers();
  static bool running();
};
