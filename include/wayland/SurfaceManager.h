#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "Layout.h"
#include "logger.h"
#include "render/Renderer.h"
#include "wayland/BufferPool.h"
#include "wayland/FrameScheduler.h"
#include "wayland/OverlayGeometry.h"
#include "wayland/ShmAllocator.h"

struct wl_display;
struct wl_registry;
struct wl_compositor;
struct wl_shm;
struct wl_surface;
struct wl_output;
struct wl_callback;
struct xdg_wm_base;
struct xdg_surface;
struct xdg_toplevel;
struct zxdg_output_manager_v1;
struct zxdg_output_v1;
struct zwlr_layer_shell_v1;
struct zwlr_layer_surface_v1;

class SessionError : public std::runtime_error
{
public:
  explicit SessionError(const std::string& what)
    : std::runtime_error(what)
  {
  }
};

enum class SessionState
{
  Connecting,
  Negotiating,
  Ready,
  ShuttingDown
};

enum class PresentationMode
{
  Overlay,
  Window
};

struct SurfaceEvent
{
  enum class Type
  {
    FrameReady,
    BufferReleased,
    Resized,
    Closed
  };
  Type type;
  int width = 0;
  int height = 0;
};

struct SurfaceOptions
{
  bool windowMode = false;
  size_t bufferCount = BufferPool::DEFAULT_SLOTS;
};

constexpr int DEFAULT_WINDOW_WIDTH = 320;
constexpr int DEFAULT_WINDOW_HEIGHT = 240;
constexpr const char* LAYER_NAMESPACE = "kbdosd";
constexpr const char* WINDOW_TITLE = "Keyboard OSD";

// Owns the display connection and the one surface the overlay is drawn on.
// Every Wayland callback lands here and is turned into a SurfaceEvent that
// the event loop drains after each read.
class SurfaceManager
{
public:
  // Listener entry points; each forwards to the instance passed as data.
  struct Callbacks;

private:
  struct Output
  {
    wl_output* output = nullptr;
    zxdg_output_v1* xdgOutput = nullptr;
    OutputInfo info;
  };

  std::shared_ptr<spdlog::logger> logger;
  const LayoutModel& layout;
  SurfaceOptions options;
  SessionState sessionState = SessionState::Connecting;
  PresentationMode presentationMode = PresentationMode::Overlay;

  wl_display* display = nullptr;
  wl_registry* registry = nullptr;
  wl_compositor* compositor = nullptr;
  uint32_t compositorVersion = 0;
  wl_shm* shm = nullptr;
  xdg_wm_base* wmBase = nullptr;
  zwlr_layer_shell_v1* layerShell = nullptr;
  uint32_t layerShellVersion = 0;
  zxdg_output_manager_v1* xdgOutputManager = nullptr;
  std::vector<std::unique_ptr<Output>> outputs;

  wl_surface* surface = nullptr;
  zwlr_layer_surface_v1* layerSurface = nullptr;
  xdg_surface* xdgSurface = nullptr;
  xdg_toplevel* toplevel = nullptr;
  wl_callback* frameCallback = nullptr;

  std::unique_ptr<ShmAllocator> allocator;
  std::unique_ptr<BufferPool> pool;
  FrameScheduler frames;

  bool configured = false;
  bool readPrepared = false;
  int surfaceWidth = 0;
  int surfaceHeight = 0;
  int pendingWidth = 0;
  int pendingHeight = 0;
  std::vector<SurfaceEvent> pending;

  void bindGlobal(uint32_t name, const char* interface, uint32_t version);
  void removeGlobal(uint32_t name);
  void addOutput(uint32_t name, uint32_t version);
  void watchOutput(Output& output);
  void setupLayerSurface();
  void setupWindow();
  void applySize(int width, int height);
  void checkDisplay(int result, const char* what);

public:
  SurfaceManager(const LayoutModel& layout, SurfaceOptions options);
  ~SurfaceManager();
  SurfaceManager(const SurfaceManager&) = delete;
  SurfaceManager& operator=(const SurfaceManager&) = delete;

  // Connecting -> Negotiating -> Ready. Blocks until the first configure.
  // Throws SessionError or BufferError.
  void connect();

  int fd() const;

  // Call before polling fd(): queues pending dispatches and flushes requests.
  void prepareRead();
  // Call after polling; readable says whether fd() had data. Returns what
  // the dispatched callbacks produced. Throws SessionError when the
  // connection is lost.
  std::vector<SurfaceEvent> finishRead(bool readable);

  // Renders into a free buffer and commits it with a frame callback. False
  // when every buffer is still held by the compositor.
  bool present(const std::function<void(const RenderTarget&)>& render);

  // Tears everything down. Safe to call more than once.
  void shutdown();

  FrameScheduler& scheduler() { return frames; }
  SessionState state() const { return sessionState; }
  PresentationMode mode() const { return presentationMode; }
  int width() const { return surfaceWidth; }
  int height() const { return surfaceHeight; }
  std::vector<OutputInfo> outputInfo() const;
};
