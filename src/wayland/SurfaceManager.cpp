#include "wayland/SurfaceManager.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <wayland-client.h>

#include "wlr-layer-shell-unstable-v1-client-protocol.h"
#include "xdg-output-unstable-v1-client-protocol.h"
#include "xdg-shell-client-protocol.h"

using namespace std;

struct SurfaceManager::Callbacks
{
  static void global(void* data,
                     wl_registry* registry,
                     uint32_t name,
                     const char* interface,
                     uint32_t version)
  {
    static_cast<SurfaceManager*>(data)->bindGlobal(name, interface, version);
  }

  static void globalRemove(void* data, wl_registry* registry, uint32_t name)
  {
    static_cast<SurfaceManager*>(data)->removeGlobal(name);
  }

  static void outputGeometry(void* data,
                             wl_output* output,
                             int32_t x,
                             int32_t y,
                             int32_t physicalWidth,
                             int32_t physicalHeight,
                             int32_t subpixel,
                             const char* make,
                             const char* model,
                             int32_t transform)
  {
  }

  static void outputMode(void* data,
                         wl_output* output,
                         uint32_t flags,
                         int32_t width,
                         int32_t height,
                         int32_t refresh)
  {
    auto entry = static_cast<Output*>(data);
    if (flags & WL_OUTPUT_MODE_CURRENT) {
      entry->info.modeWidth = width;
      entry->info.modeHeight = height;
    }
  }

  static void outputDone(void* data, wl_output* output) {}

  static void outputScale(void* data, wl_output* output, int32_t factor)
  {
    static_cast<Output*>(data)->info.scale = factor;
  }

  static void outputName(void* data, wl_output* output, const char* name)
  {
    static_cast<Output*>(data)->info.name = name;
  }

  static void outputDescription(void* data,
                                wl_output* output,
                                const char* description)
  {
    static_cast<Output*>(data)->info.description = description;
  }

  static void xdgOutputPosition(void* data, zxdg_output_v1* output, int32_t x, int32_t y)
  {
  }

  static void xdgOutputSize(void* data,
                            zxdg_output_v1* output,
                            int32_t width,
                            int32_t height)
  {
    auto entry = static_cast<Output*>(data);
    entry->info.logicalWidth = width;
    entry->info.logicalHeight = height;
  }

  static void xdgOutputDone(void* data, zxdg_output_v1* output) {}

  static void xdgOutputName(void* data, zxdg_output_v1* output, const char* name)
  {
    auto entry = static_cast<Output*>(data);
    if (entry->info.name.empty()) {
      entry->info.name = name;
    }
  }

  static void xdgOutputDescription(void* data,
                                   zxdg_output_v1* output,
                                   const char* description)
  {
    auto entry = static_cast<Output*>(data);
    if (entry->info.description.empty()) {
      entry->info.description = description;
    }
  }

  static void ping(void* data, xdg_wm_base* wmBase, uint32_t serial)
  {
    xdg_wm_base_pong(wmBase, serial);
  }

  static void xdgSurfaceConfigure(void* data, xdg_surface* xdgSurface, uint32_t serial)
  {
    auto self = static_cast<SurfaceManager*>(data);
    xdg_surface_ack_configure(xdgSurface, serial);
    self->applySize(self->pendingWidth, self->pendingHeight);
    self->configured = true;
  }

  static void toplevelConfigure(void* data,
                                xdg_toplevel* toplevel,
                                int32_t width,
                                int32_t height,
                                wl_array* states)
  {
    auto self = static_cast<SurfaceManager*>(data);
    // Zero leaves the size to us.
    self->pendingWidth = width > 0 ? width : self->surfaceWidth;
    self->pendingHeight = height > 0 ? height : self->surfaceHeight;
  }

  static void toplevelClose(void* data, xdg_toplevel* toplevel)
  {
    auto self = static_cast<SurfaceManager*>(data);
    self->logger->info("window closed by the compositor");
    self->pending.push_back({ SurfaceEvent::Type::Closed });
  }

  static void layerConfigure(void* data,
                             zwlr_layer_surface_v1* layerSurface,
                             uint32_t serial,
                             uint32_t width,
                             uint32_t height)
  {
    auto self = static_cast<SurfaceManager*>(data);
    zwlr_layer_surface_v1_ack_configure(layerSurface, serial);
    self->applySize(width > 0 ? int(width) : self->surfaceWidth,
                    height > 0 ? int(height) : self->surfaceHeight);
    self->configured = true;
  }

  static void layerClosed(void* data, zwlr_layer_surface_v1* layerSurface)
  {
    auto self = static_cast<SurfaceManager*>(data);
    self->logger->info("layer surface closed by the compositor");
    self->pending.push_back({ SurfaceEvent::Type::Closed });
  }

  static void frameDone(void* data, wl_callback* callback, uint32_t time)
  {
    auto self = static_cast<SurfaceManager*>(data);
    wl_callback_destroy(callback);
    if (self->frameCallback == callback) {
      self->frameCallback = nullptr;
    }
    self->frames.onFrameDone();
    self->pending.push_back({ SurfaceEvent::Type::FrameReady });
  }

  static void bufferRelease(void* data, wl_buffer* buffer)
  {
    auto self = static_cast<SurfaceManager*>(data);
    if (self->pool && self->pool->markReleased(buffer)) {
      self->pending.push_back({ SurfaceEvent::Type::BufferReleased });
    }
  }
};

static const wl_registry_listener registryListener = {
  .global = SurfaceManager::Callbacks::global,
  .global_remove = SurfaceManager::Callbacks::globalRemove,
};

static const wl_output_listener outputListener = {
  .geometry = SurfaceManager::Callbacks::outputGeometry,
  .mode = SurfaceManager::Callbacks::outputMode,
  .done = SurfaceManager::Callbacks::outputDone,
  .scale = SurfaceManager::Callbacks::outputScale,
  .name = SurfaceManager::Callbacks::outputName,
  .description = SurfaceManager::Callbacks::outputDescription,
};

static const zxdg_output_v1_listener xdgOutputListener = {
  .logical_position = SurfaceManager::Callbacks::xdgOutputPosition,
  .logical_size = SurfaceManager::Callbacks::xdgOutputSize,
  .done = SurfaceManager::Callbacks::xdgOutputDone,
  .name = SurfaceManager::Callbacks::xdgOutputName,
  .description = SurfaceManager::Callbacks::xdgOutputDescription,
};

static const xdg_wm_base_listener wmBaseListener = {
  .ping = SurfaceManager::Callbacks::ping,
};

static const xdg_surface_listener xdgSurfaceListener = {
  .configure = SurfaceManager::Callbacks::xdgSurfaceConfigure,
};

static const xdg_toplevel_listener toplevelListener = {
  .configure = SurfaceManager::Callbacks::toplevelConfigure,
  .close = SurfaceManager::Callbacks::toplevelClose,
};

static const zwlr_layer_surface_v1_listener layerSurfaceListener = {
  .configure = SurfaceManager::Callbacks::layerConfigure,
  .closed = SurfaceManager::Callbacks::layerClosed,
};

static const wl_callback_listener frameListener = {
  .done = SurfaceManager::Callbacks::frameDone,
};

static const wl_buffer_listener bufferListener = {
  .release = SurfaceManager::Callbacks::bufferRelease,
};

SurfaceManager::SurfaceManager(const LayoutModel& layout, SurfaceOptions options)
  : layout(layout)
  , options(options)
{
  logger = makeLogger("Surface");
  presentationMode =
    options.windowMode ? PresentationMode::Window : PresentationMode::Overlay;
}

SurfaceManager::~SurfaceManager()
{
  shutdown();
}

void
SurfaceManager::checkDisplay(int result, const char* what)
{
  if (result >= 0) {
    return;
  }
  int err = display != nullptr ? wl_display_get_error(display) : errno;
  throw SessionError(string(what) + " failed: " + strerror(err != 0 ? err : errno));
}

void
SurfaceManager::bindGlobal(uint32_t name, const char* interface, uint32_t version)
{
  if (strcmp(interface, wl_compositor_interface.name) == 0) {
    compositorVersion = min(version, 4u);
    compositor = static_cast<wl_compositor*>(
      wl_registry_bind(registry, name, &wl_compositor_interface, compositorVersion));
  } else if (strcmp(interface, wl_shm_interface.name) == 0) {
    shm = static_cast<wl_shm*>(wl_registry_bind(registry, name, &wl_shm_interface, 1));
  } else if (strcmp(interface, xdg_wm_base_interface.name) == 0) {
    wmBase = static_cast<xdg_wm_base*>(
      wl_registry_bind(registry, name, &xdg_wm_base_interface, min(version, 2u)));
    xdg_wm_base_add_listener(wmBase, &wmBaseListener, this);
  } else if (strcmp(interface, zwlr_layer_shell_v1_interface.name) == 0) {
    layerShellVersion = min(version, 4u);
    layerShell = static_cast<zwlr_layer_shell_v1*>(wl_registry_bind(
      registry, name, &zwlr_layer_shell_v1_interface, layerShellVersion));
  } else if (strcmp(interface, zxdg_output_manager_v1_interface.name) == 0) {
    xdgOutputManager = static_cast<zxdg_output_manager_v1*>(wl_registry_bind(
      registry, name, &zxdg_output_manager_v1_interface, min(version, 3u)));
    for (auto& output : outputs) {
      watchOutput(*output);
    }
  } else if (strcmp(interface, wl_output_interface.name) == 0) {
    addOutput(name, version);
  }
}

void
SurfaceManager::addOutput(uint32_t name, uint32_t version)
{
  auto entry = make_unique<Output>();
  entry->info.globalName = name;
  entry->output = static_cast<wl_output*>(
    wl_registry_bind(registry, name, &wl_output_interface, min(version, 4u)));
  wl_output_add_listener(entry->output, &outputListener, entry.get());
  watchOutput(*entry);
  outputs.push_back(std::move(entry));
}

void
SurfaceManager::watchOutput(Output& output)
{
  if (xdgOutputManager == nullptr || output.xdgOutput != nullptr) {
    return;
  }
  output.xdgOutput =
    zxdg_output_manager_v1_get_xdg_output(xdgOutputManager, output.output);
  zxdg_output_v1_add_listener(output.xdgOutput, &xdgOutputListener, &output);
}

void
SurfaceManager::removeGlobal(uint32_t name)
{
  auto it = find_if(outputs.begin(), outputs.end(), [name](const auto& output) {
    return output->info.globalName == name;
  });
  if (it == outputs.end()) {
    return;
  }
  logger->info("output {} went away", (*it)->info.name);
  if ((*it)->xdgOutput != nullptr) {
    zxdg_output_v1_destroy((*it)->xdgOutput);
  }
  wl_output_destroy((*it)->output);
  outputs.erase(it);
}

vector<OutputInfo>
SurfaceManager::outputInfo() const
{
  vector<OutputInfo> infos;
  for (const auto& output : outputs) {
    infos.push_back(output->info);
  }
  return infos;
}

void
SurfaceManager::applySize(int width, int height)
{
  if (width <= 0 || height <= 0) {
    return;
  }
  if (width == surfaceWidth && height == surfaceHeight) {
    return;
  }
  surfaceWidth = width;
  surfaceHeight = height;
  logger->debug("surface configured to {}x{}", width, height);
  if (sessionState == SessionState::Ready) {
    frames.markDirty();
    pending.push_back({ SurfaceEvent::Type::Resized, width, height });
  }
}

void
SurfaceManager::setupLayerSurface()
{
  auto infos = outputInfo();
  auto selected = selectOutput(infos, layout.overlay.screen);
  if (layout.overlay.screen.has_value() && !selected.has_value()) {
    logger->warn("screen '{}' not found; the compositor will choose an output",
                 *layout.overlay.screen);
    for (size_t i = 0; i < infos.size(); i++) {
      logger->debug("  [{}] name '{}' description '{}'",
                    i,
                    infos[i].name,
                    infos[i].description);
    }
  }

  int screenW = 0;
  int screenH = 0;
  if (selected.has_value() && infos[*selected].hasSize()) {
    screenW = infos[*selected].width();
    screenH = infos[*selected].height();
  } else {
    auto sized = find_if(infos.begin(), infos.end(), [](const OutputInfo& info) {
      return info.hasSize();
    });
    if (sized != infos.end()) {
      screenW = sized->width();
      screenH = sized->height();
    } else {
      logger->warn("no output reported its size; assuming {}x{}",
                   FALLBACK_SCREEN_WIDTH,
                   FALLBACK_SCREEN_HEIGHT);
    }
  }

  wl_output* target = selected.has_value() ? outputs[*selected]->output : nullptr;
  layerSurface = zwlr_layer_shell_v1_get_layer_surface(layerShell,
                                                       surface,
                                                       target,
                                                       ZWLR_LAYER_SHELL_V1_LAYER_OVERLAY,
                                                       LAYER_NAMESPACE);
  zwlr_layer_surface_v1_add_listener(layerSurface, &layerSurfaceListener, this);

  const auto& overlay = layout.overlay;
  auto bounds = layout.bounds();
  auto size = computeOverlaySize(overlay, bounds.width, bounds.height, screenW, screenH);
  logger->info("overlay {}x{} at {} on {}",
               size.width,
               size.height,
               positionName(overlay.position),
               selected.has_value() ? infos[*selected].name : "the default output");

  zwlr_layer_surface_v1_set_anchor(layerSurface, anchorFor(overlay.position));
  zwlr_layer_surface_v1_set_margin(layerSurface,
                                   overlay.marginTop,
                                   overlay.marginRight,
                                   overlay.marginBottom,
                                   overlay.marginLeft);
  zwlr_layer_surface_v1_set_keyboard_interactivity(
    layerSurface, ZWLR_LAYER_SURFACE_V1_KEYBOARD_INTERACTIVITY_NONE);
  zwlr_layer_surface_v1_set_exclusive_zone(layerSurface, 0);
  zwlr_layer_surface_v1_set_size(layerSurface, size.width, size.height);
  surfaceWidth = size.width;
  surfaceHeight = size.height;
}

void
SurfaceManager::setupWindow()
{
  presentationMode = PresentationMode::Window;
  xdgSurface = xdg_wm_base_get_xdg_surface(wmBase, surface);
  xdg_surface_add_listener(xdgSurface, &xdgSurfaceListener, this);
  toplevel = xdg_surface_get_toplevel(xdgSurface);
  xdg_toplevel_add_listener(toplevel, &toplevelListener, this);
  xdg_toplevel_set_title(toplevel, WINDOW_TITLE);
  xdg_toplevel_set_app_id(toplevel, LAYER_NAMESPACE);
  surfaceWidth = DEFAULT_WINDOW_WIDTH;
  surfaceHeight = DEFAULT_WINDOW_HEIGHT;
  pendingWidth = surfaceWidth;
  pendingHeight = surfaceHeight;
}

void
SurfaceManager::connect()
{
  sessionState = SessionState::Connecting;
  display = wl_display_connect(nullptr);
  if (display == nullptr) {
    throw SessionError("failed to connect to the Wayland display: " +
                       string(strerror(errno)));
  }
  registry = wl_display_get_registry(display);
  wl_registry_add_listener(registry, &registryListener, this);
  checkDisplay(wl_display_roundtrip(display), "registry roundtrip");
  // Output and xdg-output details arrive on the second roundtrip.
  checkDisplay(wl_display_roundtrip(display), "output roundtrip");

  if (compositor == nullptr) {
    throw SessionError("compositor does not offer wl_compositor");
  }
  if (shm == nullptr) {
    throw SessionError("compositor does not offer wl_shm");
  }
  logger->info("connected; {} output(s), layer shell {}, xdg-shell {}",
               outputs.size(),
               layerShell != nullptr ? "available" : "missing",
               wmBase != nullptr ? "available" : "missing");

  sessionState = SessionState::Negotiating;
  surface = wl_compositor_create_surface(compositor);
  if (presentationMode == PresentationMode::Overlay && layerShell != nullptr) {
    setupLayerSurface();
  } else if (wmBase != nullptr) {
    if (presentationMode == PresentationMode::Overlay) {
      logger->error("zwlr_layer_shell_v1 is not available; falling back to "
                    "window mode");
    }
    setupWindow();
  } else {
    throw SessionError("compositor offers neither wlr-layer-shell nor xdg-shell");
  }
  wl_surface_commit(surface);

  while (!configured) {
    checkDisplay(wl_display_dispatch(display), "waiting for configure");
    for (const auto& event : pending) {
      if (event.type == SurfaceEvent::Type::Closed) {
        throw SessionError("surface closed before it was configured");
      }
    }
  }
  pending.clear();

  allocator = make_unique<ShmAllocator>(shm, &bufferListener, this);
  pool = make_unique<BufferPool>(*allocator, options.bufferCount);
  frames.reset();
  sessionState = SessionState::Ready;
  logger->info("surface ready at {}x{}", surfaceWidth, surfaceHeight);
}

int
SurfaceManager::fd() const
{
  return display != nullptr ? wl_display_get_fd(display) : -1;
}

void
SurfaceManager::prepareRead()
{
  while (wl_display_prepare_read(display) != 0) {
    checkDisplay(wl_display_dispatch_pending(display), "dispatching queued events");
  }
  readPrepared = true;
  if (wl_display_flush(display) < 0 && errno != EAGAIN) {
    int err = errno;
    wl_display_cancel_read(display);
    readPrepared = false;
    throw SessionError(string("flushing the display failed: ") + strerror(err));
  }
}

vector<SurfaceEvent>
SurfaceManager::finishRead(bool readable)
{
  if (readPrepared) {
    readPrepared = false;
    if (readable) {
      checkDisplay(wl_display_read_events(display), "reading display events");
    } else {
      wl_display_cancel_read(display);
    }
  }
  checkDisplay(wl_display_dispatch_pending(display), "dispatching display events");
  vector<SurfaceEvent> events;
  events.swap(pending);
  return events;
}

bool
SurfaceManager::present(const function<void(const RenderTarget&)>& render)
{
  if (sessionState != SessionState::Ready) {
    return false;
  }
  auto slot = pool->acquire(surfaceWidth, surfaceHeight);
  if (!slot.has_value()) {
    logger->debug("all {} buffers held by the compositor; skipping frame",
                  pool->size());
    return false;
  }

  const auto& buffer = pool->at(*slot);
  render(RenderTarget{ buffer.data, buffer.width, buffer.height, buffer.stride });
  pool->markInUse(*slot);

  wl_surface_attach(surface, buffer.buffer, 0, 0);
  if (compositorVersion >= 4) {
    wl_surface_damage_buffer(surface, 0, 0, buffer.width, buffer.height);
  } else {
    wl_surface_damage(surface, 0, 0, buffer.width, buffer.height);
  }
  frameCallback = wl_surface_frame(surface);
  wl_callback_add_listener(frameCallback, &frameListener, this);
  frames.onCommitted();
  wl_surface_commit(surface);
  return true;
}

void
SurfaceManager::shutdown()
{
  if (sessionState == SessionState::ShuttingDown) {
    return;
  }
  sessionState = SessionState::ShuttingDown;
  if (display == nullptr) {
    return;
  }
  logger->info("tearing down the surface session");

  if (readPrepared) {
    wl_display_cancel_read(display);
    readPrepared = false;
  }
  if (frameCallback != nullptr) {
    wl_callback_destroy(frameCallback);
    frameCallback = nullptr;
  }
  frames.reset();
  pool.reset();
  allocator.reset();

  if (layerSurface != nullptr) {
    zwlr_layer_surface_v1_destroy(layerSurface);
    layerSurface = nullptr;
  }
  if (toplevel != nullptr) {
    xdg_toplevel_destroy(toplevel);
    toplevel = nullptr;
  }
  if (xdgSurface != nullptr) {
    xdg_surface_destroy(xdgSurface);
    xdgSurface = nullptr;
  }
  if (surface != nullptr) {
    wl_surface_destroy(surface);
    surface = nullptr;
  }

  for (auto& output : outputs) {
    if (output->xdgOutput != nullptr) {
      zxdg_output_v1_destroy(output->xdgOutput);
    }
    wl_output_destroy(output->output);
  }
  outputs.clear();
  if (xdgOutputManager != nullptr) {
    zxdg_output_manager_v1_destroy(xdgOutputManager);
    xdgOutputManager = nullptr;
  }
  if (layerShell != nullptr) {
    // The destroy request only exists from version 3.
    if (layerShellVersion >= 3) {
      zwlr_layer_shell_v1_destroy(layerShell);
    } else {
      wl_proxy_destroy(reinterpret_cast<wl_proxy*>(layerShell));
    }
    layerShell = nullptr;
  }
  if (wmBase != nullptr) {
    xdg_wm_base_destroy(wmBase);
    wmBase = nullptr;
  }
  if (shm != nullptr) {
    wl_shm_destroy(shm);
    shm = nullptr;
  }
  if (compositor != nullptr) {
    wl_compositor_destroy(compositor);
    compositor = nullptr;
  }
  if (registry != nullptr) {
    wl_registry_destroy(registry);
    registry = nullptr;
  }
  wl_display_flush(display);
  wl_display_disconnect(display);
  display = nullptr;
}
