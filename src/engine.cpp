#include "engine.h"
#include "KeycodeTable.h"
#include "input/LibinputSource.h"

#include <atomic>
#include <csignal>
#include <cstring>
#include <system_error>

using namespace std;

static atomic<bool> keepRunning(true);

static void
handleStopSignal(int signo)
{
  keepRunning.store(false);
}

void
Engine::installSignalHandlers()
{
  struct sigaction action;
  memset(&action, 0, sizeof(action));
  action.sa_handler = handleStopSignal;
  sigemptyset(&action.sa_mask);
  // No SA_RESTART: poll() must return EINTR so the loop sees the flag.
  action.sa_flags = 0;
  for (int signo : { SIGINT, SIGTERM }) {
    if (sigaction(signo, &action, nullptr) != 0) {
      throw system_error(errno, generic_category(), "sigaction");
    }
  }
}

bool
Engine::running()
{
  return keepRunning.load();
}

Engine::Engine(const LayoutModel& layout, EngineOptions options)
  : layout(layout)
  , options(options)
{
  logger = makeLogger("Engine");
}

Engine::~Engine()
{
  if (surface) {
    surface->shutdown();
  }
}

unique_ptr<InputSource>
Engine::openInput()
{
  auto source = make_unique<LibinputSource>();
  if (!source->open()) {
    return nullptr;
  }
  return source;
}

void
Engine::wire()
{
  SurfaceOptions surfaceOptions;
  surfaceOptions.windowMode = options.windowMode;
  surface = make_unique<SurfaceManager>(layout, surfaceOptions);
  surface->connect();
  displaySlot = poller.add(surface->fd());

  auto font = make_shared<FontFace>(layout.overlay.fontPath);
  optional<Color> background;
  if (surface->mode() == PresentationMode::Window) {
    background = options.windowColor.value_or(parseColor("#000000FF"));
  }
  renderer = make_unique<Renderer>(font, background);

  input = make_unique<InputPipeline>(
    openInput(), KeyStateTracker(KeycodeTable::instance(), layout));
  if (auto fd = input->fd()) {
    inputSlot = poller.add(*fd);
  } else {
    logger->warn("running without input; keys will never be highlighted");
  }
}

void
Engine::collect(vector<LoopEvent>& events)
{
  auto display = poller.status(displaySlot);
  if (display.failed) {
    throw SessionError("lost the connection to the Wayland display");
  }
  for (const auto& event : surface->finishRead(display.readable)) {
    switch (event.type) {
      case SurfaceEvent::Type::FrameReady:
        events.push_back(LoopEvent::FrameReady);
        break;
      case SurfaceEvent::Type::BufferReleased:
        events.push_back(LoopEvent::BufferReleased);
        break;
      case SurfaceEvent::Type::Resized:
        events.push_back(LoopEvent::Resized);
        break;
      case SurfaceEvent::Type::Closed:
        events.push_back(LoopEvent::Closed);
        break;
    }
  }

  if (!inputSlot.has_value()) {
    return;
  }
  auto status = poller.status(*inputSlot);
  if (status.failed) {
    logger->warn("libinput descriptor reported an error");
    input->disable();
    poller.disable(*inputSlot);
    inputSlot.reset();
    return;
  }
  if (status.readable && input->pump()) {
    events.push_back(LoopEvent::DeviceEvent);
  }
}

void
Engine::handle(LoopEvent event)
{
  switch (event) {
    case LoopEvent::DeviceEvent:
      surface->scheduler().markDirty();
      break;
    case LoopEvent::FrameReady:
      logger->trace("frame done");
      break;
    case LoopEvent::BufferReleased:
      break;
    case LoopEvent::Resized:
      logger->info("surface resized to {}x{}", surface->width(), surface->height());
      surface->scheduler().markDirty();
      break;
    case LoopEvent::Closed:
      closing = true;
      break;
  }
}

void
Engine::presentIfNeeded()
{
  if (closing || !surface->scheduler().canPresent()) {
    return;
  }
  surface->present([this](const RenderTarget& target) {
    renderer->render(target, layout, input->keyState());
  });
}

void
Engine::loop()
{
  logger->info("entering event loop");
  vector<LoopEvent> events;
  while (running() && !closing) {
    presentIfNeeded();
    surface->prepareRead();
    // An interrupted wait leaves every status clear; collect() then only
    // cancels the prepared read and dispatches what was already queued.
    if (!poller.wait()) {
      logger->debug("poll interrupted by a signal");
    }
    events.clear();
    collect(events);
    for (auto event : events) {
      handle(event);
    }
  }
  logger->info(closing ? "surface closed; shutting down" : "stop requested; shutting down");
  surface->shutdown();
}
