#include "input/InputPipeline.h"

using namespace std;

InputPipeline::InputPipeline(unique_ptr<InputSource> source,
                             KeyStateTracker tracker)
  : source(std::move(source))
  , tracker(std::move(tracker))
{
  logger = makeLogger("Input");
}

bool
InputPipeline::pump()
{
  if (!source) {
    return false;
  }
  bool changed = false;
  for (const auto& event : source->poll()) {
    if (tracker.apply(event)) {
      changed = true;
    }
  }
  if (changed) {
    logger->trace("key state now has {} pressed keys",
                  tracker.current().pressedCount());
  }
  return changed;
}

void
InputPipeline::disable()
{
  if (source) {
    logger->warn("input source failed; continuing without key highlights");
    source.reset();
  }
}

optional<int>
InputPipeline::fd() const
{
  if (!source || source->fd() < 0) {
    return nullopt;
  }
  return source->fd();
}
