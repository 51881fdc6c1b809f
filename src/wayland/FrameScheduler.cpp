#include "wayland/FrameScheduler.h"

#include <stdexcept>

void
FrameScheduler::onCommitted()
{
  if (callbackPending) {
    throw std::logic_error("frame committed while a frame callback is pending");
  }
  callbackPending = true;
  dirty = false;
}

void
FrameScheduler::onFrameDone()
{
  callbackPending = false;
}

void
FrameScheduler::reset()
{
  callbackPending = false;
  dirty = true;
}
