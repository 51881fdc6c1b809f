#pragma once

// Paces presentation on wl_surface.frame. A frame is presented only when the
// content changed and no earlier frame callback is still outstanding.
class FrameScheduler
{
  bool dirty = true;
  bool callbackPending = false;

public:
  void markDirty() { dirty = true; }
  bool isDirty() const { return dirty; }
  bool framePending() const { return callbackPending; }
  bool canPresent() const { return dirty && !callbackPending; }

  // A buffer was committed together with a new frame callback.
  void onCommitted();
  void onFrameDone();

  // The callback was destroyed without firing, e.g. on teardown.
  void reset();
};
