#include <gtest/gtest.h>
#include <stdexcept>

#include "wayland/FrameScheduler.h"

TEST(FRAME_SCHEDULER, firstFrameIsDue) {
  FrameScheduler scheduler;
  ASSERT_TRUE(scheduler.isDirty());
  ASSERT_FALSE(scheduler.framePending());
  ASSERT_TRUE(scheduler.canPresent());
}

TEST(FRAME_SCHEDULER, waitsForTheFrameCallback) {
  FrameScheduler scheduler;
  scheduler.onCommitted();
  ASSERT_FALSE(scheduler.isDirty());
  ASSERT_TRUE(scheduler.framePending());

  // Changes while a callback is outstanding are held back.
  scheduler.markDirty();
  ASSERT_FALSE(scheduler.canPresent());

  scheduler.onFrameDone();
  ASSERT_TRUE(scheduler.canPresent());
}

TEST(FRAME_SCHEDULER, idleAfterFrameDoneWithoutChanges) {
  FrameScheduler scheduler;
  scheduler.onCommitted();
  scheduler.onFrameDone();
  ASSERT_FALSE(scheduler.canPresent());
}

TEST(FRAME_SCHEDULER, secondCommitWhilePendingIsABug) {
  FrameScheduler scheduler;
  scheduler.onCommitted();
  ASSERT_THROW(scheduler.onCommitted(), std::logic_error);
}

TEST(FRAME_SCHEDULER, resetRedrawsFromScratch) {
  FrameScheduler scheduler;
  scheduler.onCommitted();
  scheduler.reset();
  ASSERT_FALSE(scheduler.framePending());
  ASSERT_TRUE(scheduler.canPresent());
}
