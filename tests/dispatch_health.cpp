#include <gtest/gtest.h>
#include <cerrno>

#include "input/LibinputSource.h"

using Change = DispatchHealth::Change;

TEST(DISPATCH_HEALTH, healthyDispatchIsQuiet) {
  DispatchHealth health;
  ASSERT_EQ(health.update(0), Change::None);
  ASSERT_FALSE(health.failing());
}

TEST(DISPATCH_HEALTH, stuckErrorIsReportedOnce) {
  DispatchHealth health;
  ASSERT_EQ(health.update(-EIO), Change::Failed);
  for (int i = 0; i < 10; i++) {
    ASSERT_EQ(health.update(-EIO), Change::None);
  }
  ASSERT_TRUE(health.failing());

  // A different errno is reported on its own.
  ASSERT_EQ(health.update(-ENODEV), Change::Failed);
  ASSERT_EQ(health.update(-ENODEV), Change::None);
}

TEST(DISPATCH_HEALTH, recoveryIsReportedOnce) {
  DispatchHealth health;
  health.update(-EIO);
  ASSERT_EQ(health.update(0), Change::Recovered);
  ASSERT_EQ(health.update(0), Change::None);
  ASSERT_FALSE(health.failing());

  ASSERT_EQ(health.update(-EIO), Change::Failed);
}
