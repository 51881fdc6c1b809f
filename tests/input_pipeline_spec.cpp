#include <gtest/gtest.h>
#include "fakeit.hpp"
#include <linux/input-event-codes.h>
#include <memory>
#include <vector>

#include "KeycodeTable.h"
#include "Layout.h"
#include "input/InputPipeline.h"

using namespace fakeit;

namespace {

LayoutModel
singleKeyLayout()
{
  LayoutModel layout;
  KeySpec a;
  a.label = "A";
  a.keycode = KEY_A;
  a.name = "a";
  a.bounds = { 0, 0, 40, 40 };
  layout.keys.push_back(a);
  return layout;
}

RawEvent
press(uint32_t code, KeyValue value = KeyValue::Pressed)
{
  RawEvent event;
  event.deviceId = 1;
  event.code = code;
  event.value = value;
  return event;
}

// The pipeline owns its source; the mock outlives it.
std::unique_ptr<InputSource>
borrow(Mock<InputSource>& mock)
{
  Fake(Dtor(mock));
  return std::unique_ptr<InputSource>(&mock.get());
}

}

TEST(InputPipelineSpec, PumpReportsChangesFromTheDrainedBatch)
{
  auto layout = singleKeyLayout();
  Mock<InputSource> source;
  std::vector<std::vector<InputEvent>> batches = {
    { press(KEY_A), press(KEY_A, KeyValue::Repeat) },
    {},
    { press(KEY_A, KeyValue::Released) },
  };
  size_t call = 0;
  When(Method(source, poll)).AlwaysDo([&]() { return batches.at(call++); });
  When(Method(source, fd)).AlwaysReturn(7);

  InputPipeline pipeline(borrow(source),
                         KeyStateTracker(KeycodeTable::instance(), layout));

  ASSERT_TRUE(pipeline.pump());
  ASSERT_TRUE(pipeline.keyState().isPressed("a"));
  ASSERT_FALSE(pipeline.pump());
  ASSERT_TRUE(pipeline.keyState().isPressed("a"));
  ASSERT_TRUE(pipeline.pump());
  ASSERT_FALSE(pipeline.keyState().isPressed("a"));
  Verify(Method(source, poll)).Exactly(3);
}

TEST(InputPipelineSpec, IgnoredEventsDoNotRequestARedraw)
{
  auto layout = singleKeyLayout();
  Mock<InputSource> source;
  When(Method(source, poll)).AlwaysDo([]() {
    return std::vector<InputEvent>{ press(KEY_Z), press(0xFFFF), DeviceRemoved{ 4 } };
  });
  When(Method(source, fd)).AlwaysReturn(7);

  InputPipeline pipeline(borrow(source),
                         KeyStateTracker(KeycodeTable::instance(), layout));
  ASSERT_FALSE(pipeline.pump());
}

TEST(InputPipelineSpec, DisabledPipelineKeepsLastState)
{
  auto layout = singleKeyLayout();
  Mock<InputSource> source;
  When(Method(source, poll)).AlwaysDo([]() {
    return std::vector<InputEvent>{ press(KEY_A) };
  });
  When(Method(source, fd)).AlwaysReturn(7);

  InputPipeline pipeline(borrow(source),
                         KeyStateTracker(KeycodeTable::instance(), layout));
  ASSERT_EQ(pipeline.fd(), 7);
  ASSERT_TRUE(pipeline.pump());

  pipeline.disable();
  ASSERT_FALSE(pipeline.enabled());
  ASSERT_FALSE(pipeline.fd().has_value());
  ASSERT_FALSE(pipeline.pump());
  ASSERT_TRUE(pipeline.keyState().isPressed("a"));
}

TEST(InputPipelineSpec, RunsWithoutASource)
{
  auto layout = singleKeyLayout();
  InputPipeline pipeline(nullptr, KeyStateTracker(KeycodeTable::instance(), layout));
  ASSERT_FALSE(pipeline.enabled());
  ASSERT_FALSE(pipeline.pump());
  ASSERT_EQ(pipeline.keyState().pressedCount(), 0u);
}
