#include "input/KeyState.h"
#include "KeycodeTable.h"
#include "Layout.h"

using namespace std;

KeyStateTracker::KeyStateTracker(const KeycodeTable& keycodes,
                                 const LayoutModel& layout)
  : keycodes(keycodes)
{
  for (const auto& key : layout.keys) {
    if (key.mapped()) {
      shown.insert(key.name);
    }
  }
}

bool
KeyStateTracker::press(uint32_t deviceId, const string& name)
{
  heldByDevice[deviceId].insert(name);
  return state.pressed.insert(name).second;
}

bool
KeyStateTracker::release(uint32_t deviceId, const string& name)
{
  auto device = heldByDevice.find(deviceId);
  if (device != heldByDevice.end()) {
    device->second.erase(name);
  }
  return state.pressed.erase(name) > 0;
}

bool
KeyStateTracker::apply(const InputEvent& event)
{
  if (auto removed = get_if<DeviceRemoved>(&event)) {
    auto device = heldByDevice.find(removed->deviceId);
    if (device == heldByDevice.end()) {
      return false;
    }
    bool changed = false;
    for (const auto& name : device->second) {
      changed = state.pressed.erase(name) > 0 || changed;
    }
    heldByDevice.erase(device);
    return changed;
  }

  const auto& raw = get<RawEvent>(event);
  auto name = keycodes.resolve(raw.code);
  if (!name.has_value() || shown.count(*name) == 0) {
    return false;
  }

  switch (raw.value) {
    case KeyValue::Pressed:
      return press(raw.deviceId, *name);
    case KeyValue::Released:
      return release(raw.deviceId, *name);
    case KeyValue::Repeat:
      break;
  }
  return false;
}
