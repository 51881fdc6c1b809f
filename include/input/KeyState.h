#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <unordered_set>
#include <variant>

class KeycodeTable;
struct LayoutModel;

enum class KeyValue : int
{
  Released = 0,
  Pressed = 1,
  Repeat = 2
};

struct RawEvent
{
  uint32_t deviceId = 0;
  uint32_t code = 0;
  KeyValue value = KeyValue::Released;
  uint64_t timestampUsec = 0;
};

struct DeviceRemoved
{
  uint32_t deviceId = 0;
};

using InputEvent = std::variant<RawEvent, DeviceRemoved>;

// Which symbolic key names are currently held. Absent means released.
class KeyState
{
  std::set<std::string> pressed;

  friend class KeyStateTracker;

public:
  bool isPressed(const std::string& name) const { return pressed.count(name) > 0; }
  size_t pressedCount() const { return pressed.size(); }
  const std::set<std::string>& pressedKeys() const { return pressed; }
};

class KeyStateTracker
{
  const KeycodeTable& keycodes;
  std::unordered_set<std::string> shown;
  KeyState state;
  std::map<uint32_t, std::set<std::string>> heldByDevice;

  bool press(uint32_t deviceId, const std::string& name);
  bool release(uint32_t deviceId, const std::string& name);

public:
  // Only names that some mapped key of the layout displays are tracked.
  KeyStateTracker(const KeycodeTable& keycodes, const LayoutModel& layout);

  // True when the set of pressed names changed.
  bool apply(const InputEvent& event);

  const KeyState& current() const { return state; }
};
