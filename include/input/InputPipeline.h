#pragma once

#include "input/InputSource.h"

#include <memory>
#include <optional>

#include "logger.h"

class InputPipeline
{
  std::shared_ptr<spdlog::logger> logger;
  std::unique_ptr<InputSource> source;
  KeyStateTracker tracker;

public:
  InputPipeline(std::unique_ptr<InputSource> source, KeyStateTracker tracker);

  // Drain the source and apply every event. True when KeyState changed.
  bool pump();

  // Drops the source after an fd error; KeyState keeps its last value.
  void disable();
  bool enabled() const { return source != nullptr; }
  std::optional<int> fd() const;

  const KeyState& keyState() const { return tracker.current(); }
};
