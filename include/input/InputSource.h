#pragma once

#include "input/KeyState.h"

#include <vector>

// A producer of raw key transitions. poll() never blocks; an empty result is
// not end of stream.
class InputSource
{
public:
  virtual ~InputSource() = default;
  virtual std::vector<InputEvent> poll() = 0;
  // -1 when there is nothing to wait on.
  virtual int fd() = 0;
};
