#pragma once

#include <chrono>
#include <cstddef>
#include <vector>

#include <poll.h>

constexpr std::chrono::milliseconds POLL_TIMEOUT(33);

struct PollStatus
{
  bool readable = false;
  // POLLERR, POLLHUP or POLLNVAL.
  bool failed = false;
};

class FdPoller
{
  std::vector<pollfd> fds;

public:
  // Returns the slot index used by status() and disable().
  size_t add(int fd);
  void disable(size_t slot);

  // False when a signal interrupted the wait. Throws std::system_error for
  // any other poll failure.
  bool wait(std::chrono::milliseconds timeout = POLL_TIMEOUT);

  PollStatus status(size_t slot) const;
};
