#include "FdPoller.h"

#include <cerrno>
#include <system_error>

using namespace std;

size_t
FdPoller::add(int fd)
{
  fds.push_back({ fd, POLLIN, 0 });
  return fds.size() - 1;
}

void
FdPoller::disable(size_t slot)
{
  // poll() skips negative descriptors.
  fds.at(slot).fd = -1;
  fds.at(slot).revents = 0;
}

bool
FdPoller::wait(chrono::milliseconds timeout)
{
  for (auto& fd : fds) {
    fd.revents = 0;
  }
  int ret = poll(fds.data(), fds.size(), static_cast<int>(timeout.count()));
  if (ret < 0) {
    if (errno == EINTR) {
      return false;
    }
    throw system_error(errno, generic_category(), "poll");
  }
  return true;
}

PollStatus
FdPoller::status(size_t slot) const
{
  const auto& fd = fds.at(slot);
  PollStatus result;
  result.readable = (fd.revents & POLLIN) != 0;
  result.failed = (fd.revents & (POLLERR | POLLHUP | POLLNVAL)) != 0;
  return result;
}
