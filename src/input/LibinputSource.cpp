#include "input/LibinputSource.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <libinput.h>
#include <libudev.h>
#include <unistd.h>

using namespace std;

constexpr int OPEN_ATTEMPTS = 3;

static int
open_restricted(const char* path, int flags, void* user_data)
{
  auto source = static_cast<LibinputSource*>(user_data);
  return source->openDevice(path, flags);
}

static void
close_restricted(int fd, void* user_data)
{
  close(fd);
}

static const libinput_interface interface = {
  .open_restricted = open_restricted,
  .close_restricted = close_restricted,
};

DispatchHealth::Change
DispatchHealth::update(int err)
{
  if (err == lastError) {
    return Change::None;
  }
  lastError = err;
  // A different error code counts as a new failure.
  return err == 0 ? Change::Recovered : Change::Failed;
}

LibinputSource::LibinputSource()
{
  logger = makeLogger("Input");
}

LibinputSource::~LibinputSource()
{
  if (li != nullptr) {
    libinput_unref(li);
  }
  if (udev != nullptr) {
    udev_unref(udev);
  }
}

int
LibinputSource::openDevice(const char* path, int flags)
{
  int fd = -1;
  int err = 0;
  for (int attempt = 0; attempt < OPEN_ATTEMPTS; attempt++) {
    fd = ::open(path, flags | O_NONBLOCK | O_CLOEXEC);
    if (fd >= 0) {
      logger->debug("opened input device {}", path);
      return fd;
    }
    err = errno;
    if (err != EINTR) {
      break;
    }
  }

  auto failure = (err == EACCES || err == EPERM) ? OpenFailure::Permission
                                                 : OpenFailure::Other;
  if (reported[path].insert(failure).second) {
    if (failure == OpenFailure::Permission) {
      logger->warn("no permission to open {} ({}); is the user in the "
                   "'input' group?",
                   path,
                   strerror(err));
    } else {
      logger->warn("failed to open {}: {}", path, strerror(err));
    }
  }
  return -err;
}

bool
LibinputSource::open()
{
  udev = udev_new();
  if (udev == nullptr) {
    logger->warn("udev_new failed; input monitoring disabled");
    return false;
  }

  li = libinput_udev_create_context(&interface, this, udev);
  if (li == nullptr) {
    logger->warn("could not create libinput context; input monitoring disabled");
    udev_unref(udev);
    udev = nullptr;
    return false;
  }

  const char* seat = getenv("XDG_SEAT");
  if (seat == nullptr || *seat == '\0') {
    seat = "seat0";
  }
  if (libinput_udev_assign_seat(li, seat) != 0) {
    logger->warn("failed to assign seat {} to libinput; input monitoring "
                 "disabled",
                 seat);
    libinput_unref(li);
    li = nullptr;
    udev_unref(udev);
    udev = nullptr;
    return false;
  }
  logger->info("listening for input on {}", seat);

  // Device-added events are queued during seat assignment. Nothing is held
  // yet, so the drained events carry no key state.
  poll();
  if (keyboards == 0) {
    logger->warn("no accessible keyboard devices; the overlay will never "
                 "highlight keys");
  }
  return true;
}

int
LibinputSource::fd()
{
  return li != nullptr ? libinput_get_fd(li) : -1;
}

void
LibinputSource::handle(libinput_event* event, vector<InputEvent>& out)
{
  auto device = libinput_event_get_device(event);
  switch (libinput_event_get_type(event)) {
    case LIBINPUT_EVENT_DEVICE_ADDED: {
      auto id = nextDeviceId++;
      libinput_device_set_user_data(device,
                                    reinterpret_cast<void*>(uintptr_t(id)));
      if (libinput_device_has_capability(device, LIBINPUT_DEVICE_CAP_KEYBOARD)) {
        keyboards++;
        logger->info("keyboard added: {} (id {})",
                     libinput_device_get_name(device),
                     id);
      }
      break;
    }
    case LIBINPUT_EVENT_DEVICE_REMOVED: {
      auto id = uint32_t(uintptr_t(libinput_device_get_user_data(device)));
      if (libinput_device_has_capability(device, LIBINPUT_DEVICE_CAP_KEYBOARD)) {
        keyboards = keyboards > 0 ? keyboards - 1 : 0;
        logger->info("keyboard removed: {} (id {})",
                     libinput_device_get_name(device),
                     id);
      }
      out.push_back(DeviceRemoved{ id });
      break;
    }
    case LIBINPUT_EVENT_KEYBOARD_KEY: {
      auto keyboard = libinput_event_get_keyboard_event(event);
      RawEvent raw;
      raw.deviceId = uint32_t(uintptr_t(libinput_device_get_user_data(device)));
      raw.code = libinput_event_keyboard_get_key(keyboard);
      raw.value = libinput_event_keyboard_get_key_state(keyboard) ==
                      LIBINPUT_KEY_STATE_PRESSED
                    ? KeyValue::Pressed
                    : KeyValue::Released;
      raw.timestampUsec = libinput_event_keyboard_get_time_usec(keyboard);
      out.push_back(raw);
      break;
    }
    default:
      break;
  }
}

vector<InputEvent>
LibinputSource::poll()
{
  vector<InputEvent> events;
  if (li == nullptr) {
    return events;
  }
  int err = libinput_dispatch(li);
  switch (dispatchHealth.update(err)) {
    case DispatchHealth::Change::Failed:
      logger->error("libinput dispatch failed: {}", strerror(-err));
      break;
    case DispatchHealth::Change::Recovered:
      logger->info("libinput dispatch recovered");
      break;
    case DispatchHealth::Change::None:
      break;
  }
  libinput_event* event;
  while ((event = libinput_get_event(li)) != nullptr) {
    handle(event, events);
    libinput_event_destroy(event);
  }
  return events;
}
