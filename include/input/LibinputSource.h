#pragma once

#include "input/InputSource.h"

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "logger.h"

struct libinput;
struct libinput_event;
struct udev;

enum class OpenFailure
{
  Permission,
  Other
};

// Tracks libinput_dispatch results so a stuck error is logged once.
class DispatchHealth
{
  int lastError = 0;

public:
  enum class Change
  {
    None,
    Failed,
    Recovered
  };

  // err is libinput_dispatch's return value.
  Change update(int err);
  bool failing() const { return lastError != 0; }
};

// Keyboard transitions from every device on the seat, read through a
// udev-backed libinput context.
class LibinputSource : public InputSource
{
  std::shared_ptr<spdlog::logger> logger;
  struct udev* udev = nullptr;
  struct libinput* li = nullptr;
  uint32_t nextDeviceId = 1;
  size_t keyboards = 0;
  std::map<std::string, std::set<OpenFailure>> reported;
  DispatchHealth dispatchHealth;

  void handle(libinput_event* event, std::vector<InputEvent>& out);

public:
  LibinputSource();
  ~LibinputSource() override;
  LibinputSource(const LibinputSource&) = delete;
  LibinputSource& operator=(const LibinputSource&) = delete;

  // False when the context or seat could not be set up.
  bool open();
  bool isOpen() const { return li != nullptr; }
  size_t keyboardCount() const { return keyboards; }

  std::vector<InputEvent> poll() override;
  int fd() override;

  // Called from libinput's open_restricted hook.
  int openDevice(const char* path, int flags);
};
