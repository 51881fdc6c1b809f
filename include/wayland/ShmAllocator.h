#pragma once

#include "wayland/BufferPool.h"

struct wl_shm;
struct wl_buffer_listener;

// Buffers backed by an anonymous file (memfd, or an unlinked file in
// XDG_RUNTIME_DIR) shared with the compositor through wl_shm.
class ShmAllocator : public BufferAllocator
{
  std::shared_ptr<spdlog::logger> logger;
  wl_shm* shm;
  const wl_buffer_listener* listener;
  void* listenerData;

public:
  // Every allocated wl_buffer gets listener attached with listenerData.
  ShmAllocator(wl_shm* shm, const wl_buffer_listener* listener, void* listenerData);

  ShmBuffer allocate(int width, int height) override;
  void release(const ShmBuffer& buffer) override;
};

// An unlinked, sized file descriptor. Throws BufferError.
int createShmFile(size_t size);
