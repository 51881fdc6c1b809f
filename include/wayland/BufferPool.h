#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <utility>
#include <stdexcept>
#include <vector>

#include "logger.h"

struct wl_buffer;

class BufferError : public std::runtime_error
{
public:
  explicit BufferError(const std::string& what)
    : std::runtime_error(what)
  {
  }
};

// One ARGB8888 frame in shared memory, stride = width * 4.
struct ShmBuffer
{
  wl_buffer* buffer = nullptr;
  uint8_t* data = nullptr;
  size_t size = 0;
  int width = 0;
  int height = 0;
  int stride = 0;
};

class BufferAllocator
{
public:
  virtual ~BufferAllocator() = default;
  // Throws BufferError.
  virtual ShmBuffer allocate(int width, int height) = 0;
  virtual void release(const ShmBuffer& buffer) = 0;
};

// A fixed set of buffer slots. A slot is InUse from the commit that hands it
// to the compositor until wl_buffer.release; the client only draws into Free
// slots.
class BufferPool
{
  struct Slot
  {
    ShmBuffer buffer;
    bool inUse = false;
  };

  std::shared_ptr<spdlog::logger> logger;
  BufferAllocator& allocator;
  std::vector<Slot> slots;
  std::optional<std::pair<int, int>> lastGoodSize;
  std::optional<std::pair<int, int>> failedSize;

  void reallocate(Slot& slot, int width, int height);

public:
  static constexpr size_t DEFAULT_SLOTS = 2;

  // Throws std::invalid_argument for fewer than two slots.
  BufferPool(BufferAllocator& allocator, size_t count = DEFAULT_SLOTS);
  ~BufferPool();
  BufferPool(const BufferPool&) = delete;
  BufferPool& operator=(const BufferPool&) = delete;

  // A Free slot holding a buffer of the requested size, reallocated if
  // needed; nullopt when every slot is InUse. If a resize allocation fails
  // the last size that worked is tried once more, so the buffer may be
  // smaller than asked for; later requests for that same size reuse the
  // fallback without another attempt. Throws BufferError when nothing can be
  // allocated.
  std::optional<size_t> acquire(int width, int height);

  const ShmBuffer& at(size_t index) const { return slots.at(index).buffer; }
  void markInUse(size_t index);
  bool isInUse(size_t index) const { return slots.at(index).inUse; }

  // False when the buffer is not one of ours.
  bool markReleased(wl_buffer* buffer);

  void releaseAll();

  size_t size() const { return slots.size(); }
  size_t freeCount() const;
};
