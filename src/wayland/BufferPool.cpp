#include "wayland/BufferPool.h"

#include <algorithm>
#include <tuple>

using namespace std;

BufferPool::BufferPool(BufferAllocator& allocator, size_t count)
  : allocator(allocator)
{
  if (count < 2) {
    throw invalid_argument("a buffer pool needs at least two buffers");
  }
  logger = makeLogger("Surface");
  slots.resize(count);
}

BufferPool::~BufferPool()
{
  releaseAll();
}

void
BufferPool::reallocate(Slot& slot, int width, int height)
{
  if (slot.buffer.buffer != nullptr) {
    allocator.release(slot.buffer);
    slot.buffer = ShmBuffer{};
  }
  slot.buffer = allocator.allocate(width, height);
  lastGoodSize = make_pair(width, height);
}

optional<size_t>
BufferPool::acquire(int width, int height)
{
  // A size that already failed keeps the fallback until the request changes.
  auto requested = make_pair(width, height);
  if (failedSize == requested && lastGoodSize.has_value()) {
    tie(width, height) = *lastGoodSize;
  } else {
    failedSize.reset();
  }

  optional<size_t> chosen;
  for (size_t i = 0; i < slots.size(); i++) {
    if (slots[i].inUse) {
      continue;
    }
    const auto& buffer = slots[i].buffer;
    if (buffer.buffer != nullptr && buffer.width == width &&
        buffer.height == height) {
      return i;
    }
    if (!chosen.has_value()) {
      chosen = i;
    }
  }
  if (!chosen.has_value()) {
    return nullopt;
  }

  auto& slot = slots[*chosen];
  try {
    reallocate(slot, width, height);
    logger->debug("slot {} now holds a {}x{} buffer", *chosen, width, height);
    return chosen;
  } catch (const BufferError& e) {
    if (!lastGoodSize.has_value() ||
        *lastGoodSize == make_pair(width, height)) {
      logger->error(e.what());
      throw;
    }
    auto [fallbackW, fallbackH] = *lastGoodSize;
    failedSize = requested;
    logger->warn("{}; retrying with the previous size {}x{}",
                 e.what(),
                 fallbackW,
                 fallbackH);
    try {
      reallocate(slot, fallbackW, fallbackH);
    } catch (const BufferError& retry) {
      logger->error(retry.what());
      throw;
    }
    return chosen;
  }
}

void
BufferPool::markInUse(size_t index)
{
  slots.at(index).inUse = true;
}

bool
BufferPool::markReleased(wl_buffer* buffer)
{
  for (auto& slot : slots) {
    if (slot.buffer.buffer == buffer) {
      slot.inUse = false;
      return true;
    }
  }
  return false;
}

void
BufferPool::releaseAll()
{
  for (auto& slot : slots) {
    if (slot.buffer.buffer != nullptr) {
      allocator.release(slot.buffer);
    }
    slot = Slot{};
  }
}

size_t
BufferPool::freeCount() const
{
  return count_if(
    slots.begin(), slots.end(), [](const Slot& slot) { return !slot.inUse; });
}
