#include <gtest/gtest.h>
#include "fakeit.hpp"
#include <cstdint>

#include "wayland/BufferPool.h"

using namespace fakeit;

namespace {

// The pool never dereferences wl_buffer, so distinct addresses are enough.
wl_buffer*
fakeBuffer(uintptr_t id)
{
  return reinterpret_cast<wl_buffer*>(0x1000 + id * 0x10);
}

void
allocateFakes(Mock<BufferAllocator>& allocator, int& allocations, int maxWidth = 1 << 16)
{
  When(Method(allocator, allocate)).AlwaysDo([&allocations, maxWidth](int w, int h) {
    if (w > maxWidth) {
      throw BufferError("shm pool of " + std::to_string(w) + "x" +
                        std::to_string(h) + " failed");
    }
    ShmBuffer buffer;
    buffer.buffer = fakeBuffer(++allocations);
    buffer.width = w;
    buffer.height = h;
    buffer.stride = w * 4;
    buffer.size = size_t(buffer.stride) * h;
    return buffer;
  });
  Fake(Method(allocator, release));
}

}

TEST(BufferPoolSpec, NeedsAtLeastTwoSlots)
{
  Mock<BufferAllocator> allocator;
  ASSERT_THROW(BufferPool(allocator.get(), 1), std::invalid_argument);
  BufferPool pool(allocator.get());
  ASSERT_EQ(pool.size(), 2u);
  ASSERT_EQ(pool.freeCount(), 2u);
}

TEST(BufferPoolSpec, AlternatesBetweenFreeSlots)
{
  Mock<BufferAllocator> allocator;
  int allocations = 0;
  allocateFakes(allocator, allocations);
  BufferPool pool(allocator.get());

  auto first = pool.acquire(64, 32);
  ASSERT_EQ(first, 0u);
  pool.markInUse(*first);

  auto second = pool.acquire(64, 32);
  ASSERT_EQ(second, 1u);
  pool.markInUse(*second);

  // Both are with the compositor.
  ASSERT_FALSE(pool.acquire(64, 32).has_value());
  ASSERT_EQ(pool.freeCount(), 0u);

  ASSERT_TRUE(pool.markReleased(pool.at(0).buffer));
  ASSERT_FALSE(pool.isInUse(0));
  ASSERT_EQ(pool.acquire(64, 32), 0u);
  ASSERT_EQ(allocations, 2);
}

TEST(BufferPoolSpec, IgnoresForeignReleases)
{
  Mock<BufferAllocator> allocator;
  int allocations = 0;
  allocateFakes(allocator, allocations);
  BufferPool pool(allocator.get());

  pool.markInUse(*pool.acquire(64, 32));
  ASSERT_FALSE(pool.markReleased(fakeBuffer(99)));
  ASSERT_TRUE(pool.isInUse(0));
}

TEST(BufferPoolSpec, ReallocatesOnResize)
{
  Mock<BufferAllocator> allocator;
  int allocations = 0;
  allocateFakes(allocator, allocations);
  BufferPool pool(allocator.get());

  ASSERT_EQ(pool.acquire(64, 32), 0u);
  ASSERT_EQ(pool.acquire(64, 32), 0u);
  ASSERT_EQ(allocations, 1);

  ASSERT_EQ(pool.acquire(128, 64), 0u);
  ASSERT_EQ(pool.at(0).width, 128);
  ASSERT_EQ(pool.at(0).stride, 512);
  ASSERT_EQ(allocations, 2);
  Verify(Method(allocator, release)).Exactly(1);
}

TEST(BufferPoolSpec, FallsBackToLastWorkingSize)
{
  Mock<BufferAllocator> allocator;
  int allocations = 0;
  allocateFakes(allocator, allocations, 100);
  BufferPool pool(allocator.get());

  ASSERT_EQ(pool.acquire(50, 50), 0u);
  auto index = pool.acquire(400, 300);
  ASSERT_EQ(index, 0u);
  ASSERT_EQ(pool.at(0).width, 50);
  ASSERT_EQ(pool.at(0).height, 50);
}

TEST(BufferPoolSpec, KeepsTheFallbackForARepeatedFailingSize)
{
  Mock<BufferAllocator> allocator;
  int allocations = 0;
  allocateFakes(allocator, allocations, 100);
  BufferPool pool(allocator.get());

  ASSERT_EQ(pool.acquire(50, 50), 0u);
  ASSERT_EQ(pool.acquire(400, 300), 0u);
  Verify(Method(allocator, allocate)).Exactly(3);
  Verify(Method(allocator, release)).Exactly(1);

  for (int frame = 0; frame < 5; frame++) {
    ASSERT_EQ(pool.acquire(400, 300), 0u);
    ASSERT_EQ(pool.at(0).width, 50);
  }
  Verify(Method(allocator, allocate)).Exactly(3);
  Verify(Method(allocator, release)).Exactly(1);
  ASSERT_EQ(allocations, 2);

  // A new configure size is tried again.
  ASSERT_EQ(pool.acquire(80, 40), 0u);
  ASSERT_EQ(pool.at(0).width, 80);
  ASSERT_EQ(allocations, 3);
}

TEST(BufferPoolSpec, FirstFailureIsFatal)
{
  Mock<BufferAllocator> allocator;
  int allocations = 0;
  allocateFakes(allocator, allocations, 100);
  BufferPool pool(allocator.get());

  ASSERT_THROW(pool.acquire(400, 300), BufferError);
}

TEST(BufferPoolSpec, DestructionReleasesEveryBuffer)
{
  Mock<BufferAllocator> allocator;
  int allocations = 0;
  allocateFakes(allocator, allocations);
  {
    BufferPool pool(allocator.get(), 3);
    pool.markInUse(*pool.acquire(10, 10));
    pool.markInUse(*pool.acquire(10, 10));
  }
  Verify(Method(allocator, release)).Exactly(2);
}
