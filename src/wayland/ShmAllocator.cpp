#include "wayland/ShmAllocator.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <string>
#include <sys/mman.h>
#include <unistd.h>
#include <wayland-client.h>

using namespace std;

static int
openAnonymousFile()
{
#ifdef MFD_CLOEXEC
  int fd = memfd_create("kbdosd-shm", MFD_CLOEXEC);
  if (fd >= 0) {
    return fd;
  }
#endif
  const char* runtimeDir = getenv("XDG_RUNTIME_DIR");
  if (runtimeDir == nullptr || *runtimeDir == '\0') {
    throw BufferError("memfd_create failed and XDG_RUNTIME_DIR is not set");
  }
  string path = string(runtimeDir) + "/kbdosd-shm-XXXXXX";
  int fd = mkostemp(path.data(), O_CLOEXEC);
  if (fd < 0) {
    throw BufferError("mkstemp in " + string(runtimeDir) + " failed: " +
                      strerror(errno));
  }
  unlink(path.c_str());
  return fd;
}

int
createShmFile(size_t size)
{
  int fd = openAnonymousFile();
  int ret;
  do {
    ret = ftruncate(fd, static_cast<off_t>(size));
  } while (ret < 0 && errno == EINTR);
  if (ret < 0) {
    int err = errno;
    close(fd);
    throw BufferError("ftruncate to " + to_string(size) +
                      " bytes failed: " + strerror(err));
  }
  return fd;
}

ShmAllocator::ShmAllocator(wl_shm* shm,
                           const wl_buffer_listener* listener,
                           void* listenerData)
  : shm(shm)
  , listener(listener)
  , listenerData(listenerData)
{
  logger = makeLogger("Surface");
}

ShmBuffer
ShmAllocator::allocate(int width, int height)
{
  if (width <= 0 || height <= 0) {
    throw BufferError("cannot allocate a " + to_string(width) + "x" +
                      to_string(height) + " buffer");
  }
  ShmBuffer result;
  result.width = width;
  result.height = height;
  result.stride = width * 4;
  result.size = static_cast<size_t>(result.stride) * height;

  int fd = createShmFile(result.size);
  void* data = mmap(nullptr, result.size, PROT_READ | PROT_WRITE, MAP_SHARED, fd, 0);
  if (data == MAP_FAILED) {
    int err = errno;
    close(fd);
    throw BufferError("mmap of " + to_string(result.size) +
                      " bytes failed: " + strerror(err));
  }

  auto pool = wl_shm_create_pool(shm, fd, static_cast<int32_t>(result.size));
  result.buffer = wl_shm_pool_create_buffer(
    pool, 0, width, height, result.stride, WL_SHM_FORMAT_ARGB8888);
  wl_shm_pool_destroy(pool);
  close(fd);
  if (result.buffer == nullptr) {
    munmap(data, result.size);
    throw BufferError("wl_shm_pool_create_buffer failed");
  }
  wl_buffer_add_listener(result.buffer, listener, listenerData);
  result.data = static_cast<uint8_t*>(data);
  logger->debug("allocated {}x{} shm buffer ({} bytes)", width, height, result.size);
  return result;
}

void
ShmAllocator::release(const ShmBuffer& buffer)
{
  if (buffer.buffer != nullptr) {
    wl_buffer_destroy(buffer.buffer);
  }
  if (buffer.data != nullptr) {
    munmap(buffer.data, buffer.size);
  }
}
