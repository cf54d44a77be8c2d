#ifndef __MS_UNIX_SOCKET_HANDLER__
#define __MS_UNIX_SOCKET_HANDLER__

#include "SocketHandler.hpp"

namespace ms {
/**
 * @brief POSIX descriptors, non-blocking, with I/O on each descriptor
 * serialized against its close().
 *
 * Only descriptors this handler created or accepted are usable.  Reads and
 * writes on anything else fail with EPIPE.
 */
class UnixSocketHandler : public SocketHandler {
 public:
  virtual ~UnixSocketHandler() {}

  virtual bool waitForData(int fd, int timeoutMs);
  virtual ssize_t read(int fd, void* buf, size_t count);
  virtual ssize_t write(int fd, const void* buf, size_t count);
  virtual int accept(int fd);
  virtual void shutdownSocket(int fd);
  virtual void close(int fd);

 protected:
  void track(int fd);
  /** @return The lock guarding I/O on fd, or null if fd is not open. */
  shared_ptr<std::mutex> lockFor(int fd);
  /** @brief Applied to every accepted socket. */
  virtual void configureSocket(int fd);

  std::mutex socketsMutex;
  map<int, shared_ptr<std::mutex>> socketLocks;
};
}  // namespace ms

#endif  // __MS_UNIX_SOCKET_HANDLER__
