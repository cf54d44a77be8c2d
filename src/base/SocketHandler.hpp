#ifndef __MS_SOCKET_HANDLER__
#define __MS_SOCKET_HANDLER__

#include "Headers.hpp"

namespace ms {
/**
 * @brief The socket operations msserver needs: listening, accepting, and
 * moving bytes over accepted connections with bounded waits.
 *
 * read() and write() are single non-blocking calls with ::read/::write
 * semantics.  readAll() and the writeAll family build complete transfers on
 * top of them.
 */
class SocketHandler {
 public:
  virtual ~SocketHandler() {}

  /** @brief Waits up to timeoutMs for fd to become readable (or hang up). */
  virtual bool waitForData(int fd, int timeoutMs) = 0;
  virtual ssize_t read(int fd, void* buf, size_t count) = 0;
  virtual ssize_t write(int fd, const void* buf, size_t count) = 0;

  /**
   * @brief Reads exactly `count` bytes.
   * @param timeoutSeconds Seconds without progress before giving up, 0 waits
   * forever.
   * @throws std::runtime_error on timeout, error or end of stream.
   */
  void readAll(int fd, void* buf, size_t count, int timeoutSeconds);
  /**
   * @brief Best-effort full write.
   * @return count on success, -1 otherwise.
   */
  int writeAllOrReturn(int fd, const void* buf, size_t count);
  /**
   * @brief Full write.
   * @param timeout Whether a write that stalls for 10 seconds is abandoned.
   * @throws std::runtime_error when the bytes cannot be delivered.
   */
  void writeAllOrThrow(int fd, const void* buf, size_t count, bool timeout);

  inline void writeAllOrThrow(int fd, const string& s, bool timeout) {
    writeAllOrThrow(fd, s.data(), s.length(), timeout);
  }

  /**
   * @brief Starts listening on the endpoint.
   * @return The listening fds, one per resolved address.
   * @throws std::runtime_error if the endpoint cannot be bound.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint) = 0;
  /** @return A new connection on a listening fd, or -1 if none is ready. */
  virtual int accept(int fd) = 0;
  /** @brief Closes every listening fd of the endpoint. */
  virtual void stopListening(const SocketEndpoint& endpoint) = 0;
  /**
   * @brief Shuts down both directions of a connected socket without
   * releasing the descriptor, waking any blocked reader with end of stream.
   */
  virtual void shutdownSocket(int fd) = 0;
  virtual void close(int fd) = 0;

 protected:
  enum WriteStatus { WRITE_DONE, WRITE_STALLED, WRITE_FAILED, WRITE_CLOSED };

  WriteStatus writeAll(int fd, const char* buf, size_t count, bool timeout);
};
}  // namespace ms

#endif  // __MS_SOCKET_HANDLER__
