#include "SocketHandler.hpp"

namespace ms {
namespace {
// Seconds a write may go without progress
const int WRITE_STALL_SECONDS = 10;
// Granularity of the idle checks in readAll
const int READ_POLL_MS = 1000;

bool isTransient(int error) {
  return error == EAGAIN || error == EWOULDBLOCK || error == EINTR;
}
}  // namespace

void SocketHandler::readAll(int fd, void* buf, size_t count,
                            int timeoutSeconds) {
  char* dest = (char*)buf;
  size_t pos = 0;
  time_t lastProgress = time(NULL);
  while (pos < count) {
    if (!waitForData(fd, READ_POLL_MS)) {
      if (timeoutSeconds > 0 && time(NULL) > lastProgress + timeoutSeconds) {
        throw std::runtime_error("No data on fd " + to_string(fd) + " for " +
                                 to_string(timeoutSeconds) + " seconds");
      }
      continue;
    }
    ssize_t bytesRead = read(fd, dest + pos, count - pos);
    if (bytesRead == 0) {
      throw std::runtime_error("Peer closed fd " + to_string(fd));
    }
    if (bytesRead < 0) {
      int readErrno = GetErrno();
      if (isTransient(readErrno)) {
        VLOG(4) << "Spurious wakeup on fd " << fd;
        continue;
      }
      VLOG(1) << "Read on fd " << fd << " failed: " << strerror(readErrno);
      throw std::runtime_error(string("Read failed: ") + strerror(readErrno));
    }
    pos += bytesRead;
    lastProgress = time(NULL);
  }
}

SocketHandler::WriteStatus SocketHandler::writeAll(int fd, const char* buf,
                                                   size_t count, bool timeout) {
  size_t pos = 0;
  time_t lastProgress = time(NULL);
  while (pos < count) {
    ssize_t bytesWritten = write(fd, buf + pos, count - pos);
    if (bytesWritten > 0) {
      pos += bytesWritten;
      lastProgress = time(NULL);
      continue;
    }
    if (bytesWritten == 0) {
      return WRITE_CLOSED;
    }
    int writeErrno = GetErrno();
    if (!isTransient(writeErrno)) {
      VLOG(1) << "Write on fd " << fd << " failed: " << strerror(writeErrno);
      return WRITE_FAILED;
    }
    if (timeout && time(NULL) > lastProgress + WRITE_STALL_SECONDS) {
      return WRITE_STALLED;
    }
    // The peer is not draining its receive buffer
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return WRITE_DONE;
}

int SocketHandler::writeAllOrReturn(int fd, const void* buf, size_t count) {
  if (writeAll(fd, (const char*)buf, count, true) != WRITE_DONE) {
    return -1;
  }
  return int(count);
}

void SocketHandler::writeAllOrThrow(int fd, const void* buf, size_t count,
                                    bool timeout) {
  switch (writeAll(fd, (const char*)buf, count, timeout)) {
    case WRITE_DONE:
      return;
    case WRITE_STALLED:
      throw std::runtime_error("Socket Timeout");
    case WRITE_CLOSED:
      throw std::runtime_error("Socket closed during write");
    case WRITE_FAILED:
      throw std::runtime_error("Write failed");
  }
}
}  // namespace ms
