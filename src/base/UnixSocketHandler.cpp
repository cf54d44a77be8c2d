#include "UnixSocketHandler.hpp"

namespace ms {
bool UnixSocketHandler::waitForData(int fd, int timeoutMs) {
  pollfd pfd;
  pfd.fd = fd;
  pfd.events = POLLIN;
  pfd.revents = 0;
  int rc = ::poll(&pfd, 1, timeoutMs);
  if (rc == -1 && GetErrno() == EINTR) {
    return false;
  }
  FATAL_FAIL(rc);
  // POLLHUP, POLLERR and POLLNVAL also count: the next read reports them
  return rc > 0;
}

ssize_t UnixSocketHandler::read(int fd, void *buf, size_t count) {
  shared_ptr<std::mutex> lock = lockFor(fd);
  if (!lock) {
    VLOG(1) << "Read from a socket that is not open: " << fd;
    errno = EPIPE;
    return -1;
  }
  lock_guard<std::mutex> guard(*lock);
  return ::read(fd, buf, count);
}

ssize_t UnixSocketHandler::write(int fd, const void *buf, size_t count) {
  shared_ptr<std::mutex> lock = lockFor(fd);
  if (!lock) {
    VLOG(1) << "Write to a socket that is not open: " << fd;
    errno = EPIPE;
    return -1;
  }
  lock_guard<std::mutex> guard(*lock);
  return ::send(fd, buf, count, MSG_NOSIGNAL);
}

int UnixSocketHandler::accept(int listenFd) {
  sockaddr_storage peer;
  socklen_t peerLength = sizeof(peer);
  int fd = ::accept(listenFd, (sockaddr *)&peer, &peerLength);
  if (fd == -1) {
    int acceptErrno = GetErrno();
    // The peer may have given up between poll and accept, or we are out of
    // descriptors.  Neither should take the listener down.
    if (acceptErrno != EAGAIN && acceptErrno != EWOULDBLOCK) {
      LOG(WARNING) << "Accept on " << listenFd
                   << " failed: " << strerror(acceptErrno);
    }
    return -1;
  }
  configureSocket(fd);
  track(fd);
  VLOG(3) << "Accepted fd " << fd << " on listener " << listenFd;
  return fd;
}

void UnixSocketHandler::shutdownSocket(int fd) {
  lock_guard<std::mutex> guard(socketsMutex);
  if (socketLocks.find(fd) == socketLocks.end()) {
    VLOG(1) << "Tried to shut down a socket that is not open: " << fd;
    return;
  }
  if (::shutdown(fd, SHUT_RDWR) == -1 && GetErrno() != ENOTCONN) {
    LOG(WARNING) << "Shutdown of " << fd << " failed: " << strerror(GetErrno());
  }
}

void UnixSocketHandler::close(int fd) {
  lock_guard<std::mutex> guard(socketsMutex);
  auto it = socketLocks.find(fd);
  if (it == socketLocks.end()) {
    STERROR << "Tried to close a socket that is not open: " << fd;
    return;
  }
  {
    // Let an in-flight read or write finish first
    lock_guard<std::mutex> ioGuard(*(it->second));
    VLOG(1) << "Closing fd " << fd;
    FATAL_FAIL(::close(fd));
  }
  socketLocks.erase(it);
}

void UnixSocketHandler::track(int fd) {
  lock_guard<std::mutex> guard(socketsMutex);
  if (socketLocks.find(fd) != socketLocks.end()) {
    STFATAL << "fd " << fd << " is already open";
  }
  socketLocks[fd] = shared_ptr<std::mutex>(new std::mutex());
}

shared_ptr<std::mutex> UnixSocketHandler::lockFor(int fd) {
  lock_guard<std::mutex> guard(socketsMutex);
  auto it = socketLocks.find(fd);
  if (it == socketLocks.end()) {
    return shared_ptr<std::mutex>();
  }
  return it->second;
}

void UnixSocketHandler::configureSocket(int fd) {
  int flags = fcntl(fd, F_GETFL);
  FATAL_FAIL(flags);
  FATAL_FAIL(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}
}  // namespace ms
