#include "TcpSocketHandler.hpp"

namespace ms {
namespace {
const int LISTEN_BACKLOG = 32;
}

set<int> TcpSocketHandler::listen(const SocketEndpoint &endpoint) {
  lock_guard<std::mutex> guard(listenersMutex);
  int port = endpoint.port();
  if (listenersByPort.find(port) != listenersByPort.end()) {
    STFATAL << "Already listening on port " << port;
  }

  addrinfo hints;
  memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_PASSIVE;
  string service = to_string(port);
  const char *host = endpoint.name().empty() ? NULL : endpoint.name().c_str();

  addrinfo *addresses = NULL;
  int rc = getaddrinfo(host, service.c_str(), &hints, &addresses);
  if (rc != 0) {
    stringstream oss;
    oss << "Cannot resolve " << endpoint << ": " << gai_strerror(rc);
    throw std::runtime_error(oss.str());
  }

  set<int> listeners;
  try {
    for (addrinfo *address = addresses; address != NULL;
         address = address->ai_next) {
      int fd = bindListener(address, endpoint);
      if (fd >= 0) {
        listeners.insert(fd);
      }
    }
  } catch (const std::runtime_error &) {
    for (int fd : listeners) {
      close(fd);
    }
    freeaddrinfo(addresses);
    throw;
  }
  freeaddrinfo(addresses);

  if (listeners.empty()) {
    throw std::runtime_error("No usable address for port " + service);
  }
  LOG(INFO) << "Listening on " << endpoint << " with " << listeners.size()
            << " socket(s)";
  listenersByPort[port] = listeners;
  return listeners;
}

int TcpSocketHandler::bindListener(const addrinfo *address,
                                   const SocketEndpoint &endpoint) {
  int fd = ::socket(address->ai_family, address->ai_socktype,
                    address->ai_protocol);
  if (fd == -1) {
    LOG(INFO) << "Skipping address family " << address->ai_family << ": "
              << strerror(GetErrno());
    return -1;
  }
  int on = 1;
  FATAL_FAIL(setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on)));
  if (address->ai_family == AF_INET6) {
    // The IPv4 address gets its own listener
    FATAL_FAIL(setsockopt(fd, IPPROTO_IPV6, IPV6_V6ONLY, &on, sizeof(on)));
  }
  if (::bind(fd, address->ai_addr, address->ai_addrlen) == -1) {
    string error = "Cannot bind port " + to_string(endpoint.port()) + ": " +
                   strerror(GetErrno());
    LOG(ERROR) << error;
    ::close(fd);
    throw std::runtime_error(error);
  }
  FATAL_FAIL(::listen(fd, LISTEN_BACKLOG));
  UnixSocketHandler::configureSocket(fd);
  track(fd);
  return fd;
}

void TcpSocketHandler::stopListening(const SocketEndpoint &endpoint) {
  lock_guard<std::mutex> guard(listenersMutex);
  auto it = listenersByPort.find(endpoint.port());
  if (it == listenersByPort.end()) {
    STFATAL << "Not listening on port " << endpoint.port();
  }
  for (int fd : it->second) {
    close(fd);
  }
  listenersByPort.erase(it);
  LOG(INFO) << "Stopped listening on " << endpoint;
}

void TcpSocketHandler::configureSocket(int fd) {
  UnixSocketHandler::configureSocket(fd);
  // Replies are single short frames
  int on = 1;
  FATAL_FAIL(setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &on, sizeof(on)));
}
}  // namespace ms
