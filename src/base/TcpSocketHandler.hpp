#ifndef __MS_TCP_SOCKET_HANDLER__
#define __MS_TCP_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace ms {
/**
 * @brief TCP listeners keyed by port.  An endpoint without a name listens on
 * every local address, one socket per address family.
 */
class TcpSocketHandler : public UnixSocketHandler {
 public:
  virtual ~TcpSocketHandler() {}

  virtual set<int> listen(const SocketEndpoint& endpoint);
  virtual void stopListening(const SocketEndpoint& endpoint);

 protected:
  std::mutex listenersMutex;
  map<int, set<int>> listenersByPort;

  /**
   * @return A listening fd for the address, or -1 if this host cannot create
   * sockets of its family.
   * @throws std::runtime_error if the address cannot be bound.
   */
  int bindListener(const addrinfo* address, const SocketEndpoint& endpoint);
  virtual void configureSocket(int fd);
};
}  // namespace ms

#endif  // __MS_TCP_SOCKET_HANDLER__
