#ifndef __MS_WEBSOCKET_SESSION__
#define __MS_WEBSOCKET_SESSION__

#include "AuthGate.hpp"
#include "CommandDispatcher.hpp"
#include "Headers.hpp"
#include "LineBuffer.hpp"
#include "Peripheral.hpp"
#include "SocketHandler.hpp"
#include "WebSocketFramer.hpp"

namespace ms {
/**
 * @brief The command channel of one WebSocket connection.
 *
 * Performs the opening handshake, prompts for the password, then turns
 * every received line into a peripheral command until the client closes,
 * sends Ctrl-C, breaks the protocol or goes idle.  All state lives in the
 * session; only the peripheral is shared.
 */
class WebSocketSession {
 public:
  WebSocketSession(shared_ptr<SocketHandler> _socketHandler, int _socketFd,
                   const ServerConfig& config,
                   shared_ptr<Peripheral> peripheral);

  /**
   * @brief Drives the connection to its end.  Errors are handled and logged
   * here; the descriptor is left open for the owner to release.
   */
  void run();

  const string& getId() const { return id; }

  bool isAuthenticated() const { return authGate.isAuthenticated(); }

 protected:
  shared_ptr<SocketHandler> socketHandler;
  int socketFd;
  string id;
  int idleTimeout;
  WebSocketFramer framer;
  LineBuffer lineBuffer;
  AuthGate authGate;
  CommandDispatcher dispatcher;

  /** @return false if the upgrade was refused. */
  bool handshake();
  /** @return false once the session should end. */
  bool handleFrame(const WebSocketFrame& frame);
  /** @return false once the session should end. */
  bool processLines();

  void sendLine(const string& line);
  void sendClose(uint16_t code);
};
}  // namespace ms

#endif  // __MS_WEBSOCKET_SESSION__
