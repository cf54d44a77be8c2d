#include "WebSocketSession.hpp"

#include "LogHandler.hpp"

namespace ms {
WebSocketSession::WebSocketSession(shared_ptr<SocketHandler> _socketHandler,
                                   int _socketFd, const ServerConfig& config,
                                   shared_ptr<Peripheral> peripheral)
    : socketHandler(_socketHandler),
      socketFd(_socketFd),
      id(sole::uuid4().str().substr(0, 8)),
      idleTimeout(config.idle_timeout()),
      framer(config.max_frame_size()),
      lineBuffer(config.max_line_length()),
      authGate(config.password(), config.auth_failure_policy()),
      dispatcher(peripheral) {}

void WebSocketSession::run() {
  LogHandler::nameSessionThread(id);
  LOG(INFO) << "Starting websocket session on fd " << socketFd;
  try {
    if (!handshake()) {
      return;
    }
    sendLine(PASSWORD_PROMPT);
    while (true) {
      WebSocketFrame frame =
          framer.readFrame(socketHandler.get(), socketFd, idleTimeout);
      if (!handleFrame(frame)) {
        break;
      }
    }
  } catch (const FrameProtocolError& fpe) {
    LOG(WARNING) << "Protocol error, closing session: " << fpe.what();
    sendClose(fpe.getCloseCode());
  } catch (const std::runtime_error& re) {
    LOG(INFO) << "Session ended: " << re.what();
  }
  LOG(INFO) << "Websocket session finished";
}

bool WebSocketSession::handshake() {
  HttpResponse response;
  try {
    string head = HttpRequest::readHead(socketHandler.get(), socketFd,
                                        MAX_HTTP_HEAD_LENGTH,
                                        HTTP_TRANSFER_TIMEOUT);
    response = WebSocketFramer::acceptHandshake(HttpRequest::parse(head));
  } catch (const MalformedRequestError& mre) {
    LOG(WARNING) << "Rejecting handshake: " << mre.what();
    response = HttpResponse::plainText(400, "Bad Request");
  } catch (const HandshakeRejectedError& hre) {
    LOG(WARNING) << "Rejecting handshake: " << hre.what();
    response = HttpResponse::plainText(400, "Bad Request");
  }
  socketHandler->writeAllOrThrow(socketFd, response.serialize(), true);
  return response.code == 101;
}

bool WebSocketSession::handleFrame(const WebSocketFrame& frame) {
  switch (frame.opcode) {
    case WebSocketOpcode::TEXT:
      lineBuffer.append(frame.payload);
      return processLines();
    case WebSocketOpcode::PING:
      socketHandler->writeAllOrThrow(
          socketFd, WebSocketFramer::encode(WebSocketOpcode::PONG, frame.payload),
          true);
      return true;
    case WebSocketOpcode::PONG:
      return true;
    case WebSocketOpcode::CLOSE: {
      uint16_t code = WebSocketFramer::parseCloseCode(frame.payload);
      LOG(INFO) << "Client closed the session with code " << code;
      sendClose(WebSocketFramer::echoCloseCode(code));
      return false;
    }
    default:
      throw FrameProtocolError("Unexpected opcode " +
                               to_string(int(frame.opcode)));
  }
}

bool WebSocketSession::processLines() {
  string line;
  while (lineBuffer.nextLine(&line)) {
    if (!authGate.isAuthenticated()) {
      switch (authGate.submit(line)) {
        case AuthGate::PASSWORD_ACCEPTED:
          LOG(INFO) << "Session authenticated";
          sendLine(AUTHENTICATED_BANNER);
          break;
        case AuthGate::PASSWORD_RETRY:
          sendLine(PASSWORD_PROMPT);
          break;
        case AuthGate::PASSWORD_DENIED:
          sendClose(CLOSE_POLICY_VIOLATION);
          return false;
      }
      continue;
    }
    string reply;
    if (dispatcher.dispatch(line, &reply)) {
      sendLine(reply);
    }
  }
  if (lineBuffer.isInterrupted()) {
    LOG(INFO) << "Client sent Ctrl-C, disconnecting";
    sendClose(CLOSE_NORMAL);
    return false;
  }
  return true;
}

void WebSocketSession::sendLine(const string& line) {
  VLOG(3) << "Sending line: " << line;
  socketHandler->writeAllOrThrow(
      socketFd, WebSocketFramer::encode(WebSocketOpcode::TEXT, line + "\r\n"),
      true);
}

void WebSocketSession::sendClose(uint16_t code) {
  string frame = WebSocketFramer::encodeClose(code);
  if (socketHandler->writeAllOrReturn(socketFd, frame.data(), frame.length()) !=
      int(frame.length())) {
    VLOG(1) << "Could not deliver close frame with code " << code;
  }
}
}  // namespace ms
