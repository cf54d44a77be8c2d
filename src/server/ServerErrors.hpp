#ifndef __MS_SERVER_ERRORS__
#define __MS_SERVER_ERRORS__

#include "Headers.hpp"

namespace ms {
// WebSocket close status codes, RFC 6455 section 7.4.1
const uint16_t CLOSE_NORMAL = 1000;
const uint16_t CLOSE_PROTOCOL_ERROR = 1002;
const uint16_t CLOSE_POLICY_VIOLATION = 1008;

/** @brief The HTTP request line or header block could not be parsed. */
class MalformedRequestError : public std::runtime_error {
 public:
  explicit MalformedRequestError(const string& what)
      : std::runtime_error(what) {}
};

/** @brief The opening handshake lacks a usable upgrade request. */
class HandshakeRejectedError : public std::runtime_error {
 public:
  explicit HandshakeRejectedError(const string& what)
      : std::runtime_error(what) {}
};

/**
 * @brief A client broke the framing rules.  The session answers with a close
 * frame carrying closeCode and terminates.
 */
class FrameProtocolError : public std::runtime_error {
 public:
  explicit FrameProtocolError(const string& what,
                              uint16_t _closeCode = CLOSE_PROTOCOL_ERROR)
      : std::runtime_error(what), closeCode(_closeCode) {}

  uint16_t getCloseCode() const { return closeCode; }

 protected:
  uint16_t closeCode;
};

/** @brief Unterminated input grew past the configured line limit. */
class LineTooLongError : public FrameProtocolError {
 public:
  explicit LineTooLongError(const string& what) : FrameProtocolError(what) {}
};
}  // namespace ms

#endif  // __MS_SERVER_ERRORS__
