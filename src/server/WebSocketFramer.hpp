#ifndef __MS_WEBSOCKET_FRAMER__
#define __MS_WEBSOCKET_FRAMER__

#include "Headers.hpp"
#include "HttpRequest.hpp"
#include "HttpResponder.hpp"
#include "ServerErrors.hpp"
#include "SocketHandler.hpp"

namespace ms {
enum class WebSocketOpcode : uint8_t {
  CONTINUATION = 0x0,
  TEXT = 0x1,
  BINARY = 0x2,
  CLOSE = 0x8,
  PING = 0x9,
  PONG = 0xA,
};

struct WebSocketFrame {
  bool fin = true;
  WebSocketOpcode opcode = WebSocketOpcode::TEXT;
  bool masked = false;
  array<uint8_t, 4> mask = {{0, 0, 0, 0}};
  string payload;
};

/**
 * @brief RFC 6455 opening handshake and frame codec for the subset of the
 * protocol the command server speaks: unfragmented text frames plus the
 * close/ping/pong control frames.
 *
 * Decoding enforces the client-side rules (mask present, FIN set, payload
 * under the configured cap) and reports violations as FrameProtocolError.
 * Encoding produces unmasked server frames.
 */
class WebSocketFramer {
 public:
  explicit WebSocketFramer(uint64_t _maxPayloadLength);

  /** @brief base64(SHA-1(clientKey + GUID)). */
  static string computeAcceptKey(const string& clientKey);

  /** @brief True for the base64 encoding of exactly 16 bytes. */
  static bool isValidClientKey(const string& clientKey);

  /**
   * @brief Validates an upgrade request and builds the 101 response.
   * @throws HandshakeRejectedError when a required header is missing or
   * invalid.
   */
  static HttpResponse acceptHandshake(const HttpRequest& request);

  /**
   * @brief Number of header bytes (including extended length and mask key)
   * announced by the first two bytes of a frame.
   */
  static size_t headerLength(uint8_t firstByte, uint8_t secondByte);

  /**
   * @brief Validates a complete frame header.
   * @param header Exactly headerLength() bytes.
   * @param payloadLength Set to the announced payload length.
   * @return The frame with everything but the payload filled in.
   * @throws FrameProtocolError on any client framing violation.
   */
  WebSocketFrame parseHeader(const string& header,
                             uint64_t* payloadLength) const;

  /** @brief XORs payload with mask[i % 4]; applying it twice is a no-op. */
  static void applyMask(const array<uint8_t, 4>& mask, string* payload);

  /**
   * @brief Decodes one client frame from the front of buffer.
   * @return false if buffer does not yet hold a complete frame.  On success
   * the frame bytes are erased from buffer.
   * @throws FrameProtocolError on any client framing violation.
   */
  bool decode(string* buffer, WebSocketFrame* frame) const;

  /**
   * @brief Reads and unmasks one client frame from a socket.
   * @throws FrameProtocolError on framing violations.
   * @throws std::runtime_error on socket failure, end of stream or timeout.
   */
  WebSocketFrame readFrame(SocketHandler* socketHandler, int fd,
                           int timeoutSeconds) const;

  /** @brief Encodes an unmasked, final server frame. */
  static string encode(WebSocketOpcode opcode, const string& payload);

  /** @brief Encodes a masked, final frame as a client would send it. */
  static string encodeMasked(WebSocketOpcode opcode, const string& payload,
                             const array<uint8_t, 4>& mask);

  /** @brief A server close frame carrying a status code. */
  static string encodeClose(uint16_t code);

  /** @brief Status code of a close payload, 0 when none was sent. */
  static uint16_t parseCloseCode(const string& payload);

  /**
   * @brief The code to answer a client close with.  Codes a peer may not put
   * on the wire (1004-1006, 1015, anything outside 1000-4999) and a missing
   * code become CLOSE_NORMAL.
   */
  static uint16_t echoCloseCode(uint16_t clientCode);

  uint64_t getMaxPayloadLength() const { return maxPayloadLength; }

 protected:
  uint64_t maxPayloadLength;

  static string encodeHeader(WebSocketOpcode opcode, uint64_t length,
                             bool masked);
};
}  // namespace ms

#endif  // __MS_WEBSOCKET_FRAMER__
