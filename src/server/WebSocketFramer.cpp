#include "WebSocketFramer.hpp"

#include <openssl/sha.h>

namespace ms {
namespace {
const uint8_t FIN_BIT = 0x80;
const uint8_t RSV_BITS = 0x70;
const uint8_t OPCODE_BITS = 0x0F;
const uint8_t MASK_BIT = 0x80;
const uint8_t LENGTH_BITS = 0x7F;
const uint8_t LENGTH_16 = 126;
const uint8_t LENGTH_64 = 127;
const uint64_t MAX_CONTROL_PAYLOAD = 125;

bool isControl(WebSocketOpcode opcode) { return uint8_t(opcode) & 0x08; }
}  // namespace

WebSocketFramer::WebSocketFramer(uint64_t _maxPayloadLength)
    : maxPayloadLength(_maxPayloadLength) {}

string WebSocketFramer::computeAcceptKey(const string& clientKey) {
  string source = clientKey + WEBSOCKET_GUID;
  unsigned char digest[SHA_DIGEST_LENGTH];
  SHA1((const unsigned char*)source.data(), source.length(), digest);
  string encoded;
  if (!Base64::Encode(string((const char*)digest, SHA_DIGEST_LENGTH),
                      &encoded)) {
    STFATAL << "b64 encode failed";
  }
  return encoded;
}

bool WebSocketFramer::isValidClientKey(const string& clientKey) {
  static const string ALPHABET =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  // 16 bytes encode to 22 significant characters plus "=="
  if (clientKey.length() != 24 || !endsWith(clientKey, "==")) {
    return false;
  }
  for (size_t a = 0; a < 22; a++) {
    if (ALPHABET.find(clientKey[a]) == string::npos) {
      return false;
    }
  }
  string decoded;
  return Base64::Decode(clientKey, &decoded) && decoded.length() == 16;
}

HttpResponse WebSocketFramer::acceptHandshake(const HttpRequest& request) {
  if (request.method != "GET") {
    throw HandshakeRejectedError("Upgrade must use GET, got " +
                                 request.method);
  }
  if (toLower(request.getHeader("Upgrade")).find("websocket") ==
      string::npos) {
    throw HandshakeRejectedError("Missing Upgrade: websocket header");
  }
  if (!request.hasHeader("Sec-WebSocket-Key")) {
    throw HandshakeRejectedError("Missing Sec-WebSocket-Key header");
  }
  string clientKey = request.getHeader("Sec-WebSocket-Key");
  if (!isValidClientKey(clientKey)) {
    throw HandshakeRejectedError("Invalid Sec-WebSocket-Key: " + clientKey);
  }
  if (request.hasHeader("Sec-WebSocket-Version") &&
      request.getHeader("Sec-WebSocket-Version") != "13") {
    throw HandshakeRejectedError("Unsupported websocket version: " +
                                 request.getHeader("Sec-WebSocket-Version"));
  }

  HttpResponse response;
  response.version = "HTTP/1.1";
  response.code = 101;
  response.reason = "Switching Protocols";
  response.headers.push_back(make_pair("Upgrade", "websocket"));
  response.headers.push_back(make_pair("Connection", "Upgrade"));
  response.headers.push_back(
      make_pair("Sec-WebSocket-Accept", computeAcceptKey(clientKey)));
  return response;
}

size_t WebSocketFramer::headerLength(uint8_t firstByte, uint8_t secondByte) {
  size_t length = 2;
  uint8_t baseLength = secondByte & LENGTH_BITS;
  if (baseLength == LENGTH_16) {
    length += 2;
  } else if (baseLength == LENGTH_64) {
    length += 8;
  }
  if (secondByte & MASK_BIT) {
    length += 4;
  }
  return length;
}

WebSocketFrame WebSocketFramer::parseHeader(const string& header,
                                            uint64_t* payloadLength) const {
  if (header.length() < 2 ||
      header.length() != headerLength(header[0], header[1])) {
    STFATAL << "Invalid header length: " << header.length();
  }
  const uint8_t* bytes = (const uint8_t*)header.data();
  WebSocketFrame frame;

  if (bytes[0] & RSV_BITS) {
    throw FrameProtocolError("Reserved bits set without a negotiated extension");
  }
  frame.opcode = WebSocketOpcode(bytes[0] & OPCODE_BITS);
  switch (frame.opcode) {
    case WebSocketOpcode::TEXT:
    case WebSocketOpcode::CLOSE:
    case WebSocketOpcode::PING:
    case WebSocketOpcode::PONG:
      break;
    case WebSocketOpcode::CONTINUATION:
      throw FrameProtocolError("Fragmented messages are not supported");
    case WebSocketOpcode::BINARY:
      throw FrameProtocolError("Binary frames are not supported");
    default:
      throw FrameProtocolError("Unknown opcode: " +
                               to_string(int(bytes[0] & OPCODE_BITS)));
  }
  frame.fin = (bytes[0] & FIN_BIT) != 0;
  if (!frame.fin) {
    throw FrameProtocolError("Fragmented messages are not supported");
  }
  frame.masked = (bytes[1] & MASK_BIT) != 0;
  if (!frame.masked) {
    throw FrameProtocolError("Client frame is not masked");
  }

  uint64_t length = bytes[1] & LENGTH_BITS;
  size_t pos = 2;
  if (length == LENGTH_16) {
    length = (uint64_t(bytes[2]) << 8) | uint64_t(bytes[3]);
    pos += 2;
  } else if (length == LENGTH_64) {
    if (bytes[2] & 0x80) {
      throw FrameProtocolError("Most significant length bit must be zero");
    }
    length = 0;
    for (int a = 0; a < 8; a++) {
      length = (length << 8) | uint64_t(bytes[2 + a]);
    }
    pos += 8;
  }
  if (isControl(frame.opcode) && length > MAX_CONTROL_PAYLOAD) {
    throw FrameProtocolError("Control frame payload too long: " +
                             to_string(length));
  }
  if (length > maxPayloadLength) {
    throw FrameProtocolError("Frame payload of " + to_string(length) +
                             " bytes exceeds the limit of " +
                             to_string(maxPayloadLength));
  }
  for (int a = 0; a < 4; a++) {
    frame.mask[a] = bytes[pos + a];
  }
  *payloadLength = length;
  return frame;
}

void WebSocketFramer::applyMask(const array<uint8_t, 4>& mask,
                                string* payload) {
  for (size_t a = 0; a < payload->length(); a++) {
    (*payload)[a] = char(uint8_t((*payload)[a]) ^ mask[a % 4]);
  }
}

bool WebSocketFramer::decode(string* buffer, WebSocketFrame* frame) const {
  if (buffer->length() < 2) {
    return false;
  }
  size_t headerSize = headerLength((*buffer)[0], (*buffer)[1]);
  if (buffer->length() < headerSize) {
    return false;
  }
  uint64_t payloadLength;
  WebSocketFrame decoded =
      parseHeader(buffer->substr(0, headerSize), &payloadLength);
  if (buffer->length() - headerSize < payloadLength) {
    return false;
  }
  decoded.payload = buffer->substr(headerSize, payloadLength);
  applyMask(decoded.mask, &decoded.payload);
  buffer->erase(0, headerSize + payloadLength);
  *frame = decoded;
  return true;
}

WebSocketFrame WebSocketFramer::readFrame(SocketHandler* socketHandler, int fd,
                                          int timeoutSeconds) const {
  string header(2, '\0');
  socketHandler->readAll(fd, &header[0], 2, timeoutSeconds);
  size_t headerSize = headerLength(header[0], header[1]);
  header.resize(headerSize);
  if (headerSize > 2) {
    socketHandler->readAll(fd, &header[2], headerSize - 2, timeoutSeconds);
  }

  uint64_t payloadLength;
  WebSocketFrame frame = parseHeader(header, &payloadLength);
  frame.payload.resize(payloadLength);
  if (payloadLength > 0) {
    socketHandler->readAll(fd, &frame.payload[0], payloadLength,
                           timeoutSeconds);
  }
  applyMask(frame.mask, &frame.payload);
  VLOG(3) << "Read frame with opcode " << int(frame.opcode) << " and "
          << payloadLength << " bytes";
  return frame;
}

string WebSocketFramer::encodeHeader(WebSocketOpcode opcode, uint64_t length,
                                     bool masked) {
  string header;
  header.push_back(char(FIN_BIT | uint8_t(opcode)));
  uint8_t maskBit = masked ? MASK_BIT : 0;
  if (length < LENGTH_16) {
    header.push_back(char(maskBit | uint8_t(length)));
  } else if (length <= 0xFFFF) {
    header.push_back(char(maskBit | LENGTH_16));
    header.push_back(char((length >> 8) & 0xFF));
    header.push_back(char(length & 0xFF));
  } else {
    header.push_back(char(maskBit | LENGTH_64));
    for (int shift = 56; shift >= 0; shift -= 8) {
      header.push_back(char((length >> shift) & 0xFF));
    }
  }
  return header;
}

string WebSocketFramer::encode(WebSocketOpcode opcode, const string& payload) {
  return encodeHeader(opcode, payload.length(), false) + payload;
}

string WebSocketFramer::encodeMasked(WebSocketOpcode opcode,
                                     const string& payload,
                                     const array<uint8_t, 4>& mask) {
  string frame = encodeHeader(opcode, payload.length(), true);
  for (int a = 0; a < 4; a++) {
    frame.push_back(char(mask[a]));
  }
  string maskedPayload = payload;
  applyMask(mask, &maskedPayload);
  return frame + maskedPayload;
}

string WebSocketFramer::encodeClose(uint16_t code) {
  string payload;
  payload.push_back(char((code >> 8) & 0xFF));
  payload.push_back(char(code & 0xFF));
  return encode(WebSocketOpcode::CLOSE, payload);
}

uint16_t WebSocketFramer::parseCloseCode(const string& payload) {
  if (payload.length() < 2) {
    return 0;
  }
  return (uint16_t(uint8_t(payload[0])) << 8) | uint16_t(uint8_t(payload[1]));
}

uint16_t WebSocketFramer::echoCloseCode(uint16_t clientCode) {
  if (clientCode < 1000 || clientCode > 4999) {
    return CLOSE_NORMAL;
  }
  switch (clientCode) {
    case 1004:  // reserved
    case 1005:  // no status received
    case 1006:  // abnormal closure
    case 1015:  // TLS handshake failure
      return CLOSE_NORMAL;
    default:
      return clientCode;
  }
}
}  // namespace ms
