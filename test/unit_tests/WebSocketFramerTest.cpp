#include "WebSocketFramer.hpp"

#include "TestHeaders.hpp"

using namespace ms;

namespace {
const array<uint8_t, 4> MASK = {{0x37, 0xfa, 0x21, 0x3d}};

HttpRequest upgradeRequest() {
  return HttpRequest::parse(
      "GET /chat HTTP/1.1\r\n"
      "Host: server.example.com\r\n"
      "Upgrade: websocket\r\n"
      "Connection: Upgrade\r\n"
      "Sec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\n"
      "Sec-WebSocket-Version: 13\r\n"
      "\r\n");
}

string headerOf(const HttpResponse& response, const string& name) {
  for (const auto& it : response.headers) {
    if (it.first == name) {
      return it.second;
    }
  }
  return "";
}
}  // namespace

TEST_CASE("Accept key matches RFC 6455", "[WebSocketFramer]") {
  REQUIRE(WebSocketFramer::computeAcceptKey("dGhlIHNhbXBsZSBub25jZQ==") ==
          "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=");
}

TEST_CASE("Client keys must be 16 base64 bytes", "[WebSocketFramer]") {
  REQUIRE(WebSocketFramer::isValidClientKey("dGhlIHNhbXBsZSBub25jZQ=="));
  REQUIRE_FALSE(WebSocketFramer::isValidClientKey(""));
  REQUIRE_FALSE(WebSocketFramer::isValidClientKey("dGhlIHNhbXBsZQ=="));
  REQUIRE_FALSE(WebSocketFramer::isValidClientKey("dGhlIHNhbXBsZSBub25jZQ!="));
  REQUIRE_FALSE(WebSocketFramer::isValidClientKey("dGhlIHNhbXBsZSBub25jZQ.."));
}

TEST_CASE("Handshake", "[WebSocketFramer]") {
  SECTION("Accepts a valid upgrade") {
    HttpResponse response = WebSocketFramer::acceptHandshake(upgradeRequest());
    REQUIRE(response.code == 101);
    REQUIRE(headerOf(response, "Sec-WebSocket-Accept") ==
            "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=");
    string serialized = response.serialize();
    REQUIRE(serialized.find("HTTP/1.1 101 Switching Protocols\r\n") == 0);
    REQUIRE(serialized.find("Content-Length") == string::npos);
    REQUIRE(endsWith(serialized, "\r\n\r\n"));
  }

  SECTION("Upgrade header is case insensitive") {
    HttpRequest request = upgradeRequest();
    request.headers["upgrade"] = "WebSocket";
    REQUIRE(WebSocketFramer::acceptHandshake(request).code == 101);
  }

  SECTION("Missing key") {
    HttpRequest request = upgradeRequest();
    request.headers.erase("sec-websocket-key");
    REQUIRE_THROWS_AS(WebSocketFramer::acceptHandshake(request),
                      HandshakeRejectedError);
  }

  SECTION("Missing upgrade") {
    HttpRequest request = upgradeRequest();
    request.headers.erase("upgrade");
    REQUIRE_THROWS_AS(WebSocketFramer::acceptHandshake(request),
                      HandshakeRejectedError);
  }

  SECTION("Wrong version") {
    HttpRequest request = upgradeRequest();
    request.headers["sec-websocket-version"] = "8";
    REQUIRE_THROWS_AS(WebSocketFramer::acceptHandshake(request),
                      HandshakeRejectedError);
  }

  SECTION("Wrong method") {
    HttpRequest request = upgradeRequest();
    request.method = "POST";
    REQUIRE_THROWS_AS(WebSocketFramer::acceptHandshake(request),
                      HandshakeRejectedError);
  }
}

TEST_CASE("Decodes masked client frames", "[WebSocketFramer]") {
  WebSocketFramer framer(4096);

  SECTION("Short text frame") {
    string buffer =
        WebSocketFramer::encodeMasked(WebSocketOpcode::TEXT, "STAT\r\n", MASK);
    REQUIRE(buffer.length() == 2 + 4 + 6);
    WebSocketFrame frame;
    REQUIRE(framer.decode(&buffer, &frame));
    REQUIRE(frame.opcode == WebSocketOpcode::TEXT);
    REQUIRE(frame.fin);
    REQUIRE(frame.masked);
    REQUIRE(frame.payload == "STAT\r\n");
    REQUIRE(buffer.empty());
  }

  SECTION("16 bit length") {
    string payload(300, 'x');
    string buffer =
        WebSocketFramer::encodeMasked(WebSocketOpcode::TEXT, payload, MASK);
    REQUIRE(uint8_t(buffer[1]) == (0x80 | 126));
    REQUIRE(buffer.length() == 2 + 2 + 4 + 300);
    WebSocketFrame frame;
    REQUIRE(framer.decode(&buffer, &frame));
    REQUIRE(frame.payload == payload);
  }

  SECTION("64 bit length") {
    WebSocketFramer bigFramer(100000);
    string payload(70000, 'y');
    string buffer =
        WebSocketFramer::encodeMasked(WebSocketOpcode::TEXT, payload, MASK);
    REQUIRE(uint8_t(buffer[1]) == (0x80 | 127));
    REQUIRE(buffer.length() == 2 + 8 + 4 + 70000);
    WebSocketFrame frame;
    REQUIRE(bigFramer.decode(&buffer, &frame));
    REQUIRE(frame.payload == payload);
  }

  SECTION("Incomplete frames wait for more bytes") {
    string whole =
        WebSocketFramer::encodeMasked(WebSocketOpcode::TEXT, "LED_ON", MASK);
    string buffer;
    WebSocketFrame frame;
    for (size_t a = 0; a + 1 < whole.length(); a++) {
      buffer.push_back(whole[a]);
      REQUIRE_FALSE(framer.decode(&buffer, &frame));
    }
    buffer.push_back(whole.back());
    REQUIRE(framer.decode(&buffer, &frame));
    REQUIRE(frame.payload == "LED_ON");
  }

  SECTION("Back to back frames") {
    string buffer =
        WebSocketFramer::encodeMasked(WebSocketOpcode::TEXT, "a", MASK) +
        WebSocketFramer::encodeMasked(WebSocketOpcode::PING, "b", MASK);
    WebSocketFrame frame;
    REQUIRE(framer.decode(&buffer, &frame));
    REQUIRE(frame.payload == "a");
    REQUIRE(framer.decode(&buffer, &frame));
    REQUIRE(frame.opcode == WebSocketOpcode::PING);
    REQUIRE(frame.payload == "b");
    REQUIRE(buffer.empty());
  }
}

TEST_CASE("Rejects frames outside the supported subset",
          "[WebSocketFramer]") {
  WebSocketFramer framer(128);
  WebSocketFrame frame;

  SECTION("Unmasked") {
    string buffer = WebSocketFramer::encode(WebSocketOpcode::TEXT, "STAT");
    REQUIRE_THROWS_AS(framer.decode(&buffer, &frame), FrameProtocolError);
  }

  SECTION("Fragmented") {
    string buffer =
        WebSocketFramer::encodeMasked(WebSocketOpcode::TEXT, "ST", MASK);
    buffer[0] = char(uint8_t(buffer[0]) & 0x7F);
    REQUIRE_THROWS_AS(framer.decode(&buffer, &frame), FrameProtocolError);
  }

  SECTION("Binary") {
    string buffer =
        WebSocketFramer::encodeMasked(WebSocketOpcode::BINARY, "\x01", MASK);
    REQUIRE_THROWS_AS(framer.decode(&buffer, &frame), FrameProtocolError);
  }

  SECTION("Reserved opcode") {
    string buffer =
        WebSocketFramer::encodeMasked(WebSocketOpcode::TEXT, "x", MASK);
    buffer[0] = char(0x80 | 0x3);
    REQUIRE_THROWS_AS(framer.decode(&buffer, &frame), FrameProtocolError);
  }

  SECTION("Reserved bits") {
    string buffer =
        WebSocketFramer::encodeMasked(WebSocketOpcode::TEXT, "x", MASK);
    buffer[0] = char(uint8_t(buffer[0]) | 0x40);
    REQUIRE_THROWS_AS(framer.decode(&buffer, &frame), FrameProtocolError);
  }

  SECTION("Payload over the limit") {
    string buffer = WebSocketFramer::encodeMasked(WebSocketOpcode::TEXT,
                                                  string(129, 'x'), MASK);
    REQUIRE_THROWS_AS(framer.decode(&buffer, &frame), FrameProtocolError);
  }

  SECTION("Oversized control frame") {
    string buffer = WebSocketFramer::encodeMasked(WebSocketOpcode::PING,
                                                  string(126, 'x'), MASK);
    REQUIRE_THROWS_AS(framer.decode(&buffer, &frame), FrameProtocolError);
  }
}

TEST_CASE("Server frames are unmasked", "[WebSocketFramer]") {
  string frame = WebSocketFramer::encode(WebSocketOpcode::TEXT, "UPDATE 1\r\n");
  REQUIRE(uint8_t(frame[0]) == 0x81);
  REQUIRE(uint8_t(frame[1]) == 10);
  REQUIRE(frame.substr(2) == "UPDATE 1\r\n");

  string close = WebSocketFramer::encodeClose(1008);
  REQUIRE(uint8_t(close[0]) == 0x88);
  REQUIRE(uint8_t(close[1]) == 2);
  REQUIRE(WebSocketFramer::parseCloseCode(close.substr(2)) == 1008);
  REQUIRE(WebSocketFramer::parseCloseCode("") == 0);
}

TEST_CASE("Close codes a peer may not send are answered with 1000",
          "[WebSocketFramer]") {
  REQUIRE(WebSocketFramer::echoCloseCode(0) == CLOSE_NORMAL);
  REQUIRE(WebSocketFramer::echoCloseCode(999) == CLOSE_NORMAL);
  REQUIRE(WebSocketFramer::echoCloseCode(1004) == CLOSE_NORMAL);
  REQUIRE(WebSocketFramer::echoCloseCode(1005) == CLOSE_NORMAL);
  REQUIRE(WebSocketFramer::echoCloseCode(1006) == CLOSE_NORMAL);
  REQUIRE(WebSocketFramer::echoCloseCode(1015) == CLOSE_NORMAL);
  REQUIRE(WebSocketFramer::echoCloseCode(5000) == CLOSE_NORMAL);
  REQUIRE(WebSocketFramer::echoCloseCode(65535) == CLOSE_NORMAL);

  REQUIRE(WebSocketFramer::echoCloseCode(1000) == 1000);
  REQUIRE(WebSocketFramer::echoCloseCode(1001) == 1001);
  REQUIRE(WebSocketFramer::echoCloseCode(1008) == 1008);
  REQUIRE(WebSocketFramer::echoCloseCode(4999) == 4999);
}
