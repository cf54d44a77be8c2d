#include "WebSocketSession.hpp"

#include "SocketPairHandler.hpp"
#include "TestHeaders.hpp"
#include "WebSocketTestClient.hpp"

using namespace ms;

namespace {
/**
 * Runs one session on a worker thread against a scripted client.  Hanging up
 * the client end always lets the session unwind, so teardown can join.
 */
class SessionHarness {
 public:
  explicit SessionHarness(const ServerConfig& config,
                          shared_ptr<Peripheral> _peripheral =
                              shared_ptr<Peripheral>(new SimulatedPeripheral()))
      : socketHandler(new SocketPairHandler()), peripheral(_peripheral) {
    auto fds = socketHandler->createPair();
    serverFd = fds.first;
    clientFd = fds.second;
    client.reset(new WebSocketTestClient(socketHandler, clientFd));
    session.reset(
        new WebSocketSession(socketHandler, serverFd, config, peripheral));
    sessionThread = std::thread([this]() {
      session->run();
      finished = true;
    });
  }

  ~SessionHarness() {
    socketHandler->close(clientFd);
    sessionThread.join();
    socketHandler->close(serverFd);
  }

  /** @brief Completes the handshake and consumes the password prompt. */
  void open() {
    REQUIRE(client->handshake().find("HTTP/1.1 101 Switching Protocols") == 0);
    REQUIRE(client->readText() == "Password:\r\n");
  }

  void waitForFinish() {
    for (int a = 0; a < 1000 && !finished; a++) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    REQUIRE(finished);
  }

  shared_ptr<SocketPairHandler> socketHandler;
  shared_ptr<Peripheral> peripheral;
  int serverFd;
  int clientFd;
  unique_ptr<WebSocketTestClient> client;
  unique_ptr<WebSocketSession> session;
  std::atomic<bool> finished{false};
  std::thread sessionThread;
};

ServerConfig testConfig(const string& password = "",
                        AuthFailurePolicy policy = AUTH_RETRY) {
  ServerConfig config;
  config.set_password(password);
  config.set_auth_failure_policy(policy);
  config.set_idle_timeout(30);
  return config;
}
}  // namespace

TEST_CASE("Console session without a password", "[WebSocketSession]") {
  SessionHarness harness(testConfig());
  harness.open();

  harness.client->sendText("\r\n");
  REQUIRE(harness.client->readText() == "WebREPL\r\n");
  REQUIRE(harness.session->isAuthenticated());

  harness.client->sendText("STAT\r\n");
  REQUIRE(harness.client->readText() == "UPDATE 0\r\n");

  harness.client->sendText("LED_ON\r\n");
  REQUIRE(harness.client->readText() == "UPDATE 1\r\n");
  REQUIRE(harness.peripheral->readState());

  harness.client->sendText("STAT\n");
  REQUIRE(harness.client->readText() == "UPDATE 1\r\n");

  harness.client->sendText("FOO\r\n");
  REQUIRE(harness.client->readText() == "UNKNOWN REQUEST: FOO\r\n");

  // Blank lines get no answer, the next command does
  harness.client->sendText("\r\nLED_OFF\r\n");
  REQUIRE(harness.client->readText() == "UPDATE 0\r\n");
  REQUIRE_FALSE(harness.peripheral->readState());
}

TEST_CASE("Commands may span frames", "[WebSocketSession]") {
  SessionHarness harness(testConfig());
  harness.open();
  harness.client->sendText("\n");
  REQUIRE(harness.client->readText() == "WebREPL\r\n");

  harness.client->sendText("LED_");
  harness.client->sendText("ON\r");
  harness.client->sendText("\nSTAT\r\n");
  REQUIRE(harness.client->readText() == "UPDATE 1\r\n");
  REQUIRE(harness.client->readText() == "UPDATE 1\r\n");
}

TEST_CASE("Ctrl-C ends the session", "[WebSocketSession]") {
  SessionHarness harness(testConfig());
  harness.open();
  harness.client->sendText("\r\n");
  REQUIRE(harness.client->readText() == "WebREPL\r\n");

  harness.client->sendText("STAT\r\n\x03LED_ON\r\n");
  REQUIRE(harness.client->readText() == "UPDATE 0\r\n");
  REQUIRE(harness.client->readClose() == CLOSE_NORMAL);
  harness.waitForFinish();
  REQUIRE_FALSE(harness.peripheral->readState());
}

TEST_CASE("Ctrl-C before the password ends the session",
          "[WebSocketSession]") {
  SessionHarness harness(testConfig("s3cret"));
  harness.open();

  harness.client->sendText("\x03");
  REQUIRE(harness.client->readClose() == CLOSE_NORMAL);
  harness.waitForFinish();
  REQUIRE_FALSE(harness.session->isAuthenticated());
}

TEST_CASE("Idle sessions time out", "[WebSocketSession]") {
  ServerConfig config = testConfig();
  config.set_idle_timeout(1);
  SessionHarness harness(config);
  harness.open();

  // No frames at all after the prompt
  harness.waitForFinish();
  REQUIRE_FALSE(harness.session->isAuthenticated());
}

TEST_CASE("Wrong password with the retry policy", "[WebSocketSession]") {
  SessionHarness harness(testConfig("s3cret", AUTH_RETRY));
  harness.open();

  harness.client->sendText("STAT\r\n");
  REQUIRE(harness.client->readText() == "Password:\r\n");
  REQUIRE_FALSE(harness.session->isAuthenticated());

  harness.client->sendText("s3cret\r\n");
  REQUIRE(harness.client->readText() == "WebREPL\r\n");

  harness.client->sendText("STAT\r\n");
  REQUIRE(harness.client->readText() == "UPDATE 0\r\n");
}

TEST_CASE("Wrong password with the disconnect policy", "[WebSocketSession]") {
  SessionHarness harness(testConfig("s3cret", AUTH_DISCONNECT));
  harness.open();

  harness.client->sendText("LED_ON\r\n");
  REQUIRE(harness.client->readClose() == CLOSE_POLICY_VIOLATION);
  harness.waitForFinish();
  REQUIRE_FALSE(harness.peripheral->readState());
}

TEST_CASE("Ping is answered with pong", "[WebSocketSession]") {
  SessionHarness harness(testConfig());
  harness.open();

  harness.client->sendFrame(WebSocketOpcode::PING, "are you there");
  WebSocketFrame pong = harness.client->readFrame();
  REQUIRE(pong.opcode == WebSocketOpcode::PONG);
  REQUIRE_FALSE(pong.masked);
  REQUIRE(pong.payload == "are you there");
}

TEST_CASE("Close frames are echoed", "[WebSocketSession]") {
  SessionHarness harness(testConfig());
  harness.open();

  string goingAway = WebSocketFramer::encodeClose(1001).substr(2);
  harness.client->sendFrame(WebSocketOpcode::CLOSE, goingAway);
  REQUIRE(harness.client->readClose() == 1001);
  harness.waitForFinish();
}

TEST_CASE("Close codes that cannot be echoed become 1000",
          "[WebSocketSession]") {
  SessionHarness harness(testConfig());
  harness.open();

  string noStatus = WebSocketFramer::encodeClose(1005).substr(2);
  harness.client->sendFrame(WebSocketOpcode::CLOSE, noStatus);
  REQUIRE(harness.client->readClose() == CLOSE_NORMAL);
  harness.waitForFinish();
}

TEST_CASE("Protocol errors close the session", "[WebSocketSession]") {
  SessionHarness harness(testConfig());
  harness.open();

  SECTION("Unmasked frame") {
    harness.client->sendBytes(
        WebSocketFramer::encode(WebSocketOpcode::TEXT, "STAT\r\n"));
  }

  SECTION("Binary frame") {
    harness.client->sendFrame(WebSocketOpcode::BINARY, "STAT\r\n");
  }

  SECTION("Line too long") {
    harness.client->sendText(string(300, 'A'));
  }

  REQUIRE(harness.client->readClose() == CLOSE_PROTOCOL_ERROR);
  harness.waitForFinish();
}

TEST_CASE("Bad handshakes get a 400", "[WebSocketSession]") {
  SessionHarness harness(testConfig());

  string head = harness.client->sendRaw("GET / HTTP/1.1\r\nHost: x\r\n\r\n");
  REQUIRE(head.find("HTTP/1.0 400 Bad Request\r\n") == 0);
  harness.waitForFinish();
}
