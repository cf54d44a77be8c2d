#include "LineBuffer.hpp"

#include "TestHeaders.hpp"

using namespace ms;

namespace {
vector<string> drain(LineBuffer* buffer) {
  vector<string> lines;
  string line;
  while (buffer->nextLine(&line)) {
    lines.push_back(line);
  }
  return lines;
}
}  // namespace

TEST_CASE("Splits on every line ending", "[LineBuffer]") {
  LineBuffer buffer(256);
  buffer.append("STAT\r\nLED_ON\nLED_OFF\rSTAT");
  REQUIRE(drain(&buffer) ==
          vector<string>({"STAT", "LED_ON", "LED_OFF"}));
  REQUIRE(buffer.pendingBytes() == 4);
  buffer.append("\r\n");
  REQUIRE(drain(&buffer) == vector<string>({"STAT"}));
  REQUIRE(buffer.pendingBytes() == 0);
}

TEST_CASE("Chunking does not change the lines", "[LineBuffer]") {
  const string input = "LED_ON\r\nSTAT\r\n\r\nLED_OFF\nxyz\r";
  const vector<string> expected = {"LED_ON", "STAT", "", "LED_OFF", "xyz"};

  for (size_t chunkSize = 1; chunkSize <= input.length(); chunkSize++) {
    LineBuffer buffer(256);
    vector<string> lines;
    for (size_t pos = 0; pos < input.length(); pos += chunkSize) {
      buffer.append(input.substr(pos, chunkSize));
      for (const string& line : drain(&buffer)) {
        lines.push_back(line);
      }
    }
    INFO("chunk size " << chunkSize);
    REQUIRE(lines == expected);
  }
}

TEST_CASE("A carriage return split from its newline ends one line",
          "[LineBuffer]") {
  LineBuffer buffer(256);
  buffer.append("STAT\r");
  buffer.append("\nSTAT\n");
  REQUIRE(drain(&buffer) == vector<string>({"STAT", "STAT"}));
}

TEST_CASE("Blank lines are kept", "[LineBuffer]") {
  LineBuffer buffer(256);
  buffer.append("\r\n\n");
  REQUIRE(drain(&buffer) == vector<string>({"", ""}));
}

TEST_CASE("Lines longer than the maximum are rejected", "[LineBuffer]") {
  LineBuffer buffer(8);
  buffer.append("12345678\r\n");
  REQUIRE(drain(&buffer) == vector<string>({"12345678"}));
  buffer.append("1234");
  REQUIRE_THROWS_AS(buffer.append("56789"), LineTooLongError);
}

TEST_CASE("Ctrl-C interrupts the buffer", "[LineBuffer]") {
  LineBuffer buffer(256);
  buffer.append("STAT\r\nLED_");
  REQUIRE_FALSE(buffer.isInterrupted());
  buffer.append(string(1, INTERRUPT_BYTE) + "LED_ON\r\n");
  REQUIRE(buffer.isInterrupted());
  REQUIRE(buffer.pendingBytes() == 0);
  // Lines finished before the interrupt are still delivered
  REQUIRE(drain(&buffer) == vector<string>({"STAT"}));
  buffer.append("STAT\r\n");
  REQUIRE(drain(&buffer).empty());
}
