#include "LineBuffer.hpp"

namespace ms {
LineBuffer::LineBuffer(size_t _maxLineLength)
    : maxLineLength(_maxLineLength),
      lastWasCarriageReturn(false),
      interrupted(false) {}

void LineBuffer::append(const string& data) {
  for (char c : data) {
    if (interrupted) {
      return;
    }
    if (c == INTERRUPT_BYTE) {
      VLOG(2) << "Interrupt received, dropping " << partial.length()
              << " pending bytes";
      interrupted = true;
      partial.clear();
      return;
    }
    if (c == '\n' && lastWasCarriageReturn) {
      // Second half of "\r\n"
      lastWasCarriageReturn = false;
      continue;
    }
    lastWasCarriageReturn = (c == '\r');
    if (c == '\n' || c == '\r') {
      completeLines.push_back(partial);
      partial.clear();
      continue;
    }
    partial.push_back(c);
    if (partial.length() > maxLineLength) {
      throw LineTooLongError("Line exceeds " + to_string(maxLineLength) +
                             " bytes");
    }
  }
}

bool LineBuffer::nextLine(string* line) {
  if (completeLines.empty()) {
    return false;
  }
  *line = completeLines.front();
  completeLines.pop_front();
  return true;
}
}  // namespace ms
