#ifndef __MS_LINE_BUFFER__
#define __MS_LINE_BUFFER__

#include "Headers.hpp"
#include "ServerErrors.hpp"

namespace ms {
// Ctrl-C, the client's request to hang up.
const char INTERRUPT_BYTE = 0x03;

/**
 * @brief Reassembles text payloads of arbitrary size into lines.
 *
 * "\n", "\r" and "\r\n" each end one line, even when the pair is split over
 * two payloads.  An interrupt byte stops the buffer: lines completed before
 * it are still handed out, the rest is dropped.
 */
class LineBuffer {
 public:
  explicit LineBuffer(size_t _maxLineLength);

  /**
   * @throws LineTooLongError when the unterminated tail outgrows
   * maxLineLength.
   */
  void append(const string& data);

  /**
   * @brief Pops the oldest complete line, without its terminator.
   * @return false when no complete line is buffered.
   */
  bool nextLine(string* line);

  bool isInterrupted() const { return interrupted; }

  size_t pendingBytes() const { return partial.length(); }

 protected:
  size_t maxLineLength;
  deque<string> completeLines;
  string partial;
  bool lastWasCarriageReturn;
  bool interrupted;
};
}  // namespace ms

#endif  // __MS_LINE_BUFFER__
