#ifndef __MS_COMMAND_DISPATCHER__
#define __MS_COMMAND_DISPATCHER__

#include "Headers.hpp"
#include "Peripheral.hpp"

namespace ms {
enum class CommandType {
  STAT,
  LED_ON,
  LED_OFF,
  UNRECOGNIZED,
};

/** @brief One authenticated line, classified by its first token. */
struct Command {
  CommandType type = CommandType::UNRECOGNIZED;
  string text;

  /** @brief Classifies a line.  Tokens are matched case-sensitively. */
  static Command parse(const string& line);
};

/**
 * @brief Executes commands against the shared peripheral and produces the
 * reply line, if any.
 */
class CommandDispatcher {
 public:
  explicit CommandDispatcher(shared_ptr<Peripheral> _peripheral);

  /**
   * @brief Runs one line.  Peripheral failures are reported in the reply
   * rather than thrown.
   * @param reply Set to the line to send back, without terminator.
   * @return false when there is nothing to send (blank line).
   */
  bool dispatch(const string& line, string* reply);

  static string formatUpdate(bool state) {
    return string("UPDATE ") + (state ? "1" : "0");
  }

 protected:
  shared_ptr<Peripheral> peripheral;

  string execute(const Command& command);
};
}  // namespace ms

#endif  // __MS_COMMAND_DISPATCHER__
