#include "CommandDispatcher.hpp"

namespace ms {
Command Command::parse(const string& line) {
  Command command;
  command.text = line;
  vector<string> tokens = splitWhitespace(line);
  if (tokens.empty()) {
    return command;
  }
  const string& verb = tokens[0];
  if (verb == "STAT") {
    command.type = CommandType::STAT;
  } else if (verb == "LED_ON") {
    command.type = CommandType::LED_ON;
  } else if (verb == "LED_OFF") {
    command.type = CommandType::LED_OFF;
  }
  return command;
}

CommandDispatcher::CommandDispatcher(shared_ptr<Peripheral> _peripheral)
    : peripheral(_peripheral) {}

bool CommandDispatcher::dispatch(const string& line, string* reply) {
  if (trim(line).empty()) {
    VLOG(2) << "Ignoring blank line";
    return false;
  }
  Command command = Command::parse(line);
  try {
    *reply = execute(command);
  } catch (const std::runtime_error& re) {
    LOG(ERROR) << "Peripheral failure on '" << line << "': " << re.what();
    *reply = string("ERROR: ") + re.what();
  }
  VLOG(1) << "# " << line << " --> " << *reply;
  return true;
}

string CommandDispatcher::execute(const Command& command) {
  switch (command.type) {
    case CommandType::STAT:
      return formatUpdate(peripheral->readState());
    case CommandType::LED_ON:
      peripheral->setOutput(true);
      return formatUpdate(true);
    case CommandType::LED_OFF:
      peripheral->setOutput(false);
      return formatUpdate(false);
    case CommandType::UNRECOGNIZED:
      return "UNKNOWN REQUEST: " + command.text;
  }
  STFATAL << "Unhandled command type: " << int(command.type);
  return "";
}
}  // namespace ms
