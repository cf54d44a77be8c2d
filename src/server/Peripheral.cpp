#include "Peripheral.hpp"

namespace ms {
FilePeripheral::FilePeripheral(const string& _path) : path(_path) {}

void FilePeripheral::writeOutput(bool on) {
  ofstream out(path, ios::out | ios::trunc);
  if (!out.is_open()) {
    throw std::runtime_error("Cannot open " + path + " for writing: " +
                             strerror(GetErrno()));
  }
  out << (on ? "1" : "0") << endl;
  if (!out.good()) {
    throw std::runtime_error("Cannot write to " + path);
  }
}

bool FilePeripheral::readOutput() {
  ifstream in(path);
  if (!in.is_open()) {
    throw std::runtime_error("Cannot open " + path + " for reading: " +
                             strerror(GetErrno()));
  }
  string value;
  in >> value;
  if (value.empty() || value.find_first_not_of("0123456789") != string::npos) {
    throw std::runtime_error("Unexpected value in " + path + ": '" + value +
                             "'");
  }
  return value.find_first_not_of('0') != string::npos;
}

shared_ptr<Peripheral> createPeripheral(const ServerConfig& config) {
  shared_ptr<Peripheral> peripheral;
  if (config.peripheral_path().empty()) {
    peripheral.reset(
        new SimulatedPeripheral(config.peripheral_initial_state()));
  } else {
    peripheral.reset(new FilePeripheral(config.peripheral_path()));
    peripheral->setOutput(config.peripheral_initial_state());
  }
  LOG(INFO) << "Controlling " << peripheral->describe();
  return peripheral;
}
}  // namespace ms
