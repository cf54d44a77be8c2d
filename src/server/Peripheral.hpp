#ifndef __MS_PERIPHERAL__
#define __MS_PERIPHERAL__

#include "Headers.hpp"

namespace ms {
/**
 * @brief A binary output (an LED, a relay) shared by every session.
 *
 * Calls are serialized by a single mutex; implementations only provide the
 * raw accessors.
 */
class Peripheral {
 public:
  virtual ~Peripheral() {}

  /**
   * @throws std::runtime_error if the device cannot be driven.
   */
  void setOutput(bool on) {
    lock_guard<std::mutex> guard(peripheralMutex);
    writeOutput(on);
  }

  /**
   * @throws std::runtime_error if the device cannot be read.
   */
  bool readState() {
    lock_guard<std::mutex> guard(peripheralMutex);
    return readOutput();
  }

  virtual string describe() const = 0;

 protected:
  virtual void writeOutput(bool on) = 0;
  virtual bool readOutput() = 0;

  std::mutex peripheralMutex;
};

/** @brief Keeps the output in memory, for hosts without hardware. */
class SimulatedPeripheral : public Peripheral {
 public:
  explicit SimulatedPeripheral(bool initialState = false)
      : state(initialState) {}

  virtual string describe() const { return "simulated output"; }

 protected:
  virtual void writeOutput(bool on) { state = on; }
  virtual bool readOutput() { return state; }

  bool state;
};

/**
 * @brief Drives an output through a sysfs style attribute file, e.g.
 * /sys/class/gpio/gpio2/value or /sys/class/leds/led0/brightness.  Writes
 * "1"/"0"; any non-zero value reads as on.
 */
class FilePeripheral : public Peripheral {
 public:
  explicit FilePeripheral(const string& _path);

  virtual string describe() const { return path; }

 protected:
  virtual void writeOutput(bool on);
  virtual bool readOutput();

  string path;
};

/**
 * @brief Builds the peripheral named by the configuration and applies its
 * initial state.
 */
shared_ptr<Peripheral> createPeripheral(const ServerConfig& config);
}  // namespace ms

#endif  // __MS_PERIPHERAL__
