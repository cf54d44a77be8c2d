#ifndef __MS_SERVER_CONFIG_LOADER__
#define __MS_SERVER_CONFIG_LOADER__

#include "Headers.hpp"
#include "SimpleIni.h"

namespace ms {
/**
 * @brief Builds a ServerConfig from proto defaults and an INI file.
 *
 * Recognized sections and keys:
 *   [Networking] http_port, ws_port, bind_ip
 *   [Http]       web_root, default_resource
 *   [Auth]       password, failure_policy (retry|disconnect)
 *   [Limits]     max_line_length, max_frame_size, idle_timeout,
 *                session_threads
 *   [Peripheral] path, initial_state
 */
class ServerConfigLoader {
 public:
  /** @brief Proto defaults plus the default ports on every interface. */
  static ServerConfig defaults();

  /**
   * @brief Copies every key present in ini over config.
   * @throws std::runtime_error on an unknown failure policy.
   */
  static void applyIni(const CSimpleIniA& ini, ServerConfig* config);

  /** @brief Sets the bind address of both endpoints. */
  static void setBindIp(const string& bindIp, ServerConfig* config);

  /** @throws std::runtime_error naming the first invalid setting. */
  static void validate(const ServerConfig& config);

  /** @throws std::runtime_error for anything but "retry"/"disconnect". */
  static AuthFailurePolicy parseFailurePolicy(const string& name);
};
}  // namespace ms

#endif  // __MS_SERVER_CONFIG_LOADER__
