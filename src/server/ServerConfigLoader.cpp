#include "ServerConfigLoader.hpp"

namespace ms {
namespace {
void validatePort(const SocketEndpoint& endpoint, const string& name) {
  if (endpoint.port() < 1 || endpoint.port() > 65535) {
    throw std::runtime_error("Invalid " + name + ": " +
                             to_string(endpoint.port()));
  }
}

/**
 * @brief Reads an integer key that fits the int32 config fields.
 * @throws std::runtime_error if the value is not a number or out of range.
 */
int32_t readInt(const CSimpleIniA& ini, const char* section,
                const char* key) {
  long value = ini.GetLongValue(section, key, LONG_MIN);
  if (value == LONG_MIN) {
    throw std::runtime_error(string("Invalid ") + key + ": " +
                             ini.GetValue(section, key, ""));
  }
  if (value < INT32_MIN || value > INT32_MAX) {
    throw std::runtime_error(string("Invalid ") + key + ": " +
                             to_string(value) + " is out of range");
  }
  return int32_t(value);
}

void validatePositive(int value, const string& name) {
  if (value <= 0) {
    throw std::runtime_error("Invalid " + name + ": " + to_string(value));
  }
}
}  // namespace

ServerConfig ServerConfigLoader::defaults() {
  ServerConfig config;
  config.mutable_http_endpoint()->set_port(DEFAULT_HTTP_PORT);
  config.mutable_websocket_endpoint()->set_port(DEFAULT_WEBSOCKET_PORT);
  return config;
}

void ServerConfigLoader::applyIni(const CSimpleIniA& ini,
                                  ServerConfig* config) {
  const char* value;

  if ((value = ini.GetValue("Networking", "http_port", NULL))) {
    config->mutable_http_endpoint()->set_port(
        readInt(ini, "Networking", "http_port"));
  }
  if ((value = ini.GetValue("Networking", "ws_port", NULL))) {
    config->mutable_websocket_endpoint()->set_port(
        readInt(ini, "Networking", "ws_port"));
  }
  if ((value = ini.GetValue("Networking", "bind_ip", NULL))) {
    setBindIp(value, config);
  }

  if ((value = ini.GetValue("Http", "web_root", NULL))) {
    config->set_web_root(value);
  }
  if ((value = ini.GetValue("Http", "default_resource", NULL))) {
    config->set_default_resource(value);
  }

  if ((value = ini.GetValue("Auth", "password", NULL))) {
    config->set_password(value);
  }
  if ((value = ini.GetValue("Auth", "failure_policy", NULL))) {
    config->set_auth_failure_policy(parseFailurePolicy(value));
  }

  if ((value = ini.GetValue("Limits", "max_line_length", NULL))) {
    config->set_max_line_length(readInt(ini, "Limits", "max_line_length"));
  }
  if ((value = ini.GetValue("Limits", "max_frame_size", NULL))) {
    config->set_max_frame_size(readInt(ini, "Limits", "max_frame_size"));
  }
  if ((value = ini.GetValue("Limits", "idle_timeout", NULL))) {
    config->set_idle_timeout(readInt(ini, "Limits", "idle_timeout"));
  }
  if ((value = ini.GetValue("Limits", "session_threads", NULL))) {
    config->set_session_threads(readInt(ini, "Limits", "session_threads"));
  }

  if ((value = ini.GetValue("Peripheral", "path", NULL))) {
    config->set_peripheral_path(value);
  }
  if ((value = ini.GetValue("Peripheral", "initial_state", NULL))) {
    config->set_peripheral_initial_state(
        ini.GetBoolValue("Peripheral", "initial_state", false));
  }
}

void ServerConfigLoader::setBindIp(const string& bindIp,
                                   ServerConfig* config) {
  config->mutable_http_endpoint()->set_name(bindIp);
  config->mutable_websocket_endpoint()->set_name(bindIp);
}

void ServerConfigLoader::validate(const ServerConfig& config) {
  validatePort(config.http_endpoint(), "http port");
  validatePort(config.websocket_endpoint(), "websocket port");
  if (config.http_endpoint().port() == config.websocket_endpoint().port()) {
    throw std::runtime_error("The http and websocket ports must differ");
  }
  if (config.default_resource().empty() ||
      config.default_resource()[0] != '/') {
    throw std::runtime_error("Invalid default resource: " +
                             config.default_resource());
  }
  validatePositive(config.max_line_length(), "max line length");
  validatePositive(config.max_frame_size(), "max frame size");
  validatePositive(config.session_threads(), "session thread count");
  if (config.idle_timeout() < 0) {
    throw std::runtime_error("Invalid idle timeout: " +
                             to_string(config.idle_timeout()));
  }
}

AuthFailurePolicy ServerConfigLoader::parseFailurePolicy(const string& name) {
  string lowered = toLower(trim(name));
  if (lowered == "retry") {
    return AUTH_RETRY;
  }
  if (lowered == "disconnect") {
    return AUTH_DISCONNECT;
  }
  throw std::runtime_error("Unknown auth failure policy: " + name);
}
}  // namespace ms
