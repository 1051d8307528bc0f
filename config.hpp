#ifndef CONFIG_HPP
#define CONFIG_HPP

#include "remote_caller.hpp"
#include <optional>
#include <string>

namespace locksmith {

// Client side settings. Keys in YAML: host, port, user, password, timeout,
// log_level. A log_level, when set, is applied by the Locksmith constructor.
struct ClientConfig {
  std::string host = "localhost";
  int port = 33013;
  std::optional<std::string> user;
  std::optional<std::string> password;
  double timeout = 1.0; // seconds per round trip
  std::optional<std::string> log_level;

  // Throws ConfigurationError on an empty host, a port outside 1..65535,
  // a non-positive timeout or an unknown log level.
  void validate() const;

  ConnectionParams connection_params() const;
};

// Reference authority settings. host is the bind address ("*" for all
// interfaces); port 0 binds an ephemeral port.
struct ServerConfig {
  std::string host = "*";
  int port = 33013;
  std::optional<std::string> user;
  std::optional<std::string> password;
  std::string log_level = "info";
  double session_idle_timeout = 30.0; // seconds before an idle worker stops

  // Throws ConfigurationError on a bad endpoint, a password without a user,
  // a non-positive session_idle_timeout or an unknown log level.
  void validate() const;
};

// Both loaders throw ConfigurationError when the file cannot be read or a
// key has the wrong type. The result is validated.
ClientConfig load_client_config(const std::string &path);
ServerConfig load_server_config(const std::string &path);

} // namespace locksmith

#endif
