#include "config.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <yaml-cpp/yaml.h>

namespace locksmith {

namespace {

YAML::Node load_file(const std::string &path) {
  try {
    YAML::Node root = YAML::LoadFile(path);
    if (root.IsNull())
      return YAML::Node(YAML::NodeType::Map);
    if (!root.IsMap())
      throw ConfigurationError(path + ": top level must be a mapping");
    return root;
  } catch (const YAML::Exception &e) {
    throw ConfigurationError(path + ": " + e.what());
  }
}

// Reads an optional scalar key, leaving `out` untouched when it is absent.
template <typename T>
void read_key(const YAML::Node &root, const std::string &key, T &out) {
  const YAML::Node node = root[key];
  if (!node)
    return;
  try {
    out = node.as<T>();
  } catch (const YAML::Exception &) {
    throw ConfigurationError("Config key '" + key + "' has the wrong type");
  }
}

template <typename T>
void read_key(const YAML::Node &root, const std::string &key,
              std::optional<T> &out) {
  const YAML::Node node = root[key];
  if (!node || node.IsNull())
    return;
  T value{};
  read_key(root, key, value);
  out = value;
}

void validate_endpoint(const std::string &host, int port, bool allow_zero) {
  if (host.empty())
    throw ConfigurationError("Host and port params must be not empty");
  if (port < (allow_zero ? 0 : 1) || port > 65535)
    throw ConfigurationError("Port must be an integer in 1..65535, got " +
                             std::to_string(port));
}

} // namespace

void ClientConfig::validate() const {
  validate_endpoint(host, port, false);
  if (!(timeout > 0))
    throw ConfigurationError("Timeout must be positive");
  if (log_level)
    parse_log_level(*log_level);
}

ConnectionParams ClientConfig::connection_params() const {
  ConnectionParams params;
  params.host = host;
  params.port = port;
  params.user = user;
  params.password = password;
  params.timeout = timeout;
  return params;
}

void ServerConfig::validate() const {
  validate_endpoint(host, port, true);
  if (password && !user)
    throw ConfigurationError("Password given without a user");
  if (!(session_idle_timeout > 0))
    throw ConfigurationError("Session idle timeout must be positive");
  parse_log_level(log_level);
}

ClientConfig load_client_config(const std::string &path) {
  YAML::Node root = load_file(path);
  ClientConfig config;
  read_key(root, "host", config.host);
  read_key(root, "port", config.port);
  read_key(root, "user", config.user);
  read_key(root, "password", config.password);
  read_key(root, "timeout", config.timeout);
  read_key(root, "log_level", config.log_level);
  config.validate();
  return config;
}

ServerConfig load_server_config(const std::string &path) {
  YAML::Node root = load_file(path);
  ServerConfig config;
  read_key(root, "host", config.host);
  read_key(root, "port", config.port);
  read_key(root, "user", config.user);
  read_key(root, "password", config.password);
  read_key(root, "log_level", config.log_level);
  read_key(root, "session_idle_timeout", config.session_idle_timeout);
  config.validate();
  return config;
}

} // namespace locksmith
