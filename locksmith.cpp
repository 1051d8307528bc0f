#include "locksmith.hpp"
#include "logging.hpp"
#include "responses.hpp"
#include <algorithm>
#include <utility>

namespace locksmith {

namespace {

ClientConfig validated(const ClientConfig &config) {
  config.validate();
  if (config.log_level)
    set_log_level(parse_log_level(*config.log_level));
  return config;
}

ClientConfig make_config(const std::string &host, int port,
                         std::optional<std::string> user,
                         std::optional<std::string> password, double timeout) {
  ClientConfig config;
  config.host = host;
  config.port = port;
  config.user = std::move(user);
  config.password = std::move(password);
  config.timeout = timeout;
  return config;
}

} // namespace

Locksmith::Locksmith(const ClientConfig &cfg)
    : config(validated(cfg)), connections(config.connection_params()) {}

Locksmith::Locksmith(const std::string &host, int port,
                     std::optional<std::string> user,
                     std::optional<std::string> password, double timeout)
    : Locksmith(make_config(host, port, std::move(user), std::move(password),
                            timeout)) {}

std::optional<Lock> Locksmith::acquire(const std::string &name,
                                       double validity,
                                       std::optional<double> timeout) {
  Protocol::Arguments args{name, Protocol::format_number(validity)};
  double wait = Protocol::WAIT_FOREVER;
  if (timeout) {
    args.push_back(Protocol::format_number(*timeout));
    wait = std::max(*timeout, 0.0);
  }

  AcquireResponse response = AcquireResponse::decode(
      connections.connection().call(std::string(Protocol::FN_ACQUIRE), args,
                                    wait));
  if (!response.granted)
    return std::nullopt;
  return Lock(*this, response.name, response.uid);
}

bool Locksmith::update(const std::string &uid, double validity) {
  Protocol::Arguments args{uid, Protocol::format_number(validity)};
  return StatusResponse::decode(connections.connection().call(
                                    std::string(Protocol::FN_UPDATE), args, 0))
      .ok;
}

bool Locksmith::release(const std::string &uid) {
  return StatusResponse::decode(connections.connection().call(
                                    std::string(Protocol::FN_RELEASE), {uid},
                                    0))
      .ok;
}

std::optional<std::string> Locksmith::statistics() {
  return StatisticsResponse::decode(
             connections.connection().call(
                 std::string(Protocol::FN_STATISTICS), {}, 0))
      .stats;
}

void Locksmith::set_connection_factory(ConnectionFactory factory) {
  connections.set_factory(std::move(factory));
}

void Locksmith::set_mutex(std::shared_ptr<Mutex> mutex) {
  connections.set_mutex(std::move(mutex));
}

} // namespace locksmith
