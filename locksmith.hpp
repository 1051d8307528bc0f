#ifndef LOCKSMITH_HPP
#define LOCKSMITH_HPP

#include "config.hpp"
#include "connection_manager.hpp"
#include "lock.hpp"
#include "remote_caller.hpp"
#include <memory>
#include <optional>
#include <string>

namespace locksmith {

// Locksmith is the client of a lock authority. It is safe to share between
// threads: the only shared state is the lazily created channel, and calls
// are forwarded one for one without local queuing or retries.
//
//   locksmith::Locksmith smith(config);
//   if (auto lock = smith.acquire("foo", 60)) {
//     ...
//     lock->release();
//   }
class Locksmith {
private:
  ClientConfig config;
  ConnectionManager connections;

public:
  // Throws ConfigurationError if the config does not validate.
  explicit Locksmith(const ClientConfig &config);
  Locksmith(const std::string &host, int port,
            std::optional<std::string> user = std::nullopt,
            std::optional<std::string> password = std::nullopt,
            double timeout = 1.0);

  // Handles point back here, so the instance stays put.
  Locksmith(const Locksmith &) = delete;
  Locksmith &operator=(const Locksmith &) = delete;

  // Asks for `name` for `validity` seconds.
  //   timeout unset: the authority waits until the lock can be granted.
  //   timeout 0:     a single attempt.
  //   timeout N:     the authority keeps trying for up to N seconds.
  // Returns nothing when the lock stayed taken; that is not an error.
  std::optional<Lock> acquire(const std::string &name, double validity,
                              std::optional<double> timeout = std::nullopt);

  // Extends lease `uid` for `validity` seconds from now. False when the
  // lease is unknown or expired.
  bool update(const std::string &uid, double validity);

  // Frees lease `uid`. False when it is unknown, expired or released.
  bool release(const std::string &uid);

  // Authority statistics, passed through unchanged. Empty when the
  // authority answered nil.
  std::optional<std::string> statistics();

  // Transport substitution. An empty factory restores the ZeroMQ default.
  // The cached channel is dropped and rebuilt on the next call.
  void set_connection_factory(ConnectionFactory factory);

  template <typename Conn> void use_connection_type() {
    set_connection_factory(connection_factory_for<Conn>());
  }

  // Mutex guarding channel construction. nullptr restores std::mutex.
  void set_mutex(std::shared_ptr<Mutex> mutex);

  bool connected() const { return connections.connected(); }

  const ClientConfig &configuration() const { return config; }
  const std::string &host() const { return config.host; }
  int port() const { return config.port; }
  const std::optional<std::string> &user() const { return config.user; }
  double timeout() const { return config.timeout; }
};

} // namespace locksmith

#endif
