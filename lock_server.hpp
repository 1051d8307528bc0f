#ifndef LOCK_SERVER_HPP
#define LOCK_SERVER_HPP

#include "authority.hpp"
#include "config.hpp"
#include "session_registry.hpp"
#include <atomic>
#include <cstddef>
#include <memory>
#include <string>
#include <thread>
#include <zmq.hpp>

namespace locksmith {

// LockServer exposes an Authority over ZeroMQ: a ROUTER frontend for
// clients, a ROUTER backend fanning requests out to per-client workers.
// With a user configured, clients must authenticate with ZeroMQ PLAIN.
//
// start() may be called once; stop() (or the destructor) ends it.
class LockServer {
private:
  ServerConfig config;
  zmq::context_t ctx;
  Authority authority;
  SessionRegistry sessions;
  std::unique_ptr<zmq::socket_t> frontend; // clients
  std::unique_ptr<zmq::socket_t> backend;  // workers
  std::unique_ptr<zmq::socket_t> zap;      // ZeroMQ authentication handler
  std::thread router_thread;
  std::thread zap_thread;
  std::atomic<bool> running{false};
  int bound_port = 0;

  void run();
  void authenticate();

public:
  explicit LockServer(const ServerConfig &config);
  ~LockServer();

  LockServer(const LockServer &) = delete;
  LockServer &operator=(const LockServer &) = delete;

  // Binds and starts serving in the background. Throws NetworkError when
  // the address cannot be bound.
  void start();
  void stop();

  bool is_running() const { return running.load(); }

  // Actual port, useful when the config asked for port 0.
  int port() const { return bound_port; }

  // Live per-client worker sessions. Idle ones are reaped after
  // session_idle_timeout.
  std::size_t session_count() const { return sessions.size(); }

  Authority &lock_authority() { return authority; }
};

} // namespace locksmith

#endif
