#ifndef CONNECTION_MANAGER_HPP
#define CONNECTION_MANAGER_HPP

#include "remote_caller.hpp"
#include <atomic>
#include <memory>

namespace locksmith {

// Factory for the ZeroMQ channel used when nothing else is configured.
ConnectionFactory default_connection_factory();

// ConnectionManager lazily builds the single channel to the authority.
// Concurrent first callers wait on the mutex and all receive the same
// instance. The mutex covers construction only, never the remote calls.
class ConnectionManager {
private:
  ConnectionParams params;
  ConnectionFactory factory;
  std::shared_ptr<Mutex> mutex;
  std::atomic<RemoteCaller *> current{nullptr};
  std::unique_ptr<RemoteCaller> owned;

public:
  explicit ConnectionManager(ConnectionParams params);

  ConnectionManager(const ConnectionManager &) = delete;
  ConnectionManager &operator=(const ConnectionManager &) = delete;

  // Builds the channel on first use. Throws ConfigurationError when the
  // factory yields nothing; transport errors from the factory pass through.
  RemoteCaller &connection();

  bool connected() const {
    return current.load(std::memory_order_acquire) != nullptr;
  }

  // The setters below are configuration-time operations: they must not
  // race with calls on the same manager.

  // An empty factory restores the ZeroMQ default. Drops the current channel.
  void set_factory(ConnectionFactory f);

  // nullptr restores a std::mutex.
  void set_mutex(std::shared_ptr<Mutex> m);

  const ConnectionParams &parameters() const { return params; }
};

} // namespace locksmith

#endif
