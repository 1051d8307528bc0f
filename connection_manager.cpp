#include "connection_manager.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "zmq_connection.hpp"
#include <mutex>
#include <utility>

namespace locksmith {

ConnectionFactory default_connection_factory() {
  return connection_factory_for<ZmqConnection>();
}

ConnectionManager::ConnectionManager(ConnectionParams p)
    : params(std::move(p)), factory(default_connection_factory()),
      mutex(make_mutex<std::mutex>()) {}

// Double-checked: the unlocked load is the fast path once the channel exists.
RemoteCaller &ConnectionManager::connection() {
  RemoteCaller *conn = current.load(std::memory_order_acquire);
  if (conn == nullptr) {
    std::lock_guard<Mutex> guard(*mutex);
    conn = current.load(std::memory_order_relaxed);
    if (conn == nullptr) {
      std::unique_ptr<RemoteCaller> created = factory(params);
      if (!created)
        throw ConfigurationError("Connection factory returned no connection");

      log(LogLevel::DEBUG, "Created channel to " + params.host + ":" +
                               std::to_string(params.port));
      conn = created.get();
      owned = std::move(created);
      current.store(conn, std::memory_order_release);
    }
  }
  return *conn;
}

void ConnectionManager::set_factory(ConnectionFactory f) {
  std::lock_guard<Mutex> guard(*mutex);
  factory = f ? std::move(f) : default_connection_factory();
  current.store(nullptr, std::memory_order_release);
  owned.reset();
}

void ConnectionManager::set_mutex(std::shared_ptr<Mutex> m) {
  mutex = m ? std::move(m) : make_mutex<std::mutex>();
}

} // namespace locksmith
