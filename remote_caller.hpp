#ifndef REMOTE_CALLER_HPP
#define REMOTE_CALLER_HPP

#include "protocol.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace locksmith {

// Everything a channel needs to reach the authority. Fixed once the
// Locksmith is constructed.
struct ConnectionParams {
  std::string host;
  int port = 0;
  std::optional<std::string> user;
  std::optional<std::string> password;
  double timeout = 1.0; // seconds, per round trip
};

// Capability required from a channel: perform a named remote call with
// positional arguments and hand back the reply tuples.
class RemoteCaller {
public:
  virtual ~RemoteCaller() = default;

  // `wait` is how long the authority may hold the call before answering,
  // on top of the round-trip timeout. Protocol::WAIT_FOREVER removes the
  // local bound entirely. Throws NetworkError or RemoteError.
  virtual Protocol::Reply call(const std::string &function,
                               const Protocol::Arguments &args,
                               double wait) = 0;
};

using ConnectionFactory =
    std::function<std::unique_ptr<RemoteCaller>(const ConnectionParams &)>;

// Factory for any RemoteCaller constructible from ConnectionParams.
template <typename Conn> ConnectionFactory connection_factory_for() {
  static_assert(std::is_base_of<RemoteCaller, Conn>::value,
                "Connection type must derive from RemoteCaller");
  static_assert(std::is_constructible<Conn, const ConnectionParams &>::value,
                "Connection type must be constructible from ConnectionParams");
  return [](const ConnectionParams &params) -> std::unique_ptr<RemoteCaller> {
    return std::make_unique<Conn>(params);
  };
}

// Scoped mutual exclusion guarding channel construction. Satisfies
// BasicLockable so it works with std::lock_guard.
class Mutex {
public:
  virtual ~Mutex() = default;
  virtual void lock() = 0;
  virtual void unlock() = 0;
};

template <typename M, typename = void>
struct is_basic_lockable : std::false_type {};

template <typename M>
struct is_basic_lockable<M, std::void_t<decltype(std::declval<M &>().lock()),
                                        decltype(std::declval<M &>().unlock())>>
    : std::true_type {};

// Adapts any BasicLockable type (std::mutex, std::recursive_mutex, a
// spinlock...) to the Mutex interface.
template <typename M> class MutexAdapter : public Mutex {
  static_assert(is_basic_lockable<M>::value,
                "Mutex type must provide lock() and unlock()");

private:
  M mtx;

public:
  void lock() override { mtx.lock(); }
  void unlock() override { mtx.unlock(); }
};

template <typename M> std::shared_ptr<Mutex> make_mutex() {
  return std::make_shared<MutexAdapter<M>>();
}

} // namespace locksmith

#endif
