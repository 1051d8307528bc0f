#ifndef ZMQ_CONNECTION_HPP
#define ZMQ_CONNECTION_HPP

#include "remote_caller.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <zmq.hpp>

namespace locksmith {

// ZmqConnection is the default channel: one ZeroMQ context connected to
// tcp://host:port. REQ sockets are not thread-safe, so every call borrows a
// socket from the idle pool (or opens a new one) and returns it afterwards.
// A socket whose call failed is closed instead, since a REQ socket cannot
// recover from a lost reply.
class ZmqConnection : public RemoteCaller {
private:
  ConnectionParams params;
  std::string endpoint;
  zmq::context_t ctx;
  std::mutex pool_mutex;
  std::vector<std::unique_ptr<zmq::socket_t>> idle; // ZMQ_REQ sockets

  std::unique_ptr<zmq::socket_t> open_socket();
  std::unique_ptr<zmq::socket_t> checkout();
  void checkin(std::unique_ptr<zmq::socket_t> sock);
  int receive_timeout_ms(double wait) const;

public:
  explicit ZmqConnection(const ConnectionParams &params);
  ~ZmqConnection() override;

  ZmqConnection(const ZmqConnection &) = delete;
  ZmqConnection &operator=(const ZmqConnection &) = delete;

  Protocol::Reply call(const std::string &function,
                       const Protocol::Arguments &args, double wait) override;

  const std::string &address() const { return endpoint; }
};

} // namespace locksmith

#endif
