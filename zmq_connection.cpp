#include "zmq_connection.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <cmath>
#include <iterator>
#include <limits>
#include <zmq_addon.hpp>

namespace locksmith {

namespace {

int to_millis(double seconds) {
  double ms = std::ceil(seconds * 1000.0);
  if (ms >= static_cast<double>(std::numeric_limits<int>::max()))
    return std::numeric_limits<int>::max();
  return static_cast<int>(ms);
}

} // namespace

ZmqConnection::ZmqConnection(const ConnectionParams &p)
    : params(p),
      endpoint("tcp://" + p.host + ":" + std::to_string(p.port)), ctx(1) {
  // Open the first socket eagerly so a bad endpoint fails here.
  checkin(open_socket());
  log(LogLevel::DEBUG, "Connected to lock authority at " + endpoint);
}

ZmqConnection::~ZmqConnection() {
  std::lock_guard<std::mutex> guard(pool_mutex);
  idle.clear(); // sockets must close before the context terminates
}

std::unique_ptr<zmq::socket_t> ZmqConnection::open_socket() {
  try {
    auto sock = std::make_unique<zmq::socket_t>(ctx, zmq::socket_type::req);
    sock->set(zmq::sockopt::linger, 0);
    sock->set(zmq::sockopt::sndtimeo, to_millis(params.timeout));
    if (params.user) {
      sock->set(zmq::sockopt::plain_username, *params.user);
      sock->set(zmq::sockopt::plain_password, params.password.value_or(""));
    }
    sock->connect(endpoint);
    return sock;
  } catch (const zmq::error_t &e) {
    throw NetworkError("Cannot open socket to " + endpoint + ": " + e.what());
  }
}

std::unique_ptr<zmq::socket_t> ZmqConnection::checkout() {
  {
    std::lock_guard<std::mutex> guard(pool_mutex);
    if (!idle.empty()) {
      std::unique_ptr<zmq::socket_t> sock = std::move(idle.back());
      idle.pop_back();
      return sock;
    }
  }
  return open_socket();
}

void ZmqConnection::checkin(std::unique_ptr<zmq::socket_t> sock) {
  std::lock_guard<std::mutex> guard(pool_mutex);
  idle.push_back(std::move(sock));
}

int ZmqConnection::receive_timeout_ms(double wait) const {
  if (wait < 0)
    return -1; // block until the authority answers
  return to_millis(params.timeout + wait);
}

// Sends one request and waits synchronously for its reply.
Protocol::Reply ZmqConnection::call(const std::string &function,
                                    const Protocol::Arguments &args,
                                    double wait) {
  Protocol::Frames request = Protocol::CallRequest{function, args}.to_frames();
  std::vector<zmq::const_buffer> out;
  out.reserve(request.size());
  for (const std::string &frame : request)
    out.push_back(zmq::buffer(frame));

  std::unique_ptr<zmq::socket_t> sock = checkout();
  std::vector<zmq::message_t> reply;
  std::string failure;
  try {
    sock->set(zmq::sockopt::rcvtimeo, receive_timeout_ms(wait));
    if (!zmq::send_multipart(*sock, out))
      failure = "timed out sending " + function + " to " + endpoint;
    else if (!zmq::recv_multipart(*sock, std::back_inserter(reply)))
      failure = "no reply to " + function + " from " + endpoint;
  } catch (const zmq::error_t &e) {
    failure = function + " to " + endpoint + " failed: " + e.what();
  }

  if (!failure.empty()) {
    log(LogLevel::DEBUG, "Discarding socket: " + failure);
    throw NetworkError(failure);
  }
  checkin(std::move(sock));

  Protocol::Frames frames;
  frames.reserve(reply.size());
  for (const zmq::message_t &msg : reply)
    frames.push_back(msg.to_string());
  return Protocol::decode_reply(frames);
}

} // namespace locksmith
