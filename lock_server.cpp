#include "lock_server.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "protocol.hpp"
#include <cerrno>
#include <chrono>
#include <exception>
#include <iterator>
#include <zmq_addon.hpp>

namespace locksmith {

namespace {

constexpr std::chrono::milliseconds POLL_INTERVAL{100};
constexpr const char *ZAP_ENDPOINT = "inproc://zeromq.zap.01";

int port_of(const std::string &endpoint) {
  std::size_t colon = endpoint.rfind(':');
  if (colon == std::string::npos)
    return 0;
  return std::stoi(endpoint.substr(colon + 1));
}

} // namespace

LockServer::LockServer(const ServerConfig &cfg)
    : config(cfg), ctx(1), sessions(&ctx, &authority) {
  config.validate();
}

LockServer::~LockServer() { stop(); }

void LockServer::start() {
  if (running.load())
    return;

  try {
    // The ZAP handler has to be bound before any PLAIN handshake starts.
    if (config.user) {
      zap = std::make_unique<zmq::socket_t>(ctx, zmq::socket_type::rep);
      zap->set(zmq::sockopt::linger, 0);
      zap->bind(ZAP_ENDPOINT);
    }

    frontend = std::make_unique<zmq::socket_t>(ctx, zmq::socket_type::router);
    frontend->set(zmq::sockopt::linger, 0);
    if (config.user)
      frontend->set(zmq::sockopt::plain_server, 1);
    frontend->bind("tcp://" + config.host + ":" +
                   (config.port == 0 ? std::string("*")
                                     : std::to_string(config.port)));
    bound_port = port_of(frontend->get(zmq::sockopt::last_endpoint));

    backend = std::make_unique<zmq::socket_t>(ctx, zmq::socket_type::router);
    backend->set(zmq::sockopt::linger, 0);
    backend->bind("inproc://backend");
  } catch (const zmq::error_t &e) {
    frontend.reset();
    backend.reset();
    zap.reset();
    throw NetworkError("Cannot bind lock server on " + config.host + ":" +
                       std::to_string(config.port) + ": " + e.what());
  }

  running = true;
  if (zap)
    zap_thread = std::thread(&LockServer::authenticate, this);
  router_thread = std::thread(&LockServer::run, this);
  log(LogLevel::INFO,
      "Lock Server started on tcp://" + config.host + ":" +
          std::to_string(bound_port));
}

void LockServer::stop() {
  if (!running.exchange(false))
    return;

  authority.shutdown(); // fail blocked acquires so their workers can reply
  if (router_thread.joinable())
    router_thread.join();

  ctx.shutdown(); // workers and the ZAP handler see ETERM
  sessions.join_all();
  if (zap_thread.joinable())
    zap_thread.join();

  frontend.reset();
  backend.reset();
  zap.reset();
  log(LogLevel::INFO, "Lock Server stopped");
}

void LockServer::run() {
  zmq::pollitem_t items[] = {{frontend->handle(), 0, ZMQ_POLLIN, 0},
                             {backend->handle(), 0, ZMQ_POLLIN, 0}};
  const auto idle_timeout =
      std::chrono::duration_cast<std::chrono::steady_clock::duration>(
          std::chrono::duration<double>(config.session_idle_timeout));
  auto next_reap = std::chrono::steady_clock::now() + POLL_INTERVAL;

  try {
    while (running.load()) {
      zmq::poll(items, 2, POLL_INTERVAL);

      if (std::chrono::steady_clock::now() >= next_reap) {
        sessions.reap_idle(*backend, idle_timeout);
        next_reap = std::chrono::steady_clock::now() + POLL_INTERVAL;
      }

      // Client Request on Frontend: [Client ID | Empty | Payload...]
      if (items[0].revents & ZMQ_POLLIN) {
        MessageFrames request;
        if (zmq::recv_multipart(*frontend, std::back_inserter(request)) &&
            request.size() >= 3) {
          std::string worker_id =
              sessions.get_worker_for_client(request[0].to_string());
          sessions.dispatch(*backend, worker_id, std::move(request));
        }
      }

      // Worker message on Backend: [Worker ID | READY] or
      // [Worker ID | Client ID | Empty | Reply...]
      if (items[1].revents & ZMQ_POLLIN) {
        MessageFrames reply;
        if (!zmq::recv_multipart(*backend, std::back_inserter(reply)))
          continue;

        if (reply.size() == 2 && reply[1].to_string() == Protocol::MSG_READY) {
          sessions.mark_ready(*backend, reply[0].to_string());
        } else if (reply.size() >= 4) {
          sessions.reply_sent(reply[0].to_string());
          // Route final reply back to client: [Client ID | Empty | Reply...]
          for (std::size_t i = 1; i < reply.size(); ++i) {
            frontend->send(reply[i], i + 1 < reply.size()
                                         ? zmq::send_flags::sndmore
                                         : zmq::send_flags::none);
          }
        }
      }
    }
  } catch (const zmq::error_t &e) {
    if (e.num() != ETERM)
      log(LogLevel::ERROR, std::string("Router loop failed: ") + e.what());
  } catch (const std::exception &e) {
    log(LogLevel::ERROR, std::string("Router loop failed: ") + e.what());
  }
}

// ZAP (RFC 27) handler accepting exactly the configured PLAIN credentials.
void LockServer::authenticate() {
  const std::string user = config.user.value_or("");
  const std::string password = config.password.value_or("");

  try {
    while (true) {
      // [version | request id | domain | address | identity | mechanism |
      //  credentials...]
      MessageFrames request;
      if (!zmq::recv_multipart(*zap, std::back_inserter(request)))
        break;

      std::string request_id =
          request.size() > 1 ? request[1].to_string() : std::string();
      bool ok = request.size() >= 8 && request[5].to_string() == "PLAIN" &&
                request[6].to_string() == user &&
                request[7].to_string() == password;
      if (!ok)
        log(LogLevel::WARN, "Rejected client with bad credentials");

      std::vector<std::string> reply{"1.0",
                                     request_id,
                                     ok ? "200" : "400",
                                     ok ? "OK" : "Invalid credentials",
                                     ok ? user : std::string(),
                                     ""};
      std::vector<zmq::const_buffer> out;
      for (const std::string &frame : reply)
        out.push_back(zmq::buffer(frame));
      zmq::send_multipart(*zap, out);
    }
  } catch (const zmq::error_t &e) {
    if (e.num() != ETERM)
      log(LogLevel::ERROR, std::string("Authentication handler failed: ") +
                               e.what());
  } catch (const std::exception &e) {
    log(LogLevel::ERROR,
        std::string("Authentication handler failed: ") + e.what());
  }
}

} // namespace locksmith
