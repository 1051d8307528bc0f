#include "session_registry.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "protocol.hpp"
#include <cerrno>
#include <exception>
#include <iterator>
#include <zmq_addon.hpp>

namespace locksmith {

// --- Worker Thread Logic ---
// Executes the (possibly blocking) lock table calls for a single client.
void handle_worker_session(zmq::context_t *ctx, std::string session_worker_id,
                           Authority *authority) {
  try {
    zmq::socket_t socket(
        *ctx, zmq::socket_type::dealer); // DEALER connects to the router backend
    socket.set(zmq::sockopt::routing_id, session_worker_id);
    socket.set(zmq::sockopt::linger, 0);
    socket.connect("inproc://backend");

    // Signal main thread that the worker is initialized and ready for routing.
    socket.send(zmq::buffer(Protocol::MSG_READY), zmq::send_flags::none);

    while (true) {
      // Message from the main router: [Client ID | Empty | Payload...]
      MessageFrames frames;
      if (!zmq::recv_multipart(socket, std::back_inserter(frames)))
        break;
      if (frames.size() == 1 && frames[0].size() == 0)
        break; // stop signal
      if (frames.size() < 3)
        continue;

      Protocol::Frames payload;
      for (auto it = frames.begin() + 2; it != frames.end(); ++it)
        payload.push_back(it->to_string());

      Protocol::Frames reply;
      try {
        reply = Protocol::encode_reply(
            authority->handle(Protocol::CallRequest::parse(payload)));
      } catch (const RemoteError &e) {
        log(LogLevel::WARN, session_worker_id + ": " + e.what());
        reply = Protocol::encode_error(e.what());
      }

      // Reply back to the main router: [Client ID | Empty | Reply...]
      socket.send(frames[0], zmq::send_flags::sndmore);
      socket.send(frames[1], zmq::send_flags::sndmore);
      for (std::size_t i = 0; i < reply.size(); ++i) {
        socket.send(zmq::buffer(reply[i]), i + 1 < reply.size()
                                               ? zmq::send_flags::sndmore
                                               : zmq::send_flags::none);
      }
    }
  } catch (const zmq::error_t &e) {
    if (e.num() != ETERM)
      log(LogLevel::ERROR, session_worker_id + ": " + e.what());
  } catch (const std::exception &e) {
    log(LogLevel::ERROR, session_worker_id + " failed: " + e.what());
  }
  log(LogLevel::DEBUG, "Stopped " + session_worker_id);
}

// --- Session Registry Definitions ---
SessionRegistry::SessionRegistry(zmq::context_t *context, Authority *auth)
    : ctx(context), authority(auth) {}

// Ensures every client is consistently handled by the same worker thread
// (affinity).
std::string SessionRegistry::get_worker_for_client(const std::string &client_id) {
  auto found = affinity_map.find(client_id);
  if (found != affinity_map.end())
    return found->second;

  // New Session: Assign ID and spawn thread.
  std::string new_session_worker_id = "worker_" + std::to_string(++worker_seq);
  affinity_map[client_id] = new_session_worker_id;
  pending[new_session_worker_id];

  Session &session = sessions[new_session_worker_id];
  session.client_id = client_id;
  session.last_active = std::chrono::steady_clock::now();
  session.thread = std::thread(handle_worker_session, ctx,
                               new_session_worker_id, authority);
  ++live;
  log(LogLevel::DEBUG, "Started " + new_session_worker_id);
  return new_session_worker_id;
}

void SessionRegistry::send_to_worker(zmq::socket_t &backend,
                                     const std::string &worker_id,
                                     MessageFrames &request) {
  // [Worker ID | Client ID | Empty | Payload...]
  backend.send(zmq::buffer(worker_id), zmq::send_flags::sndmore);
  for (std::size_t i = 0; i < request.size(); ++i) {
    backend.send(request[i], i + 1 < request.size() ? zmq::send_flags::sndmore
                                                    : zmq::send_flags::none);
  }
}

void SessionRegistry::dispatch(zmq::socket_t &backend,
                               const std::string &worker_id,
                               MessageFrames request) {
  auto session = sessions.find(worker_id);
  if (session != sessions.end()) {
    ++session->second.outstanding;
    session->second.last_active = std::chrono::steady_clock::now();
  }

  auto queued = pending.find(worker_id);
  if (queued != pending.end()) {
    queued->second.push_back(std::move(request));
    return;
  }
  send_to_worker(backend, worker_id, request);
}

void SessionRegistry::mark_ready(zmq::socket_t &backend,
                                 const std::string &worker_id) {
  auto queued = pending.find(worker_id);
  if (queued == pending.end())
    return;

  std::vector<MessageFrames> requests = std::move(queued->second);
  pending.erase(queued);
  for (MessageFrames &request : requests)
    send_to_worker(backend, worker_id, request);
}

void SessionRegistry::reply_sent(const std::string &worker_id) {
  auto session = sessions.find(worker_id);
  if (session == sessions.end())
    return;
  if (session->second.outstanding > 0)
    --session->second.outstanding;
  session->second.last_active = std::chrono::steady_clock::now();
}

std::size_t
SessionRegistry::reap_idle(zmq::socket_t &backend,
                           std::chrono::steady_clock::duration idle_timeout) {
  const auto now = std::chrono::steady_clock::now();
  std::size_t reaped = 0;
  for (auto it = sessions.begin(); it != sessions.end();) {
    Session &session = it->second;
    // A worker that has not sent READY is unknown to the backend and would
    // never see the stop frame.
    if (session.outstanding > 0 || pending.count(it->first) ||
        now - session.last_active < idle_timeout) {
      ++it;
      continue;
    }

    // [Worker ID | Empty]
    backend.send(zmq::buffer(it->first), zmq::send_flags::sndmore);
    backend.send(zmq::message_t(), zmq::send_flags::none);
    if (session.thread.joinable())
      session.thread.join();

    affinity_map.erase(session.client_id);
    log(LogLevel::DEBUG, "Reaped idle " + it->first);
    it = sessions.erase(it);
    --live;
    ++reaped;
  }
  return reaped;
}

void SessionRegistry::join_all() {
  for (auto &entry : sessions) {
    if (entry.second.thread.joinable())
      entry.second.thread.join();
  }
  sessions.clear();
  affinity_map.clear();
  pending.clear();
  live = 0;
}

} // namespace locksmith
