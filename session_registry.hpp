#ifndef SESSION_REGISTRY_HPP
#define SESSION_REGISTRY_HPP

#include "authority.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include <zmq.hpp>

namespace locksmith {

using MessageFrames = std::vector<zmq::message_t>;

// Runs on a worker thread, answering the calls of one client socket.
// Exits on a single empty frame from the router or when the context is
// shut down.
void handle_worker_session(zmq::context_t *ctx, std::string session_worker_id,
                           Authority *authority);

// SessionRegistry manages the affinity mapping (Client ID -> Worker Thread ID)
// and thread lifecycle. One worker per client socket means a blocking
// acquire only ever stalls its own client.
//
// Only the router thread may call the members, except size().
class SessionRegistry {
private:
  struct Session {
    std::string client_id;
    std::thread thread;
    int outstanding = 0; // requests dispatched but not answered yet
    std::chrono::steady_clock::time_point last_active;
  };

  std::unordered_map<std::string, std::string>
      affinity_map; // Maps ClientID to WorkerID
  std::unordered_map<std::string, Session> sessions; // Maps WorkerID
  // Requests for workers that have not sent READY yet. The backend ROUTER
  // drops anything addressed to a peer it has not heard from.
  std::unordered_map<std::string, std::vector<MessageFrames>> pending;
  std::atomic<std::size_t> live{0};
  int worker_seq = 0;
  zmq::context_t *ctx;
  Authority *authority;

  static void send_to_worker(zmq::socket_t &backend,
                             const std::string &worker_id,
                             MessageFrames &request);

public:
  SessionRegistry(zmq::context_t *context, Authority *auth);

  // Retrieves the worker ID for a client, spawning a new thread if necessary.
  std::string get_worker_for_client(const std::string &client_id);

  // Forwards [Client ID | Empty | Payload...] to the worker, or queues it
  // until the worker is ready.
  void dispatch(zmq::socket_t &backend, const std::string &worker_id,
                MessageFrames request);

  // Handles a worker's READY signal by flushing its queue.
  void mark_ready(zmq::socket_t &backend, const std::string &worker_id);

  // Records that the worker answered one request.
  void reply_sent(const std::string &worker_id);

  // Stops and joins the workers that have been ready, with nothing in
  // flight, for at least idle_timeout. A client whose session was reaped
  // gets a fresh worker on its next request. Returns how many were reaped.
  std::size_t reap_idle(zmq::socket_t &backend,
                        std::chrono::steady_clock::duration idle_timeout);

  // Waits for every worker. The context must be shutting down.
  void join_all();

  // Number of live worker sessions. Safe from any thread.
  std::size_t size() const { return live.load(); }
};

} // namespace locksmith

#endif
