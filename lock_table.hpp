#ifndef LOCK_TABLE_HPP
#define LOCK_TABLE_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>

namespace locksmith {

// Seconds as a steady_clock duration, rounded up: a positive validity or
// timeout never collapses to zero ticks.
std::chrono::steady_clock::duration to_clock_duration(double seconds);

struct LockStatistics {
  std::size_t active = 0;  // unexpired leases
  std::size_t waiting = 0; // acquires currently blocked
  std::uint64_t acquired = 0;
  std::uint64_t failed = 0; // acquires that gave up
  std::uint64_t updated = 0;
  std::uint64_t released = 0;
  std::uint64_t expired = 0;
};

// LockTable is the authority's lease store: at most one unexpired lease per
// name. Every operation runs under one mutex, so each is atomic. Expired
// leases are dropped lazily whenever they are looked at.
//
// Callers pass validity > 0 and timeout >= 0 (seconds).
class LockTable {
private:
  using Clock = std::chrono::steady_clock;

  struct Lease {
    std::string uid;
    Clock::time_point expires;
  };

  std::unordered_map<std::string, Lease> leases; // by lock name
  std::unordered_map<std::string, std::string> names; // uid -> lock name
  std::mutex global_mutex;
  std::condition_variable cv; // signalled on release and shutdown
  std::mt19937_64 rng;
  bool stopping = false;
  LockStatistics stats;

  // Drops the lease if it has expired. Requires global_mutex.
  bool expire_if_due(std::unordered_map<std::string, Lease>::iterator it,
                     Clock::time_point now);
  std::string generate_uid();

public:
  LockTable();

  // Grants `name` if it is free or its lease has expired, otherwise waits
  // for a release or expiry: forever when `timeout` is unset, up to
  // `timeout` seconds otherwise. Returns the new uid, or nothing.
  std::optional<std::string> acquire(const std::string &name,
                                     double validity,
                                     std::optional<double> timeout);

  // Restarts the validity window of an unexpired lease.
  bool update(const std::string &uid, double validity);

  // Frees an unexpired lease and wakes waiters.
  bool release(const std::string &uid);

  LockStatistics statistics();

  // Fails all current and future acquires that would block.
  void shutdown();
};

} // namespace locksmith

#endif
