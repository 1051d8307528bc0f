#include "lock_table.hpp"
#include <algorithm>
#include <cstdio>
#include <iterator>

namespace locksmith {

std::chrono::steady_clock::duration to_clock_duration(double seconds) {
  return std::chrono::ceil<std::chrono::steady_clock::duration>(
      std::chrono::duration<double>(seconds));
}

LockTable::LockTable() : rng(std::random_device{}()) {}

bool LockTable::expire_if_due(
    std::unordered_map<std::string, Lease>::iterator it,
    Clock::time_point now) {
  if (it->second.expires > now)
    return false;
  names.erase(it->second.uid);
  leases.erase(it);
  ++stats.expired;
  return true;
}

// Random (version 4) UUID text.
std::string LockTable::generate_uid() {
  std::uniform_int_distribution<std::uint64_t> dis;
  std::string uid;
  do {
    std::uint64_t hi = dis(rng);
    std::uint64_t lo = dis(rng);
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08llx-%04llx-%04llx-%04llx-%012llx",
                  static_cast<unsigned long long>(hi >> 32),
                  static_cast<unsigned long long>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned long long>(hi & 0xFFFF),
                  static_cast<unsigned long long>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    uid = buf;
  } while (names.count(uid) != 0);
  return uid;
}

std::optional<std::string> LockTable::acquire(const std::string &name,
                                              double validity,
                                              std::optional<double> timeout) {
  std::unique_lock<std::mutex> lock(global_mutex);
  const Clock::time_point deadline =
      timeout ? Clock::now() + to_clock_duration(*timeout)
              : Clock::time_point::max();

  while (true) {
    if (stopping) {
      ++stats.failed;
      return std::nullopt;
    }

    Clock::time_point now = Clock::now();
    auto it = leases.find(name);
    if (it == leases.end() || expire_if_due(it, now)) {
      std::string uid = generate_uid();
      leases[name] = Lease{uid, now + to_clock_duration(validity)};
      names[uid] = name;
      ++stats.acquired;
      return uid;
    }

    if (now >= deadline) {
      ++stats.failed;
      return std::nullopt;
    }

    // Wake up at the earlier of expiry and deadline, or on a release.
    ++stats.waiting;
    cv.wait_until(lock, std::min(it->second.expires, deadline));
    --stats.waiting;
  }
}

bool LockTable::update(const std::string &uid, double validity) {
  std::lock_guard<std::mutex> guard(global_mutex);
  auto name = names.find(uid);
  if (name == names.end())
    return false;

  Clock::time_point now = Clock::now();
  auto it = leases.find(name->second);
  if (expire_if_due(it, now))
    return false;

  it->second.expires = now + to_clock_duration(validity);
  ++stats.updated;
  return true;
}

bool LockTable::release(const std::string &uid) {
  std::lock_guard<std::mutex> guard(global_mutex);
  auto name = names.find(uid);
  if (name == names.end())
    return false;

  auto it = leases.find(name->second);
  if (expire_if_due(it, Clock::now())) {
    cv.notify_all();
    return false;
  }

  leases.erase(it);
  names.erase(name);
  ++stats.released;
  cv.notify_all();
  return true;
}

LockStatistics LockTable::statistics() {
  std::lock_guard<std::mutex> guard(global_mutex);
  Clock::time_point now = Clock::now();
  for (auto it = leases.begin(); it != leases.end();) {
    auto next = std::next(it);
    expire_if_due(it, now);
    it = next;
  }

  LockStatistics snapshot = stats;
  snapshot.active = leases.size();
  return snapshot;
}

void LockTable::shutdown() {
  {
    std::lock_guard<std::mutex> guard(global_mutex);
    stopping = true;
  }
  cv.notify_all();
}

} // namespace locksmith
