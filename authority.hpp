#ifndef AUTHORITY_HPP
#define AUTHORITY_HPP

#include "lock_table.hpp"
#include "protocol.hpp"

namespace locksmith {

// Longest validity or timeout accepted, in seconds.
constexpr double MAX_SECONDS = 1e9;

// Authority answers locksmith:* calls against one LockTable.
class Authority {
private:
  LockTable table;

  Protocol::Reply acquire(const Protocol::Arguments &args);
  Protocol::Reply update(const Protocol::Arguments &args);
  Protocol::Reply release(const Protocol::Arguments &args);
  Protocol::Reply statistics(const Protocol::Arguments &args);

public:
  // Runs one call. Blocks while an acquire waits. Throws RemoteError for an
  // unknown function or bad arguments.
  Protocol::Reply handle(const Protocol::CallRequest &request);

  // Unblocks waiting acquires; they fail.
  void shutdown() { table.shutdown(); }

  LockTable &locks() { return table; }
};

} // namespace locksmith

#endif
