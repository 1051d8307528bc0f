#ifndef RESPONSES_HPP
#define RESPONSES_HPP

#include "protocol.hpp"
#include <optional>
#include <string>

namespace locksmith {

// Typed views of authority replies. Each decode() looks at the first tuple
// only and throws BadReplyError when it is missing or too short.

// locksmith:acquire -> (uid|nil, name, uid)
struct AcquireResponse {
  bool granted = false;
  std::string name;
  std::string uid;

  static AcquireResponse decode(const Protocol::Reply &reply);
};

// locksmith:update and locksmith:release -> (uid|nil)
struct StatusResponse {
  bool ok = false;

  static StatusResponse decode(const Protocol::Reply &reply);
};

// locksmith:statistics -> (stats|nil)
struct StatisticsResponse {
  std::optional<std::string> stats;

  static StatisticsResponse decode(const Protocol::Reply &reply);
};

} // namespace locksmith

#endif
