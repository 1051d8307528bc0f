#ifndef PROTOCOL_HPP
#define PROTOCOL_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace locksmith {
namespace Protocol {
// Remote functions exposed by the authority.
constexpr std::string_view FN_ACQUIRE = "locksmith:acquire";
constexpr std::string_view FN_UPDATE = "locksmith:update";
constexpr std::string_view FN_RELEASE = "locksmith:release";
constexpr std::string_view FN_STATISTICS = "locksmith:statistics";

// First frame of every reply.
constexpr std::string_view MSG_OK = "OK";
constexpr std::string_view MSG_ERROR = "ERROR";

constexpr std::string_view MSG_READY =
    "READY"; // Signal from worker to main router.

// Field frames are tagged so nil and "" stay distinct on the wire.
constexpr char TAG_STRING = 's';
constexpr char TAG_NIL = 'n';

// Passed as `wait` when the authority may hold a call indefinitely.
constexpr double WAIT_FOREVER = -1.0;

using Field = std::optional<std::string>;
using Tuple = std::vector<Field>;
using Arguments = std::vector<std::string>;
using Frames = std::vector<std::string>;

// Request frames: [function][arg 1]...[arg n]
struct CallRequest {
  std::string function;
  Arguments args;

  Frames to_frames() const;

  // Throws RemoteError when there is no function frame.
  static CallRequest parse(const Frames &frames);
};

// One or more result tuples. Callers only ever look at the first one.
struct Reply {
  std::vector<Tuple> tuples;
};

// Success frames: [OK][tuple count] then per tuple [field count][field]...
Frames encode_reply(const Reply &reply);

// Failure frames: [ERROR][message]
Frames encode_error(const std::string &message);

// Throws RemoteError for an ERROR reply, BadReplyError for anything that is
// not a well formed reply.
Reply decode_reply(const Frames &frames);

// Shortest decimal text that parses back to the same value.
std::string format_number(double value);

// Throws std::invalid_argument for anything that is not a finite number.
double parse_number(const std::string &text);
} // namespace Protocol
} // namespace locksmith

#endif
