#include "protocol.hpp"
#include "errors.hpp"
#include <cmath>
#include <cstddef>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace locksmith {
namespace Protocol {

namespace {

std::size_t parse_count(const std::string &frame) {
  if (frame.empty() || frame.size() > 9 ||
      frame.find_first_not_of("0123456789") != std::string::npos) {
    throw BadReplyError("Bad count frame in reply: '" + frame + "'");
  }
  return static_cast<std::size_t>(std::stoul(frame));
}

Field decode_field(const std::string &frame) {
  if (frame == std::string(1, TAG_NIL))
    return std::nullopt;
  if (!frame.empty() && frame[0] == TAG_STRING)
    return frame.substr(1);
  throw BadReplyError("Bad field frame in reply");
}

} // namespace

Frames CallRequest::to_frames() const {
  Frames frames;
  frames.reserve(args.size() + 1);
  frames.push_back(function);
  frames.insert(frames.end(), args.begin(), args.end());
  return frames;
}

CallRequest CallRequest::parse(const Frames &frames) {
  if (frames.empty() || frames[0].empty())
    throw RemoteError("Request carries no function name");

  CallRequest req;
  req.function = frames[0];
  req.args.assign(frames.begin() + 1, frames.end());
  return req;
}

Frames encode_reply(const Reply &reply) {
  Frames frames;
  frames.push_back(std::string(MSG_OK));
  frames.push_back(std::to_string(reply.tuples.size()));
  for (const Tuple &tuple : reply.tuples) {
    frames.push_back(std::to_string(tuple.size()));
    for (const Field &field : tuple) {
      if (field)
        frames.push_back(TAG_STRING + *field);
      else
        frames.push_back(std::string(1, TAG_NIL));
    }
  }
  return frames;
}

Frames encode_error(const std::string &message) {
  return Frames{std::string(MSG_ERROR), message};
}

Reply decode_reply(const Frames &frames) {
  if (frames.empty())
    throw BadReplyError("Empty reply");

  if (frames[0] == MSG_ERROR) {
    throw RemoteError(frames.size() > 1 ? frames[1]
                                        : std::string("Unspecified error"));
  }
  if (frames[0] != MSG_OK)
    throw BadReplyError("Unknown reply status: '" + frames[0] + "'");
  if (frames.size() < 2)
    throw BadReplyError("Reply has no tuple count");

  Reply reply;
  std::size_t pos = 1;
  std::size_t tuple_count = parse_count(frames[pos++]);
  for (std::size_t t = 0; t < tuple_count; ++t) {
    if (pos >= frames.size())
      throw BadReplyError("Reply truncated before tuple " + std::to_string(t));
    std::size_t field_count = parse_count(frames[pos++]);
    if (frames.size() - pos < field_count)
      throw BadReplyError("Reply truncated inside tuple " + std::to_string(t));

    Tuple tuple;
    tuple.reserve(field_count);
    for (std::size_t f = 0; f < field_count; ++f)
      tuple.push_back(decode_field(frames[pos++]));
    reply.tuples.push_back(std::move(tuple));
  }
  if (pos != frames.size())
    throw BadReplyError("Trailing frames after last tuple");
  return reply;
}

std::string format_number(double value) {
  std::ostringstream ss;
  ss.precision(std::numeric_limits<double>::max_digits10);
  ss << value;
  return ss.str();
}

double parse_number(const std::string &text) {
  std::size_t used = 0;
  double value = std::stod(text, &used);
  if (used != text.size() || !std::isfinite(value))
    throw std::invalid_argument("Not a number: '" + text + "'");
  return value;
}

} // namespace Protocol
} // namespace locksmith
