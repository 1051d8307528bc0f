#include "responses.hpp"
#include "errors.hpp"

namespace locksmith {

namespace {

const Protocol::Tuple &first_tuple(const Protocol::Reply &reply,
                                   std::size_t min_fields) {
  if (reply.tuples.empty())
    throw BadReplyError("Reply carries zero tuples");

  const Protocol::Tuple &tuple = reply.tuples.front();
  if (tuple.size() < min_fields) {
    throw BadReplyError("Reply tuple has " + std::to_string(tuple.size()) +
                        " fields, expected at least " +
                        std::to_string(min_fields));
  }
  return tuple;
}

} // namespace

AcquireResponse AcquireResponse::decode(const Protocol::Reply &reply) {
  const Protocol::Tuple &tuple = first_tuple(reply, 1);

  AcquireResponse response;
  if (!tuple[0])
    return response;

  if (tuple.size() < 3 || !tuple[1] || !tuple[2])
    throw BadReplyError("Granted acquire reply lacks name or uid");

  response.granted = true;
  response.name = *tuple[1];
  response.uid = *tuple[2];
  return response;
}

StatusResponse StatusResponse::decode(const Protocol::Reply &reply) {
  StatusResponse response;
  response.ok = first_tuple(reply, 1)[0].has_value();
  return response;
}

StatisticsResponse StatisticsResponse::decode(const Protocol::Reply &reply) {
  StatisticsResponse response;
  response.stats = first_tuple(reply, 1)[0];
  return response;
}

} // namespace locksmith
