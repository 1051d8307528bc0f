#include "authority.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <stdexcept>
#include <utility>
#include <yaml-cpp/yaml.h>

namespace locksmith {

namespace {

void expect_args(const Protocol::CallRequest &request, std::size_t min,
                 std::size_t max) {
  std::size_t n = request.args.size();
  if (n < min || n > max) {
    throw RemoteError(request.function + ": expected " + std::to_string(min) +
                      (min == max ? "" : "-" + std::to_string(max)) +
                      " arguments, got " + std::to_string(n));
  }
}

double seconds_arg(const std::string &what, const std::string &text,
                   bool allow_zero) {
  double value = 0;
  try {
    value = Protocol::parse_number(text);
  } catch (const std::logic_error &) {
    throw RemoteError(what + " must be a number, got '" + text + "'");
  }
  if (value < 0 || (!allow_zero && value == 0))
    throw RemoteError(what + " must be " +
                      (allow_zero ? "non-negative" : "positive"));
  if (value > MAX_SECONDS)
    throw RemoteError(what + " is too large");
  return value;
}

std::string name_arg(const std::string &text) {
  if (text.empty())
    throw RemoteError("Lock name must not be empty");
  return text;
}

Protocol::Reply single(Protocol::Tuple tuple) {
  Protocol::Reply reply;
  reply.tuples.push_back(std::move(tuple));
  return reply;
}

} // namespace

Protocol::Reply Authority::handle(const Protocol::CallRequest &request) {
  if (request.function == Protocol::FN_ACQUIRE) {
    expect_args(request, 2, 3);
    return acquire(request.args);
  }
  if (request.function == Protocol::FN_UPDATE) {
    expect_args(request, 2, 2);
    return update(request.args);
  }
  if (request.function == Protocol::FN_RELEASE) {
    expect_args(request, 1, 1);
    return release(request.args);
  }
  if (request.function == Protocol::FN_STATISTICS) {
    expect_args(request, 0, 0);
    return statistics(request.args);
  }
  throw RemoteError("Procedure '" + request.function + "' is not defined");
}

// (uid, name, uid) when granted, (nil, name, nil) otherwise.
Protocol::Reply Authority::acquire(const Protocol::Arguments &args) {
  std::string name = name_arg(args[0]);
  double validity = seconds_arg("Validity", args[1], false);
  std::optional<double> timeout;
  if (args.size() > 2)
    timeout = seconds_arg("Timeout", args[2], true);

  std::optional<std::string> uid = table.acquire(name, validity, timeout);
  if (uid)
    log(LogLevel::INFO, "Locked " + name + " as " + *uid);
  else
    log(LogLevel::DEBUG, "Lock " + name + " is taken");
  return single({uid, name, uid});
}

Protocol::Reply Authority::update(const Protocol::Arguments &args) {
  double validity = seconds_arg("Validity", args[1], false);
  bool ok = table.update(args[0], validity);
  return single({ok ? Protocol::Field(args[0]) : std::nullopt});
}

Protocol::Reply Authority::release(const Protocol::Arguments &args) {
  bool ok = table.release(args[0]);
  if (ok)
    log(LogLevel::INFO, "Released " + args[0]);
  return single({ok ? Protocol::Field(args[0]) : std::nullopt});
}

// A YAML mapping with the LockStatistics counters.
Protocol::Reply Authority::statistics(const Protocol::Arguments &) {
  LockStatistics stats = table.statistics();

  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "locks" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "active" << YAML::Value << stats.active;
  out << YAML::Key << "waiting" << YAML::Value << stats.waiting;
  out << YAML::EndMap;
  out << YAML::Key << "calls" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "acquired" << YAML::Value << stats.acquired;
  out << YAML::Key << "failed" << YAML::Value << stats.failed;
  out << YAML::Key << "updated" << YAML::Value << stats.updated;
  out << YAML::Key << "released" << YAML::Value << stats.released;
  out << YAML::Key << "expired" << YAML::Value << stats.expired;
  out << YAML::EndMap;
  out << YAML::EndMap;

  return single({std::string(out.c_str())});
}

} // namespace locksmith
