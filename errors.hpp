#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

namespace locksmith {

// Base of everything the client raises. Losing a lock race or touching an
// expired lease is not an error and never ends up here.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Invalid construction arguments or substitutes. Raised synchronously.
class ConfigurationError : public Error {
public:
  using Error::Error;
};

// The authority could not be reached (timeout, socket failure).
class NetworkError : public Error {
public:
  using Error::Error;
};

// The authority answered with an application-level fault.
class RemoteError : public Error {
public:
  using Error::Error;
};

// A reply arrived but its tuples do not have the expected shape.
class BadReplyError : public Error {
public:
  using Error::Error;
};

} // namespace locksmith

#endif
