#ifndef LOOPBACK_CONNECTION_HPP
#define LOOPBACK_CONNECTION_HPP

#include "authority.hpp"
#include "errors.hpp"
#include "protocol.hpp"
#include "remote_caller.hpp"
#include <memory>

namespace locksmith {

// In-process channel to an Authority. Requests and replies still go through
// the frame codec, only the sockets are skipped.
class LoopbackConnection : public RemoteCaller {
private:
  Authority &authority;

public:
  explicit LoopbackConnection(Authority &auth) : authority(auth) {}

  Protocol::Reply call(const std::string &function,
                       const Protocol::Arguments &args, double) override {
    Protocol::Frames frames;
    try {
      Protocol::CallRequest req =
          Protocol::CallRequest::parse(Protocol::CallRequest{function, args}.to_frames());
      frames = Protocol::encode_reply(authority.handle(req));
    } catch (const RemoteError &e) {
      frames = Protocol::encode_error(e.what());
    }
    return Protocol::decode_reply(frames);
  }
};

inline ConnectionFactory loopback_factory(Authority &authority) {
  return [&authority](const ConnectionParams &) {
    return std::make_unique<LoopbackConnection>(authority);
  };
}

} // namespace locksmith

#endif
