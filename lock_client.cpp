#include "config.hpp"
#include "errors.hpp"
#include "locksmith.hpp"
#include "logging.hpp"
#include "protocol.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

void usage(const char *prog) {
  std::cerr << "Usage: " << prog << " [-c config.yaml] <command> [args]\n"
            << "  acquire <name> <validity> [timeout]\n"
            << "  update <uid> <validity>\n"
            << "  release <uid>\n"
            << "  statistics\n"
            << "  hold <name> <validity> <seconds>\n";
}

double number(const std::string &text) {
  return locksmith::Protocol::parse_number(text);
}

int run(locksmith::Locksmith &smith, const std::vector<std::string> &args) {
  const std::string &cmd = args[0];

  if (cmd == "acquire" && (args.size() == 3 || args.size() == 4)) {
    std::optional<double> timeout;
    if (args.size() == 4)
      timeout = number(args[3]);
    std::cout << "REQUESTING lock for resource: " << args[1] << "\n";
    auto lock = smith.acquire(args[1], number(args[2]), timeout);
    if (!lock) {
      std::cerr << "Failed to acquire lock.\n";
      return 2;
    }
    std::cout << "LOCKED " << *lock << "\n";
    return 0;
  }

  if (cmd == "update" && args.size() == 3) {
    bool ok = smith.update(args[1], number(args[2]));
    std::cout << (ok ? "UPDATED " : "NOT HELD ") << args[1] << "\n";
    return ok ? 0 : 2;
  }

  if (cmd == "release" && args.size() == 2) {
    bool ok = smith.release(args[1]);
    std::cout << (ok ? "UNLOCKED " : "NOT HELD ") << args[1] << "\n";
    return ok ? 0 : 2;
  }

  if (cmd == "statistics" && args.size() == 1) {
    std::cout << smith.statistics().value_or("nil") << "\n";
    return 0;
  }

  // Acquire, keep the lease alive for a while, then release it.
  if (cmd == "hold" && args.size() == 4) {
    double validity = number(args[2]);
    double seconds = number(args[3]);
    std::cout << "REQUESTING lock for resource: " << args[1] << "\n";
    auto lock = smith.acquire(args[1], validity);
    if (!lock) {
      std::cerr << "Failed to acquire lock.\n";
      return 2;
    }
    std::cout << "LOCKED " << *lock << "\n";

    auto until = std::chrono::steady_clock::now() +
                 std::chrono::duration<double>(seconds);
    auto renew_every = std::chrono::duration<double>(validity / 2);
    while (std::chrono::steady_clock::now() < until) {
      std::this_thread::sleep_for(std::min<std::chrono::duration<double>>(
          renew_every, until - std::chrono::steady_clock::now()));
      if (std::chrono::steady_clock::now() < until && !lock->update(validity)) {
        std::cerr << "Lost lock " << *lock << "\n";
        return 2;
      }
    }

    std::cout << "RELEASING lock for resource: " << args[1] << "\n";
    if (!lock->release()) {
      std::cerr << "Lock expired before release.\n";
      return 2;
    }
    std::cout << "UNLOCKED " << args[1] << "\n";
    return 0;
  }

  return -1;
}

} // namespace

int main(int argc, char *argv[]) {
  std::vector<std::string> args(argv + 1, argv + argc);
  std::optional<std::string> config_path;
  if (args.size() >= 2 && args[0] == "-c") {
    config_path = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }
  if (args.empty()) {
    usage(argv[0]);
    return 1;
  }

  try {
    locksmith::ClientConfig config;
    if (config_path)
      config = locksmith::load_client_config(*config_path);

    std::cout << "CONNECTING to lock server at tcp://" << config.host << ":"
              << config.port << "\n";
    locksmith::Locksmith smith(config);
    int rc = run(smith, args);
    if (rc < 0) {
      usage(argv[0]);
      return 1;
    }
    return rc;
  } catch (const std::logic_error &e) {
    std::cerr << "Bad number: " << e.what() << "\n";
    return 1;
  } catch (const locksmith::Error &e) {
    std::cerr << "[ERROR] " << e.what() << "\n";
    return 1;
  }
}
