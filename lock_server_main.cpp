#include "config.hpp"
#include "errors.hpp"
#include "lock_server.hpp"
#include "logging.hpp"
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

namespace {
volatile std::sig_atomic_t stop_requested = 0;

void on_signal(int) { stop_requested = 1; }
} // namespace

int main(int argc, char *argv[]) {
  if (argc > 2) {
    std::cerr << "Usage: " << argv[0] << " [config.yaml]\n";
    return 1;
  }

  try {
    locksmith::ServerConfig config;
    if (argc == 2)
      config = locksmith::load_server_config(argv[1]);
    locksmith::set_log_level(locksmith::parse_log_level(config.log_level));

    locksmith::LockServer server(config);
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    server.start();

    while (!stop_requested)
      std::this_thread::sleep_for(std::chrono::milliseconds(200));

    server.stop();
  } catch (const locksmith::Error &e) {
    std::cerr << "[ERROR] " << e.what() << "\n";
    return 1;
  }
  return 0;
}
