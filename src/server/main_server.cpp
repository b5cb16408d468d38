#include "logging.hpp"
#include "receiver_service.hpp"
#include "util.hpp"
#include <asio.hpp>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

using namespace photolink;

static void usage(const char *argv0) {
  std::cerr << "usage: " << argv0
            << " [--listen host:port] [--data-dir DIR] [--max-payload BYTES]\n"
               "       [--read-timeout SECONDS] [--concurrent]\n"
               "       [--log-level trace|debug|info|warn|error] "
               "[--log-file PATH]\n";
}

int main(int argc, char **argv) {
  std::string listen = "0.0.0.0:" + std::to_string(kDefaultPort);
  ReceiverConfig cfg;

  try {
    for (int i = 1; i < argc; i++) {
      std::string a = argv[i];
      auto next = [&](int &i) -> std::string {
        if (i + 1 < argc)
          return std::string(argv[++i]);
        std::cerr << "missing value for " << a << "\n";
        std::exit(1);
      };
      auto number = [&](int &i, uint64_t lo, uint64_t hi) -> uint64_t {
        uint64_t v = 0;
        if (!parse_bounded(next(i), lo, hi, v)) {
          std::cerr << "bad numeric option " << a << "\n";
          std::exit(1);
        }
        return v;
      };
      if (a == "--listen")
        listen = next(i);
      else if (a == "--data-dir")
        cfg.data_dir = next(i);
      else if (a == "--max-payload")
        cfg.max_payload = (uint32_t)number(i, 1, INT32_MAX);
      else if (a == "--read-timeout")
        cfg.read_timeout = std::chrono::seconds(number(i, 0, 86400));
      else if (a == "--concurrent")
        cfg.concurrent = true;
      else if (a == "--log-level") {
        LogLevel lvl;
        if (!parse_log_level(next(i), lvl)) {
          std::cerr << "bad log level" << std::endl;
          return 1;
        }
        Logger::instance().set_level(lvl);
      } else if (a == "--log-file") {
        std::string path = next(i);
        if (!Logger::instance().set_file(path)) {
          std::cerr << "cannot open log file " << path << std::endl;
          return 1;
        }
      } else if (a == "-h" || a == "--help") {
        usage(argv[0]);
        return 0;
      } else {
        std::cerr << "unknown option " << a << "\n";
        usage(argv[0]);
        return 1;
      }
    }
  } catch (const std::logic_error &) {
    std::cerr << "bad numeric option" << std::endl;
    return 1;
  }

  if (!parse_host_port(listen, cfg.listen_host, cfg.listen_port)) {
    std::cerr << "bad listen" << std::endl;
    return 1;
  }

  LoggingSink sink;
  ReceiverService service(cfg, &sink);
  try {
    service.start();
  } catch (const std::system_error &e) {
    Logger::instance().log(LogLevel::ERROR, "cannot listen on %s: %s",
                           listen.c_str(), e.what());
    return 1;
  }

  asio::io_context io;
  asio::signal_set signals(io, SIGINT, SIGTERM);
  signals.async_wait([&](std::error_code ec, int sig) {
    if (!ec)
      Logger::instance().log(LogLevel::INFO, "signal %d received", sig);
    service.stop();
  });
  io.run();
  return 0;
}
