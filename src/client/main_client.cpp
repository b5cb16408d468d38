#include "logging.hpp"
#include "send_worker.hpp"
#include "util.hpp"
#include <cstdint>
#include <cstdlib>
#include <future>
#include <iostream>
#include <stdexcept>

using namespace photolink;

namespace {

class ConsoleStatus : public StatusObserver {
public:
  void on_status(const std::string &text) override {
    std::cout << text << std::endl;
  }
};

void usage(const char *argv0) {
  std::cerr << "usage: " << argv0
            << " --host HOST [--port PORT] | --server host:port\n"
               "       [--connect-timeout SECONDS] [--io-timeout SECONDS]\n"
               "       [--max-width PX] [--quality 1-100]\n"
               "       [--log-level trace|debug|info|warn|error] IMAGE.jpg\n";
}

} // namespace

int main(int argc, char **argv) {
  SenderConfig cfg;
  NormalizeOptions opts;
  std::string port_text;
  std::string server;
  std::string image_path;

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
      if (a == "--host")
        cfg.host = trim(next(i));
      else if (a == "--port")
        port_text = next(i);
      else if (a == "--server")
        server = next(i);
      else if (a == "--connect-timeout")
        cfg.connect_timeout = std::chrono::seconds(number(i, 1, 3600));
      else if (a == "--io-timeout")
        cfg.io_timeout = std::chrono::seconds(number(i, 1, 3600));
      else if (a == "--max-width")
        opts.max_width = (int)number(i, 1, 65500);
      else if (a == "--quality")
        opts.quality = (int)number(i, 1, 100);
      else if (a == "--log-level") {
        LogLevel lvl;
        if (!parse_log_level(next(i), lvl)) {
          std::cerr << "bad log level" << std::endl;
          return 1;
        }
        Logger::instance().set_level(lvl);
      } else if (a == "-h" || a == "--help") {
        usage(argv[0]);
        return 0;
      } else if (!a.empty() && a[0] == '-') {
        std::cerr << "unknown option " << a << "\n";
        usage(argv[0]);
        return 1;
      } else {
        image_path = a;
      }
    }
  } catch (const std::logic_error &) {
    std::cerr << "bad numeric option" << std::endl;
    return 1;
  }

  if (!server.empty()) {
    if (!parse_host_port(server, cfg.host, cfg.port)) {
      std::cerr << "bad server" << std::endl;
      return 1;
    }
  } else {
    cfg.port = parse_port(port_text, kDefaultPort);
  }
  if (cfg.host.empty()) {
    std::cerr << "Server IP cannot be empty" << std::endl;
    return 1;
  }
  if (image_path.empty()) {
    usage(argv[0]);
    return 1;
  }
  if (opts.max_width < 1 || opts.quality < 1 || opts.quality > 100) {
    std::cerr << "bad normalization options" << std::endl;
    return 1;
  }

  ConsoleStatus console;
  SendWorker worker(cfg, &console, opts);
  worker.start();
  std::promise<std::error_code> done;
  auto result = done.get_future();
  std::error_code ec = worker.submit(
      std::make_shared<FileCaptureSource>(image_path),
      [&done](std::error_code e) { done.set_value(e); });
  if (!ec)
    ec = result.get();
  worker.shutdown();
  return ec ? 1 : 0;
}
