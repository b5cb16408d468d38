#include "receiver_service.hpp"
#include "logging.hpp"

namespace photolink {

ReceiverService::ReceiverService(const ReceiverConfig &cfg, PhotoSink *sink)
    : receiver_(io_, cfg, sink) {}

ReceiverService::~ReceiverService() { stop(); }

void ReceiverService::start() {
  if (thread_.joinable())
    return;
  receiver_.start();
  port_ = receiver_.local_port();
  thread_ = std::thread([this]() {
    try {
      io_.run();
    } catch (const std::exception &e) {
      Logger::instance().log(LogLevel::ERROR, "receiver loop stopped: %s",
                             e.what());
    }
  });
}

void ReceiverService::stop() {
  if (!thread_.joinable())
    return;
  Logger::instance().log(LogLevel::INFO, "stopping server");
  io_.stop();
  thread_.join();
  receiver_.stop();
}

} // namespace photolink
