#include "send_worker.hpp"
#include "errors.hpp"
#include "logging.hpp"

namespace photolink {

SendWorker::SendWorker(const SenderConfig &cfg, StatusObserver *observer,
                       const NormalizeOptions &opts)
    : cfg_(cfg), observer_(observer), opts_(opts) {}

SendWorker::~SendWorker() { shutdown(); }

void SendWorker::start() {
  std::lock_guard<std::mutex> lk(thread_mtx_);
  if (thread_.joinable())
    return;
  io_.restart();
  work_.emplace(asio::make_work_guard(io_));
  thread_ = std::thread([this]() { io_.run(); });
}

void SendWorker::shutdown() {
  std::lock_guard<std::mutex> lk(thread_mtx_);
  work_.reset();
  if (thread_.joinable())
    thread_.join();
}

void SendWorker::status(const std::string &text) {
  Logger::instance().log(LogLevel::INFO, "%s", text.c_str());
  if (observer_)
    observer_->on_status(text);
}

std::error_code SendWorker::submit(std::shared_ptr<CaptureSource> source,
                                   Completion done) {
  start();
  bool expected = false;
  if (!busy_.compare_exchange_strong(expected, true))
    return TransferErrc::busy;
  asio::post(io_, [this, source, done]() {
    std::error_code ec = run_once(*source);
    busy_.store(false);
    if (done)
      done(ec);
  });
  return {};
}

std::error_code SendWorker::run_once(CaptureSource &source) {
  status("Capturing photo...");
  CaptureOutcome shot = await_capture(source);
  if (!shot.ok) {
    Logger::instance().log(LogLevel::ERROR, "photo capture failed: %s",
                           shot.reason.c_str());
    status("Error capturing photo");
    return TransferErrc::capture_error;
  }
  status("Photo captured! Sending...");

  ImageBuffer payload;
  std::error_code ec = normalize_image(shot.image, payload, opts_);
  std::vector<uint8_t>().swap(shot.image);
  if (!ec) {
    Logger::instance().log(LogLevel::DEBUG, "normalized image: %zu bytes",
                           payload.size());
    PhotoSender sender(cfg_, observer_);
    ec = sender.send(payload);
  }
  if (ec) {
    status("Error sending photo: " + ec.message());
    return ec;
  }
  status("Photo sent successfully!");
  return {};
}

} // namespace photolink
