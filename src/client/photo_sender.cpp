#include "photo_sender.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <array>
#include <cstdint>

namespace photolink {

PhotoSender::PhotoSender(const SenderConfig &cfg, StatusObserver *observer)
    : cfg_(cfg), observer_(observer) {}

void PhotoSender::status(const char *text) {
  Logger::instance().log(LogLevel::INFO, "%s", text);
  if (observer_)
    observer_->on_status(text);
}

void PhotoSender::run_for(std::chrono::steady_clock::duration timeout,
                          const std::function<void()> &cancel) {
  io_.restart();
  io_.run_for(timeout);
  if (!io_.stopped()) {
    cancel();
    io_.run();
  }
}

std::error_code PhotoSender::send(const ImageBuffer &image) {
  if (cfg_.host.empty())
    return TransferErrc::invalid_destination;
  if (image.empty() || image.size() > UINT32_MAX)
    return TransferErrc::protocol_violation;

  status("Connecting to server...");
  tcp::socket sock(io_);
  tcp::resolver resolver(io_);
  auto close_sock = [&sock] {
    std::error_code ignored;
    sock.close(ignored);
  };

  std::error_code ec = asio::error::would_block;
  tcp::resolver::results_type endpoints;
  resolver.async_resolve(cfg_.host, std::to_string(cfg_.port),
                         [&](std::error_code e, tcp::resolver::results_type r) {
                           ec = e;
                           endpoints = std::move(r);
                         });
  run_for(cfg_.connect_timeout, [&] { resolver.cancel(); });
  if (ec) {
    Logger::instance().log(LogLevel::ERROR, "resolve %s failed: %s",
                           cfg_.host.c_str(), ec.message().c_str());
    return TransferErrc::connect_error;
  }

  ec = asio::error::would_block;
  asio::async_connect(sock, endpoints,
                      [&](std::error_code e, const tcp::endpoint &) { ec = e; });
  run_for(cfg_.connect_timeout, close_sock);
  if (ec || !sock.is_open()) {
    Logger::instance().log(LogLevel::ERROR, "connect %s:%u failed: %s",
                           cfg_.host.c_str(), (unsigned)cfg_.port,
                           ec.message().c_str());
    return TransferErrc::connect_error;
  }
  std::error_code opt_ec;
  sock.set_option(tcp::no_delay(true), opt_ec);

  status("Sending photo...");
  LengthField len = encode_length((uint32_t)image.size());
  std::array<asio::const_buffer, 2> frame{
      {asio::buffer(len), asio::buffer(image)}};
  ec = asio::error::would_block;
  std::size_t written = 0;
  asio::async_write(sock, frame, [&](std::error_code e, std::size_t n) {
    ec = e;
    written = n;
  });
  run_for(cfg_.io_timeout, close_sock);
  if (ec) {
    Logger::instance().log(LogLevel::ERROR, "write failed after %zu bytes: %s",
                           written, ec.message().c_str());
    return TransferErrc::transfer_incomplete;
  }
  Logger::instance().log(LogLevel::DEBUG, "wrote frame: %zu bytes", written);

  std::array<uint8_t, kAckSize> ack{};
  std::size_t got = 0;
  ec = asio::error::would_block;
  asio::async_read(sock, asio::buffer(ack), [&](std::error_code e, std::size_t n) {
    ec = e;
    got = n;
  });
  run_for(cfg_.io_timeout, close_sock);
  if (ec) {
    Logger::instance().log(LogLevel::ERROR, "ack read failed (%zu/%zu bytes): %s",
                           got, kAckSize, ec.message().c_str());
    return TransferErrc::transfer_incomplete;
  }
  if (!is_ack(ack.data(), got)) {
    Logger::instance().log(LogLevel::ERROR, "unexpected ack 0x%02x%02x",
                           ack[0], ack[1]);
    return TransferErrc::bad_acknowledgement;
  }

  sock.shutdown(tcp::socket::shutdown_both, opt_ec);
  sock.close(opt_ec);
  return {};
}

} // namespace photolink
