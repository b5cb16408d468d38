#include "photo_receiver.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <algorithm>
#include <cstdint>
#include <filesystem>

namespace photolink {

namespace {
constexpr size_t kReadChunk = 64 * 1024;
constexpr int kListenBacklog = 5;
} // namespace

const char *state_name(SessionState s) {
  switch (s) {
  case SessionState::LISTENING:
    return "LISTENING";
  case SessionState::ACCEPTED:
    return "ACCEPTED";
  case SessionState::READING_LENGTH:
    return "READING_LENGTH";
  case SessionState::READING_PAYLOAD:
    return "READING_PAYLOAD";
  case SessionState::PERSISTED:
    return "PERSISTED";
  case SessionState::ACKED:
    return "ACKED";
  default:
    return "CLOSED";
  }
}

void LoggingSink::on_photo(const StoredPhoto &photo, const std::string &peer) {
  std::string name = std::filesystem::path(photo.path).filename().string();
  Logger::instance().log(LogLevel::INFO,
                         "Last photo: %s | Size: %zu bytes | From: %s",
                         name.c_str(), photo.size, peer.c_str());
}

PhotoReceiver::PhotoReceiver(asio::io_context &io, const ReceiverConfig &cfg,
                             PhotoSink *sink)
    : io_(io), cfg_(cfg), sink_(sink), store_(cfg.data_dir), acceptor_(io) {
  // A length that does not fit a signed 32-bit int is never plausible.
  cfg_.max_payload = std::min<uint32_t>(cfg_.max_payload, INT32_MAX);
}

void PhotoReceiver::start() {
  tcp::endpoint ep(asio::ip::make_address(cfg_.listen_host), cfg_.listen_port);
  acceptor_.open(ep.protocol());
  acceptor_.set_option(asio::socket_base::reuse_address(true));
  acceptor_.bind(ep);
  acceptor_.listen(kListenBacklog);
  Logger::instance().log(LogLevel::INFO,
                         "listening on %s:%u, storing under %s (%s)",
                         cfg_.listen_host.c_str(), (unsigned)local_port(),
                         cfg_.data_dir.c_str(),
                         cfg_.concurrent ? "concurrent" : "serial");
  do_accept();
}

void PhotoReceiver::stop() {
  std::error_code ec;
  acceptor_.close(ec);
}

uint16_t PhotoReceiver::local_port() const {
  std::error_code ec;
  auto ep = acceptor_.local_endpoint(ec);
  return ec ? 0 : ep.port();
}

ReceiverStats PhotoReceiver::stats() const {
  ReceiverStats s;
  s.accepted = accepted_.load();
  s.stored = stored_.load();
  s.failed = failed_.load();
  return s;
}

void PhotoReceiver::do_accept() {
  if (!acceptor_.is_open())
    return;
  Logger::instance().log(LogLevel::DEBUG, "state %s",
                         state_name(SessionState::LISTENING));
  acceptor_.async_accept([this](std::error_code ec, tcp::socket sock) {
    if (ec == asio::error::operation_aborted || !acceptor_.is_open())
      return;
    if (ec) {
      Logger::instance().log(LogLevel::ERROR, "accept failed: %s",
                             ec.message().c_str());
      do_accept();
      return;
    }
    accepted_++;
    auto s = std::make_shared<ReceiveSession>(*this, std::move(sock),
                                              next_session_id_++);
    s->start();
    if (cfg_.concurrent)
      do_accept();
  });
}

void PhotoReceiver::on_session_closed(bool stored) {
  if (stored)
    stored_++;
  else
    failed_++;
  if (!cfg_.concurrent)
    do_accept();
}

ReceiveSession::ReceiveSession(PhotoReceiver &owner, tcp::socket sock,
                               uint64_t id)
    : owner_(owner), sock_(std::move(sock)), timer_(owner.io_), id_(id),
      read_buf_(kReadChunk) {
  std::error_code ec;
  auto ep = sock_.remote_endpoint(ec);
  peer_ = ec ? std::string("?") : ep.address().to_string();
}

void ReceiveSession::set_state(SessionState s) {
  state_ = s;
  Logger::instance().log(LogLevel::DEBUG, "session %llu: %s",
                         (unsigned long long)id_, state_name(s));
}

void ReceiveSession::start() {
  Logger::instance().log(LogLevel::INFO, "session %llu: client connected: %s",
                         (unsigned long long)id_, peer_.c_str());
  set_state(SessionState::ACCEPTED);
  read_length();
}

void ReceiveSession::arm_timer() {
  auto timeout = owner_.cfg_.read_timeout;
  if (timeout.count() <= 0)
    return;
  auto self = shared_from_this();
  timer_.expires_after(timeout);
  timer_.async_wait([this, self](std::error_code ec) {
    if (ec || closed_)
      return;
    Logger::instance().log(LogLevel::WARN, "session %llu: read timeout in %s",
                           (unsigned long long)id_, state_name(state_));
    std::error_code ignored;
    sock_.close(ignored);
  });
}

void ReceiveSession::read_length() {
  set_state(SessionState::READING_LENGTH);
  arm_timer();
  auto self = shared_from_this();
  asio::async_read(sock_, asio::buffer(len_buf_),
                   [this, self](std::error_code ec, std::size_t) {
                     if (ec) {
                       finish(TransferErrc::transfer_incomplete);
                       return;
                     }
                     expected_ = decode_length(len_buf_);
                     if (expected_ == 0 ||
                         expected_ > owner_.cfg_.max_payload) {
                       Logger::instance().log(
                           LogLevel::WARN,
                           "session %llu: rejecting declared length %u",
                           (unsigned long long)id_, expected_);
                       finish(TransferErrc::protocol_violation);
                       return;
                     }
                     Logger::instance().log(
                         LogLevel::INFO, "session %llu: expecting %u bytes",
                         (unsigned long long)id_, expected_);
                     payload_.reserve(
                         std::min<size_t>(expected_, 16 * kReadChunk));
                     set_state(SessionState::READING_PAYLOAD);
                     read_payload();
                   });
}

void ReceiveSession::read_payload() {
  arm_timer();
  size_t want = std::min(read_buf_.size(), (size_t)expected_ - payload_.size());
  auto self = shared_from_this();
  sock_.async_read_some(
      asio::buffer(read_buf_.data(), want),
      [this, self](std::error_code ec, std::size_t n) {
        if (ec) {
          Logger::instance().log(
              LogLevel::WARN, "session %llu: got %zu of %u bytes: %s",
              (unsigned long long)id_, payload_.size(), expected_,
              ec.message().c_str());
          finish(TransferErrc::transfer_incomplete);
          return;
        }
        payload_.insert(payload_.end(), read_buf_.begin(),
                        read_buf_.begin() + n);
        if (payload_.size() < expected_) {
          read_payload();
          return;
        }
        persist_and_ack();
      });
}

void ReceiveSession::persist_and_ack() {
  timer_.cancel();
  StoredPhoto photo;
  if (owner_.store_.persist(payload_, photo)) {
    finish(TransferErrc::io_error);
    return;
  }
  std::vector<uint8_t>().swap(payload_);
  set_state(SessionState::PERSISTED);
  Logger::instance().log(LogLevel::INFO, "session %llu: saved %s",
                         (unsigned long long)id_, photo.path.c_str());
  if (owner_.sink_)
    owner_.sink_->on_photo(photo, peer_);

  arm_timer();
  auto self = shared_from_this();
  asio::async_write(sock_, asio::buffer(kAck),
                    [this, self](std::error_code ec, std::size_t) {
                      if (ec) {
                        Logger::instance().log(
                            LogLevel::WARN, "session %llu: ack failed: %s",
                            (unsigned long long)id_, ec.message().c_str());
                        // The photo is already on disk.
                        finish({});
                        return;
                      }
                      set_state(SessionState::ACKED);
                      finish({});
                    });
}

void ReceiveSession::finish(std::error_code ec) {
  if (closed_)
    return;
  closed_ = true;
  timer_.cancel();
  if (ec)
    Logger::instance().log(LogLevel::WARN, "session %llu: aborted in %s: %s",
                           (unsigned long long)id_, state_name(state_),
                           ec.message().c_str());
  bool stored = state_ == SessionState::PERSISTED ||
                state_ == SessionState::ACKED;
  std::error_code ignored;
  sock_.shutdown(tcp::socket::shutdown_both, ignored);
  sock_.close(ignored);
  payload_.clear();
  set_state(SessionState::CLOSED);
  owner_.on_session_closed(stored);
}

} // namespace photolink
