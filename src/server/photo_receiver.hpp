#pragma once
#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include "photo_store.hpp"
#include "protocol.hpp"

namespace photolink {

struct ReceiverConfig {
    std::string listen_host{"0.0.0.0"};
    uint16_t listen_port{kDefaultPort};
    std::string data_dir{"data"};
    uint32_t max_payload{kDefaultMaxPayload};
    std::chrono::seconds read_timeout{30};  // 0 disables
    bool concurrent{false};                 // false: finish a session before accepting the next
};

// Display collaborator, told about every photo once it is on disk.
class PhotoSink {
public:
    virtual ~PhotoSink() = default;
    virtual void on_photo(const StoredPhoto& photo, const std::string& peer) = 0;
};

class LoggingSink : public PhotoSink {
public:
    void on_photo(const StoredPhoto& photo, const std::string& peer) override;
};

enum class SessionState {
    LISTENING, ACCEPTED, READING_LENGTH, READING_PAYLOAD, PERSISTED, ACKED, CLOSED
};
const char* state_name(SessionState s);

struct ReceiverStats {
    uint64_t accepted{0};
    uint64_t stored{0};
    uint64_t failed{0};
};

class ReceiveSession;

class PhotoReceiver {
public:
    using tcp = asio::ip::tcp;

    PhotoReceiver(asio::io_context& io, const ReceiverConfig& cfg, PhotoSink* sink);
    // Binds and starts accepting. Throws std::system_error if the address is unusable.
    void start();
    void stop();
    uint16_t local_port() const;
    ReceiverStats stats() const;

private:
    friend class ReceiveSession;

    void do_accept();
    void on_session_closed(bool stored);

    asio::io_context& io_;
    ReceiverConfig cfg_;
    PhotoSink* sink_;
    PhotoStore store_;
    tcp::acceptor acceptor_;
    uint64_t next_session_id_{1};
    std::atomic<uint64_t> accepted_{0};
    std::atomic<uint64_t> stored_{0};
    std::atomic<uint64_t> failed_{0};
};

// One TCP connection carrying one frame and at most one ack.
class ReceiveSession : public std::enable_shared_from_this<ReceiveSession> {
public:
    using tcp = asio::ip::tcp;
    ReceiveSession(PhotoReceiver& owner, tcp::socket sock, uint64_t id);
    void start();
    SessionState state() const { return state_; }

private:
    void read_length();
    void read_payload();
    void persist_and_ack();
    void finish(std::error_code ec);
    void arm_timer();
    void set_state(SessionState s);

    PhotoReceiver& owner_;
    tcp::socket sock_;
    asio::steady_timer timer_;
    uint64_t id_;
    std::string peer_;
    SessionState state_{SessionState::ACCEPTED};
    LengthField len_buf_{};
    uint32_t expected_{0};
    std::vector<uint8_t> read_buf_;
    std::vector<uint8_t> payload_;
    bool closed_{false};
};

} // namespace photolink
