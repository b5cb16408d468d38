#pragma once
#include <asio.hpp>
#include <chrono>
#include <functional>
#include <string>
#include <system_error>
#include "image.hpp"

namespace photolink {

struct SenderConfig {
    std::string host;
    uint16_t port{kDefaultPort};
    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds io_timeout{30};
};

class StatusObserver {
public:
    virtual ~StatusObserver() = default;
    virtual void on_status(const std::string& text) = 0;
};

// One photo per call: connect, write length + payload, read the 2-byte ack, close.
// Not safe to call concurrently on the same instance.
class PhotoSender {
public:
    using tcp = asio::ip::tcp;
    explicit PhotoSender(const SenderConfig& cfg, StatusObserver* observer = nullptr);
    std::error_code send(const ImageBuffer& image);
    const SenderConfig& config() const { return cfg_; }

private:
    void status(const char* text);
    // Runs the pending async operation; calls `cancel` if the deadline passes first.
    void run_for(std::chrono::steady_clock::duration timeout,
                 const std::function<void()>& cancel);

    SenderConfig cfg_;
    StatusObserver* observer_;
    asio::io_context io_;
};

} // namespace photolink
