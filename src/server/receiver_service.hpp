#pragma once
#include <asio.hpp>
#include <memory>
#include <thread>
#include "photo_receiver.hpp"

namespace photolink {

// Owns the accept loop's io_context and the thread that runs it.
class ReceiverService {
public:
    ReceiverService(const ReceiverConfig& cfg, PhotoSink* sink);
    ~ReceiverService();
    ReceiverService(const ReceiverService&) = delete;
    ReceiverService& operator=(const ReceiverService&) = delete;

    // Binds on the calling thread so address errors surface here (std::system_error).
    void start();
    void stop();
    bool running() const { return thread_.joinable(); }
    uint16_t local_port() const { return port_; }
    ReceiverStats stats() const { return receiver_.stats(); }

private:
    asio::io_context io_;
    PhotoReceiver receiver_;
    std::thread thread_;
    uint16_t port_{0};
};

} // namespace photolink
