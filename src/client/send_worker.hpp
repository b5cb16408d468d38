#pragma once
#include <asio.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include "capture.hpp"
#include "image.hpp"
#include "photo_sender.hpp"

namespace photolink {

// Background executor for capture -> normalize -> send, one photo at a time.
class SendWorker {
public:
    using Completion = std::function<void(std::error_code)>;

    SendWorker(const SenderConfig& cfg, StatusObserver* observer,
               const NormalizeOptions& opts = NormalizeOptions());
    ~SendWorker();
    SendWorker(const SendWorker&) = delete;
    SendWorker& operator=(const SendWorker&) = delete;

    void start();
    // Lets an in-flight transfer finish, then joins the thread.
    void shutdown();

    // Returns busy while another transfer runs; `done` is not invoked in that case.
    std::error_code submit(std::shared_ptr<CaptureSource> source, Completion done);
    bool busy() const { return busy_.load(); }

    // The whole sequence on the calling thread.
    std::error_code run_once(CaptureSource& source);

private:
    void status(const std::string& text);

    SenderConfig cfg_;
    StatusObserver* observer_;
    NormalizeOptions opts_;
    asio::io_context io_;
    std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_;
    std::mutex thread_mtx_;  // guards start/shutdown of thread_
    std::thread thread_;
    std::atomic<bool> busy_{false};
};

} // namespace photolink
