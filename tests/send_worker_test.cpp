#include <gtest/gtest.h>
#include <condition_variable>
#include <future>
#include <mutex>
#include <thread>
#include "errors.hpp"
#include "receiver_service.hpp"
#include "send_worker.hpp"
#include "test_support.hpp"

using namespace photolink;
using photolink::test::jpeg_of;
using photolink::test::read_file;
using photolink::test::TempDir;

namespace {

class RecordingObserver : public StatusObserver {
public:
  void on_status(const std::string &text) override {
    std::lock_guard<std::mutex> lk(mtx_);
    lines_.push_back(text);
  }
  std::vector<std::string> lines() {
    std::lock_guard<std::mutex> lk(mtx_);
    return lines_;
  }

private:
  std::mutex mtx_;
  std::vector<std::string> lines_;
};

class FixedCapture : public CaptureSource {
public:
  explicit FixedCapture(std::vector<uint8_t> image) : image_(std::move(image)) {}
  void capture(Callback cb) override {
    CaptureOutcome o;
    o.ok = true;
    o.image = image_;
    cb(std::move(o));
  }

private:
  std::vector<uint8_t> image_;
};

class FailingCapture : public CaptureSource {
public:
  void capture(Callback cb) override {
    CaptureOutcome o;
    o.reason = "shutter jammed";
    cb(std::move(o));
  }
};

// Completes from another thread, twice, once released.
class GatedCapture : public CaptureSource {
public:
  explicit GatedCapture(std::vector<uint8_t> image) : image_(std::move(image)) {}
  ~GatedCapture() override {
    if (thread_.joinable())
      thread_.join();
  }
  void capture(Callback cb) override {
    thread_ = std::thread([this, cb]() {
      std::unique_lock<std::mutex> lk(mtx_);
      cv_.wait(lk, [&] { return open_; });
      lk.unlock();
      CaptureOutcome o;
      o.ok = true;
      o.image = image_;
      cb(o);
      CaptureOutcome late;
      late.reason = "late duplicate";
      cb(late);
    });
  }
  void release() {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      open_ = true;
    }
    cv_.notify_all();
  }

private:
  std::vector<uint8_t> image_;
  std::thread thread_;
  std::mutex mtx_;
  std::condition_variable cv_;
  bool open_{false};
};

class DroppingCapture : public CaptureSource {
public:
  void capture(Callback) override {}
};

class NullSink : public PhotoSink {
public:
  void on_photo(const StoredPhoto &photo, const std::string &) override {
    std::lock_guard<std::mutex> lk(mtx_);
    last_ = photo;
  }
  StoredPhoto last() {
    std::lock_guard<std::mutex> lk(mtx_);
    return last_;
  }

private:
  std::mutex mtx_;
  StoredPhoto last_;
};

} // namespace

class SendWorkerTest : public ::testing::Test {
protected:
  void SetUp() override {
    ReceiverConfig cfg;
    cfg.listen_host = "127.0.0.1";
    cfg.listen_port = 0;
    cfg.data_dir = tmp_.path() + "/data";
    service_.reset(new ReceiverService(cfg, &sink_));
    service_->start();
    sender_.host = "127.0.0.1";
    sender_.port = service_->local_port();
    sender_.connect_timeout = std::chrono::seconds(5);
    sender_.io_timeout = std::chrono::seconds(5);
  }

  TempDir tmp_;
  NullSink sink_;
  std::unique_ptr<ReceiverService> service_;
  SenderConfig sender_;
  RecordingObserver status_;
};

TEST_F(SendWorkerTest, ReportsEveryCheckpointOnSuccess) {
  SendWorker worker(sender_, &status_);
  FixedCapture cam(jpeg_of(1600, 900));
  ASSERT_FALSE(worker.run_once(cam));
  EXPECT_EQ(status_.lines(),
            (std::vector<std::string>{"Capturing photo...",
                                      "Photo captured! Sending...",
                                      "Connecting to server...",
                                      "Sending photo...",
                                      "Photo sent successfully!"}));

  StoredPhoto stored = sink_.last();
  ASSERT_FALSE(stored.path.empty());
  Bitmap back;
  ASSERT_FALSE(decode_jpeg(read_file(stored.path), back));
  EXPECT_EQ(back.width, 1280);
  EXPECT_EQ(back.height, 720);
}

TEST_F(SendWorkerTest, CaptureFailureStopsBeforeConnecting) {
  SendWorker worker(sender_, &status_);
  FailingCapture cam;
  EXPECT_EQ(worker.run_once(cam), TransferErrc::capture_error);
  EXPECT_EQ(status_.lines(),
            (std::vector<std::string>{"Capturing photo...",
                                      "Error capturing photo"}));
  EXPECT_EQ(service_->stats().accepted, 0u);
}

TEST_F(SendWorkerTest, AbandonedCaptureIsCaptureError) {
  SendWorker worker(sender_, &status_);
  DroppingCapture cam;
  EXPECT_EQ(worker.run_once(cam), TransferErrc::capture_error);
}

TEST_F(SendWorkerTest, UndecodableImageIsDecodeError) {
  SendWorker worker(sender_, &status_);
  FixedCapture cam(std::vector<uint8_t>(300, 0x11));
  EXPECT_EQ(worker.run_once(cam), TransferErrc::decode_error);
  auto lines = status_.lines();
  ASSERT_FALSE(lines.empty());
  EXPECT_EQ(lines.back(), "Error sending photo: image could not be decoded");
  EXPECT_EQ(service_->stats().accepted, 0u);
}

TEST_F(SendWorkerTest, SecondSubmitWhileBusyIsRejected) {
  SendWorker worker(sender_, &status_);
  worker.start();
  auto gated = std::make_shared<GatedCapture>(jpeg_of(320, 240));
  std::promise<std::error_code> first;
  auto first_done = first.get_future();
  ASSERT_FALSE(worker.submit(gated, [&](std::error_code ec) { first.set_value(ec); }));
  EXPECT_TRUE(worker.busy());

  bool second_called = false;
  EXPECT_EQ(worker.submit(std::make_shared<FixedCapture>(jpeg_of(8, 8)),
                          [&](std::error_code) { second_called = true; }),
            TransferErrc::busy);

  gated->release();
  ASSERT_EQ(first_done.wait_for(std::chrono::seconds(10)),
            std::future_status::ready);
  EXPECT_FALSE(first_done.get());
  EXPECT_FALSE(second_called);

  // Retry is possible once the previous transfer has finished.
  std::promise<std::error_code> again;
  auto again_done = again.get_future();
  ASSERT_FALSE(worker.submit(std::make_shared<FixedCapture>(jpeg_of(8, 8)),
                             [&](std::error_code ec) { again.set_value(ec); }));
  ASSERT_EQ(again_done.wait_for(std::chrono::seconds(10)),
            std::future_status::ready);
  EXPECT_FALSE(again_done.get());
  worker.shutdown();
}

TEST_F(SendWorkerTest, FailureReenablesNextAttempt) {
  SenderConfig bad = sender_;
  bad.host.clear();
  SendWorker worker(bad, &status_);
  worker.start();
  std::promise<std::error_code> p;
  auto f = p.get_future();
  ASSERT_FALSE(worker.submit(std::make_shared<FixedCapture>(jpeg_of(8, 8)),
                             [&](std::error_code ec) { p.set_value(ec); }));
  EXPECT_EQ(f.get(), TransferErrc::invalid_destination);
  EXPECT_FALSE(worker.busy());
  EXPECT_EQ(status_.lines().back(),
            "Error sending photo: server address cannot be empty");
  worker.shutdown();
}

TEST_F(SendWorkerTest, RacingFirstSubmitsStartOneThread) {
  SendWorker worker(sender_, &status_);
  auto gated = std::make_shared<GatedCapture>(jpeg_of(64, 48));
  std::promise<std::error_code> done;
  auto done_f = done.get_future();
  std::error_code results[2];
  std::thread a([&] {
    results[0] = worker.submit(gated, [&](std::error_code ec) { done.set_value(ec); });
  });
  std::thread b([&] {
    results[1] = worker.submit(gated, [&](std::error_code ec) { done.set_value(ec); });
  });
  a.join();
  b.join();

  int accepted = 0, rejected = 0;
  for (auto &ec : results) {
    if (!ec)
      accepted++;
    else if (ec == TransferErrc::busy)
      rejected++;
  }
  EXPECT_EQ(accepted, 1);
  EXPECT_EQ(rejected, 1);

  gated->release();
  ASSERT_EQ(done_f.wait_for(std::chrono::seconds(10)),
            std::future_status::ready);
  EXPECT_FALSE(done_f.get());
  worker.shutdown();
}
