#include "capture.hpp"
#include "logging.hpp"
#include <atomic>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <future>
#include <iterator>

namespace photolink {

void FileCaptureSource::capture(Callback cb) {
  CaptureOutcome out;
  std::ifstream in(path_, std::ios::binary);
  if (!in) {
    out.reason = "cannot open " + path_ + ": " + std::strerror(errno);
    cb(std::move(out));
    return;
  }
  out.image.assign(std::istreambuf_iterator<char>(in),
                   std::istreambuf_iterator<char>());
  if (in.bad()) {
    out.image.clear();
    out.reason = "read failed: " + path_;
  } else if (out.image.empty()) {
    out.reason = "empty file: " + path_;
  } else {
    out.ok = true;
  }
  cb(std::move(out));
}

CaptureOutcome await_capture(CaptureSource &source) {
  auto promise = std::make_shared<std::promise<CaptureOutcome>>();
  auto fired = std::make_shared<std::atomic<bool>>(false);
  std::future<CaptureOutcome> result = promise->get_future();
  source.capture([promise, fired](CaptureOutcome o) {
    if (fired->exchange(true)) {
      Logger::instance().log(LogLevel::WARN,
                             "capture completed more than once, ignored");
      return;
    }
    promise->set_value(std::move(o));
  });
  try {
    return result.get();
  } catch (const std::future_error &) {
    CaptureOutcome o;
    o.reason = "capture abandoned";
    return o;
  }
}

} // namespace photolink
