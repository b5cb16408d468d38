#include "photo_store.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <filesystem>
#include <unistd.h>

namespace fs = std::filesystem;

namespace photolink {

namespace {

std::tm local_tm(PhotoStore::clock::time_point when) {
  std::time_t t = PhotoStore::clock::to_time_t(when);
  std::tm tm{};
  localtime_r(&t, &tm);
  return tm;
}

std::error_code last_errno() { return {errno, std::generic_category()}; }

std::error_code write_all(int fd, const uint8_t *data, size_t n) {
  size_t off = 0;
  while (off < n) {
    ssize_t w = ::write(fd, data + off, n - off);
    if (w < 0) {
      if (errno == EINTR)
        continue;
      return last_errno();
    }
    off += (size_t)w;
  }
  return {};
}

constexpr int kMaxNameAttempts = 1000;

} // namespace

std::string PhotoStore::day_name(clock::time_point when) {
  std::tm tm = local_tm(when);
  char buf[16];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
  return buf;
}

std::string PhotoStore::photo_stem(clock::time_point when) {
  std::tm tm = local_tm(when);
  char hms[16];
  std::strftime(hms, sizeof(hms), "%H%M%S", &tm);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                when.time_since_epoch()) %
            1000;
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%s-%03d", hms, (int)ms.count());
  return buf;
}

std::error_code PhotoStore::ensure_day_directory(clock::time_point when,
                                                 std::string &dir) const {
  fs::path p = fs::path(root_) / day_name(when);
  std::error_code ec;
  fs::create_directories(p, ec);
  if (ec && !fs::is_directory(p)) {
    Logger::instance().log(LogLevel::ERROR, "cannot create %s: %s",
                           p.c_str(), ec.message().c_str());
    return ec;
  }
  if (!fs::is_directory(p, ec))
    return ec ? ec : std::make_error_code(std::errc::not_a_directory);
  dir = p.string();
  return {};
}

std::error_code PhotoStore::persist_at(const std::vector<uint8_t> &payload,
                                       clock::time_point when,
                                       StoredPhoto &out) const {
  static std::atomic<uint64_t> tmp_seq{0};

  std::string dir;
  if (ensure_day_directory(when, dir))
    return TransferErrc::io_error;

  std::string stem = photo_stem(when);
  fs::path tmp = fs::path(dir) /
                 ("." + stem + "." + std::to_string(::getpid()) + "." +
                  std::to_string(tmp_seq.fetch_add(1)) + ".part");

  int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
  if (fd < 0) {
    Logger::instance().log(LogLevel::ERROR, "open %s: %s", tmp.c_str(),
                           std::strerror(errno));
    return TransferErrc::io_error;
  }
  std::error_code ec = write_all(fd, payload.data(), payload.size());
  if (!ec && ::fsync(fd) != 0)
    ec = last_errno();
  if (::close(fd) != 0 && !ec)
    ec = last_errno();
  if (ec) {
    Logger::instance().log(LogLevel::ERROR, "write %s: %s", tmp.c_str(),
                           ec.message().c_str());
    ::unlink(tmp.c_str());
    return TransferErrc::io_error;
  }

  // link() refuses to replace an existing name, so a taken name gets a suffix.
  fs::path final_path;
  bool linked = false;
  for (int n = 0; n < kMaxNameAttempts && !linked; n++) {
    std::string name = n == 0 ? stem + ".jpg"
                              : stem + "-" + std::to_string(n) + ".jpg";
    final_path = fs::path(dir) / name;
    if (::link(tmp.c_str(), final_path.c_str()) == 0) {
      linked = true;
    } else if (errno != EEXIST) {
      Logger::instance().log(LogLevel::ERROR, "link %s: %s",
                             final_path.c_str(), std::strerror(errno));
      break;
    }
  }
  ::unlink(tmp.c_str());
  if (!linked)
    return TransferErrc::io_error;

  out.path = final_path.string();
  out.size = payload.size();
  return {};
}

} // namespace photolink
