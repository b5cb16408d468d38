#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <system_error>
#include <vector>

namespace photolink {

struct StoredPhoto {
    std::string path;
    size_t size{0};
};

// <root>/YYYY-MM-DD/HHMMSS-mmm[-N].jpg, one file per accepted photo.
class PhotoStore {
public:
    using clock = std::chrono::system_clock;

    explicit PhotoStore(std::string root) : root_(std::move(root)) {}
    const std::string& root() const { return root_; }

    // Idempotent; safe to race with other sessions creating the same day.
    std::error_code ensure_day_directory(clock::time_point when, std::string& dir) const;

    std::error_code persist(const std::vector<uint8_t>& payload, StoredPhoto& out) const {
        return persist_at(payload, clock::now(), out);
    }
    std::error_code persist_at(const std::vector<uint8_t>& payload, clock::time_point when,
                               StoredPhoto& out) const;

    static std::string day_name(clock::time_point when);
    static std::string photo_stem(clock::time_point when);

private:
    std::string root_;
};

} // namespace photolink
