#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace photolink {

struct CaptureOutcome {
    bool ok{false};
    std::vector<uint8_t> image;  // encoded still, as produced by the device
    std::string reason;          // set when !ok
};

// Hardware-style capture: completion is signalled once, possibly from another thread.
class CaptureSource {
public:
    using Callback = std::function<void(CaptureOutcome)>;
    virtual ~CaptureSource() = default;
    virtual void capture(Callback cb) = 0;
};

// Reads a still from disk in place of a camera.
class FileCaptureSource : public CaptureSource {
public:
    explicit FileCaptureSource(std::string path) : path_(std::move(path)) {}
    void capture(Callback cb) override;
private:
    std::string path_;
};

// Blocks until `source` reports. Later invocations of the callback are ignored.
CaptureOutcome await_capture(CaptureSource& source);

} // namespace photolink
