#pragma once
#include <array>
#include <cstdint>
#include <cstddef>
#include <vector>

namespace photolink {

// Wire layout of one transfer session:
//   sender -> receiver : u32 big-endian length L, then L bytes of JPEG
//   receiver -> sender : 2-byte ack, only after the photo is on disk
constexpr size_t   kLengthFieldSize = 4;
constexpr size_t   kAckSize = 2;
constexpr std::array<uint8_t, kAckSize> kAck{{'O', 'K'}};

constexpr uint16_t kDefaultPort = 5001;
constexpr uint32_t kDefaultMaxPayload = 32u * 1024 * 1024;

constexpr int kMaxImageWidth = 1280;
constexpr int kJpegQuality = 80;
// Decoded source images above this pixel count are refused (about 150 MB of RGB).
constexpr uint64_t kMaxDecodedPixels = 50ull * 1000 * 1000;

using LengthField = std::array<uint8_t, kLengthFieldSize>;

LengthField encode_length(uint32_t len);
uint32_t decode_length(const LengthField& field);

// Length field followed by the payload, as written to the socket.
std::vector<uint8_t> encode_frame(const std::vector<uint8_t>& payload);

bool is_ack(const uint8_t* data, size_t n);

} // namespace photolink
